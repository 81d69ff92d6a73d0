#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "rl_constants.h"
#include "rl_records.h"

// Define an alias for ordered_json type from the nlohmann library
using ordered_json = nlohmann::ordered_json;

// Raised for malformed or incomplete match configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class MatchType {
    OneToOne,
    OneToMany,
    ManyToMany,
    Dedup
};

struct DatasetConfig {
    std::string name;
    std::filesystem::path filepath;
    FieldMap vars;
};

// One similarity comparer: the logical field it reads and its method
struct ComparerSpec {
    std::string name;
    std::string var;
    std::string method = "exact";
};

// Mean-score cut-offs of the strictness tiers
struct MatchThresholds {
    double strict = 1.0;
    double moderate = 0.9;
    double relaxed = 0.8;
    double review = 0.7;
};

struct PassConfig {
    std::string name;                       // key in blocks_by_pass
    int number = 0;                         // digits of the key, defines the order
    std::vector<std::string> blockingVars;  // logical names, inversion marker stripped
    bool inverted = false;
    std::size_t chunkSize = DEFAULT_CHUNK_SIZE;
    std::vector<std::string> comparers;
};

struct MatchConfig {
    MatchType matchType = MatchType::OneToOne;
    DatasetConfig datasetA;
    std::optional<DatasetConfig> datasetB;
    std::optional<std::string> databasePath;
    std::filesystem::path outputDir = ".";
    std::vector<std::string> groundTruthIds;
    std::vector<PassConfig> passes;         // ascending by number
    std::map<std::string, ComparerSpec> comparers;
    MatchThresholds thresholds;
    std::size_t workerCount = 1;
    std::size_t batchChunks = 0;            // 0 = twice the worker count
    int chunkRetries = 0;

    bool dedup() const { return matchType == MatchType::Dedup; }

    // Name used in candidate table and file names: "<a>_<b>" or "<a>_dedup"
    std::string matchName() const;

    // Chunks per dispatched batch
    std::size_t batchThreshold() const { return batchChunks ? batchChunks : 2 * workerCount; }

    // Configured comparer, or an exact comparer on the field of the same name
    ComparerSpec comparerFor(const std::string& name) const;

    // Every comparer name of every pass, first appearance order
    std::vector<std::string> comparerColumns() const;
};

// Parse a match type name ("dedup", "one-to-one", "1:M", ...)
MatchType parseMatchType(const std::string& value);

// Build the configuration from a parsed JSON document
MatchConfig parseConfig(const ordered_json& document);

// Read and parse a JSON configuration file
MatchConfig loadConfig(const std::filesystem::path& path);
