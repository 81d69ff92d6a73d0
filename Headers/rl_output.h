#pragma once
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include "rl_comparers.h"
#include "rl_config.h"

// Priority weight of every pass. Ground truth outranks the first numbered
// pass, which outranks the second, and so on.
struct PassWeights {
    double groundTruth = 0.0;
    std::map<std::string, double> byPass;

    // Weight of a numbered pass, throws std::out_of_range for unknown names
    double weightFor(const std::string& passName) const;
};

// Ground truth 10^(K+1), the r-th of K numbered passes 10^(K+1-r)
PassWeights computePassWeights(const std::vector<PassConfig>& passes);

struct TierCounts {
    std::size_t evaluated = 0;
    std::size_t strict = 0;
    std::size_t moderate = 0;
    std::size_t relaxed = 0;
    std::size_t review = 0;

    TierCounts& operator+=(const TierCounts& other);
};

// Running per-pass tally of evaluated pairs and matches per strictness tier
class PassCounts {
public:
    void tally(const std::vector<MatchResult>& results);

    TierCounts forPass(const std::string& passName) const;
    TierCounts total() const;

private:
    std::map<std::string, TierCounts> counts_;
};

// Print the counts of each listed pass, then of the whole run
void reportCounts(const PassCounts& counts, const std::vector<std::string>& passNames, std::ofstream& logFile);

// Stable leading columns of every shard
extern const std::vector<std::string> OUTPUT_COLUMNS;

// Turns settled batches into weighted, ranked shards in the output directory
class OutputAssembler {
public:
    OutputAssembler(std::filesystem::path outputDir, std::vector<std::string> comparerColumns, PassWeights weights);

    // Tally, weight, sort and persist one batch as temp_match_<i>.csv
    std::filesystem::path writeBatch(std::vector<MatchResult> results);

    // Persist the ground-truth pairs (weights already set) as temp_match_gid.csv
    std::filesystem::path writeGroundTruth(std::vector<MatchResult> results);

    const PassCounts& counts() const { return counts_; }
    const PassWeights& weights() const { return weights_; }
    std::size_t shardsWritten() const { return shardsWritten_; }

    // Stable columns followed by every comparer column
    std::vector<std::string> columns() const;

private:
    std::filesystem::path writeShard(const std::filesystem::path& path, std::vector<MatchResult>& results);

    std::filesystem::path outputDir_;
    std::vector<std::string> comparerColumns_;
    PassWeights weights_;
    PassCounts counts_;
    std::size_t nextShard_ = 0;
    std::size_t shardsWritten_ = 0;
};
