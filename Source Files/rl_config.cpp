#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <set>

#include "rl_config.h"

namespace {

    const ordered_json& require(const ordered_json& node, const std::string& key, const std::string& where) {
        if (!node.is_object() || !node.contains(key)) {
            throw ConfigError("missing '" + key + "' in " + where);
        }
        return node.at(key);
    }

    DatasetConfig parseDataset(const ordered_json& node, const std::string& where) {
        DatasetConfig dataset;
        dataset.name = require(node, "name", where).get<std::string>();
        dataset.filepath = require(node, "filepath", where).get<std::string>();

        const auto& vars = require(node, "vars", where);
        if (!vars.is_object()) {
            throw ConfigError("'vars' of " + where + " must be an object");
        }
        for (const auto& [logical, column] : vars.items()) {
            dataset.vars.emplace(logical, column.get<std::string>());
        }
        if (!dataset.vars.count(IDENTIFIER_FIELD)) {
            throw ConfigError(std::string("'vars' of ") + where + " must map '" + IDENTIFIER_FIELD + "'");
        }
        return dataset;
    }

    // Pass keys may carry a prefix ("p3"); their digits give the order
    int passNumber(const std::string& key) {
        std::string digits;
        std::copy_if(key.begin(), key.end(), std::back_inserter(digits),
                     [](unsigned char c) { return std::isdigit(c); });
        if (digits.empty()) {
            throw ConfigError("pass key '" + key + "' contains no pass number");
        }
        return std::stoi(digits);
    }

    bool endsWith(const std::string& value, const std::string& suffix) {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::vector<PassConfig> parsePasses(const ordered_json& document) {
        const auto& blocks = require(document, "blocks_by_pass", "configuration");
        if (!blocks.is_object()) {
            throw ConfigError("'blocks_by_pass' must be an object");
        }

        ordered_json chunkSizes = ordered_json::object();
        ordered_json comparers = document.value("comp_names_by_pass", ordered_json::object());
        std::size_t defaultChunkSize = DEFAULT_CHUNK_SIZE;
        if (document.contains("parallelization_metrics")) {
            const auto& metrics = document["parallelization_metrics"];
            chunkSizes = metrics.value("chunk_sizes", ordered_json::object());
            defaultChunkSize = metrics.value("default_chunk_size", DEFAULT_CHUNK_SIZE);
        }

        std::vector<PassConfig> passes;
        std::set<int> seen;
        for (const auto& [key, vars] : blocks.items()) {
            PassConfig pass;
            pass.name = key;
            pass.chunkSize = defaultChunkSize;
            pass.number = passNumber(key);
            if (!seen.insert(pass.number).second) {
                throw ConfigError("pass number " + std::to_string(pass.number) + " is configured twice");
            }

            for (const auto& var : vars) {
                std::string name = var.get<std::string>();
                if (endsWith(name, INVERTED_MARKER)) {
                    pass.inverted = true;
                    name.resize(name.size() - std::string(INVERTED_MARKER).size());
                }
                pass.blockingVars.push_back(std::move(name));
            }

            const std::string numberKey = std::to_string(pass.number);
            if (chunkSizes.contains(key)) {
                pass.chunkSize = chunkSizes[key].get<std::size_t>();
            }
            else if (chunkSizes.contains(numberKey)) {
                pass.chunkSize = chunkSizes[numberKey].get<std::size_t>();
            }
            if (pass.chunkSize == 0) {
                throw ConfigError("chunk size of pass " + key + " must be positive");
            }

            if (comparers.contains(key)) {
                pass.comparers = comparers[key].get<std::vector<std::string>>();
            }
            else if (comparers.contains(numberKey)) {
                pass.comparers = comparers[numberKey].get<std::vector<std::string>>();
            }

            passes.push_back(std::move(pass));
        }

        std::sort(passes.begin(), passes.end(),
                  [](const PassConfig& l, const PassConfig& r) { return l.number < r.number; });
        return passes;
    }

}

std::string MatchConfig::matchName() const {
    if (dedup() || !datasetB) return datasetA.name + "_dedup";
    return datasetA.name + "_" + datasetB->name;
}

ComparerSpec MatchConfig::comparerFor(const std::string& name) const {
    auto it = comparers.find(name);
    if (it != comparers.end()) return it->second;
    return ComparerSpec{ name, name, "exact" };
}

std::vector<std::string> MatchConfig::comparerColumns() const {
    std::vector<std::string> columns;
    for (const auto& pass : passes) {
        for (const auto& name : pass.comparers) {
            if (std::find(columns.begin(), columns.end(), name) == columns.end()) {
                columns.push_back(name);
            }
        }
    }
    return columns;
}

MatchType parseMatchType(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "dedup") return MatchType::Dedup;
    if (lower == "one-to-one" || lower == "1:1") return MatchType::OneToOne;
    if (lower == "one-to-many" || lower == "1:m") return MatchType::OneToMany;
    if (lower == "many-to-many" || lower == "m:m") return MatchType::ManyToMany;
    throw ConfigError("unknown match type '" + value + "'");
}

MatchConfig parseConfig(const ordered_json& document) {
    try {
        MatchConfig config;
        config.matchType = parseMatchType(require(document, "matchtype", "configuration").get<std::string>());

        const auto& dataParam = require(document, "data_param", "configuration");
        config.datasetA = parseDataset(require(dataParam, "df_a", "data_param"), "df_a");
        if (!config.dedup()) {
            config.datasetB = parseDataset(require(dataParam, "df_b", "data_param"), "df_b");
        }

        if (document.contains("database_information") && !document["database_information"].is_null()) {
            const auto& db = document["database_information"];
            if (db.is_string()) {
                config.databasePath = db.get<std::string>();
            }
            else if (!db.empty()) {
                config.databasePath = require(db, "path", "database_information").get<std::string>();
            }
        }

        config.outputDir = document.value("output_dir", std::string("."));
        config.groundTruthIds = document.value("ground_truth_ids", std::vector<std::string>{});
        config.passes = parsePasses(document);

        if (document.contains("comparers")) {
            for (const auto& [name, spec] : document["comparers"].items()) {
                ComparerSpec comparer;
                comparer.name = name;
                comparer.var = spec.value("var", name);
                comparer.method = spec.value("method", std::string("exact"));
                if (comparer.method != "exact" && comparer.method != "jarowinkler") {
                    throw ConfigError("unknown method '" + comparer.method + "' of comparer " + name);
                }
                config.comparers.emplace(name, std::move(comparer));
            }
        }

        if (document.contains("match_thresholds")) {
            const auto& t = document["match_thresholds"];
            config.thresholds.strict = t.value("strict", config.thresholds.strict);
            config.thresholds.moderate = t.value("moderate", config.thresholds.moderate);
            config.thresholds.relaxed = t.value("relaxed", config.thresholds.relaxed);
            config.thresholds.review = t.value("review", config.thresholds.review);
        }

        if (document.contains("parallelization_metrics")) {
            const auto& metrics = document["parallelization_metrics"];
            const int workers = metrics.value("num_processes", 1);
            if (workers <= 0) {
                throw ConfigError("'num_processes' must be positive");
            }
            config.workerCount = static_cast<std::size_t>(workers);
            config.batchChunks = metrics.value("batch_chunks", std::size_t{ 0 });
            config.chunkRetries = metrics.value("chunk_retries", 0);
            if (config.chunkRetries < 0) {
                throw ConfigError("'chunk_retries' must not be negative");
            }
        }

        return config;
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
}

MatchConfig loadConfig(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw ConfigError("failed to open configuration file: " + path.string());
    }

    ordered_json document;
    try {
        input >> document;
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError("failed to parse configuration (" + path.string() + "): " + e.what());
    }
    return parseConfig(document);
}
