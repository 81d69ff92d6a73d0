#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "rl_constants.h"
#include "rl_csv.h"
#include "rl_logger.h"
#include "rl_output.h"

const std::vector<std::string> OUTPUT_COLUMNS = {
    "indv_id_a", "indv_id_b", "idx_a", "idx_b", "pass_name",
    "match_strict", "match_moderate", "match_relaxed", "match_review", "weight"
};

double PassWeights::weightFor(const std::string& passName) const {
    auto it = byPass.find(passName);
    if (it == byPass.end()) {
        throw std::out_of_range("No weight for pass " + passName);
    }
    return it->second;
}

PassWeights computePassWeights(const std::vector<PassConfig>& passes) {
    const int passCount = static_cast<int>(passes.size());

    PassWeights weights;
    weights.groundTruth = std::pow(10.0, passCount + 1);
    for (int rank = 1; rank <= passCount; ++rank) {
        weights.byPass[passes[rank - 1].name] = std::pow(10.0, passCount + 1 - rank);
    }
    return weights;
}

TierCounts& TierCounts::operator+=(const TierCounts& other) {
    evaluated += other.evaluated;
    strict += other.strict;
    moderate += other.moderate;
    relaxed += other.relaxed;
    review += other.review;
    return *this;
}

void PassCounts::tally(const std::vector<MatchResult>& results) {
    for (const auto& result : results) {
        auto& counts = counts_[result.passName];
        ++counts.evaluated;
        if (result.strict) ++counts.strict;
        if (result.moderate) ++counts.moderate;
        if (result.relaxed) ++counts.relaxed;
        if (result.review) ++counts.review;
    }
}

TierCounts PassCounts::forPass(const std::string& passName) const {
    auto it = counts_.find(passName);
    return it != counts_.end() ? it->second : TierCounts{};
}

TierCounts PassCounts::total() const {
    TierCounts sum;
    for (const auto& [name, counts] : counts_) {
        sum += counts;
    }
    return sum;
}

namespace {

    std::string describe(const TierCounts& counts) {
        return fmt::format("{:>12} evaluated | strict {:>10} | moderate {:>10} | relaxed {:>10} | review {:>10}",
                           counts.evaluated, counts.strict, counts.moderate, counts.relaxed, counts.review);
    }

    std::string flag(bool value) {
        return value ? "True" : "False";
    }

}

// Function to print match counts per pass and for the entire match
void reportCounts(const PassCounts& counts, const std::vector<std::string>& passNames, std::ofstream& logFile) {
    logMessage("\nMatch counts by pass:", logFile);
    for (const auto& name : passNames) {
        logMessage(fmt::format("  {:<16} {}", name, describe(counts.forPass(name))), logFile);
    }
    logMessage(fmt::format("  {:<16} {}", "total", describe(counts.total())), logFile);
}

OutputAssembler::OutputAssembler(std::filesystem::path outputDir, std::vector<std::string> comparerColumns, PassWeights weights)
    : outputDir_(std::move(outputDir)), comparerColumns_(std::move(comparerColumns)), weights_(std::move(weights)) {}

std::vector<std::string> OutputAssembler::columns() const {
    std::vector<std::string> columns = OUTPUT_COLUMNS;
    for (const auto& name : comparerColumns_) {
        if (std::find(columns.begin(), columns.end(), name) == columns.end()) {
            columns.push_back(name);
        }
    }
    return columns;
}

std::filesystem::path OutputAssembler::writeBatch(std::vector<MatchResult> results) {
    counts_.tally(results);
    for (auto& result : results) {
        result.weight = weights_.weightFor(result.passName);
    }

    const auto path = outputDir_ / (std::string(BATCH_SHARD_PREFIX) + std::to_string(nextShard_++) + ".csv");
    return writeShard(path, results);
}

std::filesystem::path OutputAssembler::writeGroundTruth(std::vector<MatchResult> results) {
    counts_.tally(results);
    return writeShard(outputDir_ / GROUND_TRUTH_SHARD, results);
}

std::filesystem::path OutputAssembler::writeShard(const std::filesystem::path& path, std::vector<MatchResult>& results) {
    std::stable_sort(results.begin(), results.end(), [](const MatchResult& l, const MatchResult& r) {
        return l.weight > r.weight;
    });

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to create output shard: " + path.string());
    }

    const auto header = columns();
    writeCsvRow(out, header);

    std::vector<std::string> row;
    for (const auto& result : results) {
        row = {
            result.pair.idA, result.pair.idB,
            std::to_string(result.pair.ordinalA), std::to_string(result.pair.ordinalB),
            result.passName,
            flag(result.strict), flag(result.moderate), flag(result.relaxed), flag(result.review),
            fmt::format("{}", result.weight)
        };
        for (std::size_t column = OUTPUT_COLUMNS.size(); column < header.size(); ++column) {
            auto score = std::find_if(result.scores.begin(), result.scores.end(),
                                      [&](const auto& entry) { return entry.first == header[column]; });
            row.push_back(score != result.scores.end() ? fmt::format("{}", score->second) : std::string());
        }
        writeCsvRow(out, row);
    }

    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write output shard: " + path.string());
    }
    ++shardsWritten_;
    return path;
}
