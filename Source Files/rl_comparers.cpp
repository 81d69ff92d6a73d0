#include <algorithm>
#include <stdexcept>

#include "rl_comparers.h"

double jaroWinklerSimilarity(std::string_view s1, std::string_view s2) {
    if (s1.empty() || s2.empty()) return 0.0;
    if (s1 == s2) return 1.0;

    const std::size_t len1 = s1.size();
    const std::size_t len2 = s2.size();
    const std::size_t window = std::max(len1, len2) / 2 > 0 ? std::max(len1, len2) / 2 - 1 : 0;

    std::vector<bool> matched1(len1, false);
    std::vector<bool> matched2(len2, false);

    std::size_t matches = 0;
    for (std::size_t i = 0; i < len1; ++i) {
        const std::size_t start = i > window ? i - window : 0;
        const std::size_t end = std::min(i + window + 1, len2);
        for (std::size_t j = start; j < end; ++j) {
            if (matched2[j] || s1[i] != s2[j]) continue;
            matched1[i] = true;
            matched2[j] = true;
            ++matches;
            break;
        }
    }
    if (matches == 0) return 0.0;

    // Half the number of matched characters that are out of order
    std::size_t transpositions = 0;
    std::size_t k = 0;
    for (std::size_t i = 0; i < len1; ++i) {
        if (!matched1[i]) continue;
        while (!matched2[k]) ++k;
        if (s1[i] != s2[k]) ++transpositions;
        ++k;
    }

    const double m = static_cast<double>(matches);
    const double jaro = (m / len1 + m / len2 + (m - transpositions / 2.0) / m) / 3.0;

    std::size_t prefix = 0;
    const std::size_t maxPrefix = std::min<std::size_t>({ 4, len1, len2 });
    while (prefix < maxPrefix && s1[prefix] == s2[prefix]) ++prefix;

    return jaro + prefix * 0.1 * (1.0 - jaro);
}

double exactSimilarity(std::string_view s1, std::string_view s2) {
    return !s1.empty() && s1 == s2 ? 1.0 : 0.0;
}

FieldComparer::FieldComparer(const MatchConfig& config, const MatchSides& sides) : thresholds_(config.thresholds) {
    for (const auto& pass : config.passes) {
        auto& resolved = comparersByPass_[pass.name];
        for (const auto& name : pass.comparers) {
            const ComparerSpec spec = config.comparerFor(name);
            auto columnA = resolveField(sides.fieldsA, sides.recordsA, spec.var);
            auto columnB = resolveField(sides.fieldsB, sides.recordsB, spec.var);
            // Passes with an unresolved comparer are skipped before scoring
            if (!columnA || !columnB) continue;

            resolved.push_back(ResolvedComparer{ spec.name,
                                                 *sides.recordsA.columnIndex(*columnA),
                                                 *sides.recordsB.columnIndex(*columnB),
                                                 spec.method == "jarowinkler" });
        }
    }
}

std::vector<MatchResult> FieldComparer::compare(const CandidateChunk& chunk, const RecordSet& a, const RecordSet& b) const {
    static const std::vector<ResolvedComparer> none;
    auto it = comparersByPass_.find(chunk.passName);
    const auto& comparers = it != comparersByPass_.end() ? it->second : none;

    std::vector<MatchResult> results;
    results.reserve(chunk.pairs.size());

    for (const auto& pair : chunk.pairs) {
        if (pair.ordinalA < 0 || static_cast<std::size_t>(pair.ordinalA) >= a.size() ||
            pair.ordinalB < 0 || static_cast<std::size_t>(pair.ordinalB) >= b.size()) {
            throw std::out_of_range("Candidate pair references a record outside the datasets");
        }

        MatchResult result;
        result.pair = pair;
        result.passName = chunk.passName;

        double total = 0.0;
        for (const auto& comparer : comparers) {
            const std::string& valueA = a.value(static_cast<std::size_t>(pair.ordinalA), comparer.columnA);
            const std::string& valueB = b.value(static_cast<std::size_t>(pair.ordinalB), comparer.columnB);
            const double score = comparer.jaroWinkler ? jaroWinklerSimilarity(valueA, valueB)
                                                      : exactSimilarity(valueA, valueB);
            result.scores.emplace_back(comparer.name, score);
            total += score;
        }

        if (!comparers.empty()) {
            const double mean = total / static_cast<double>(comparers.size());
            result.strict = mean >= thresholds_.strict;
            result.moderate = mean >= thresholds_.moderate;
            result.relaxed = mean >= thresholds_.relaxed;
            result.review = mean >= thresholds_.review;
        }
        results.push_back(std::move(result));
    }
    return results;
}
