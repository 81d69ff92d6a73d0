#pragma once
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rl_backend.h"
#include "rl_candidates.h"
#include "rl_config.h"

// Scored candidate pair
struct MatchResult {
    CandidatePair pair;
    std::string passName;
    std::vector<std::pair<std::string, double>> scores;  // comparer name -> similarity
    bool strict = false;
    bool moderate = false;
    bool relaxed = false;
    bool review = false;
    double weight = 0.0;
};

// Scores candidate chunks. Called concurrently from worker threads, so
// implementations must not mutate shared state.
class PairComparer {
public:
    virtual ~PairComparer() = default;

    // One result per pair of the chunk, tagged with the chunk's pass name
    virtual std::vector<MatchResult> compare(const CandidateChunk& chunk, const RecordSet& a, const RecordSet& b) const = 0;
};

// Jaro-Winkler similarity in [0, 1]; 0 when either value is blank
double jaroWinklerSimilarity(std::string_view s1, std::string_view s2);

// 1 for equal non-blank values, 0 otherwise
double exactSimilarity(std::string_view s1, std::string_view s2);

// Per-pass field comparers of the configuration. The strictness flags are
// set when the mean similarity of the pass' comparers reaches the tier's
// threshold; a pass without comparers never matches.
class FieldComparer : public PairComparer {
public:
    FieldComparer(const MatchConfig& config, const MatchSides& sides);

    std::vector<MatchResult> compare(const CandidateChunk& chunk, const RecordSet& a, const RecordSet& b) const override;

private:
    struct ResolvedComparer {
        std::string name;
        std::size_t columnA;
        std::size_t columnB;
        bool jaroWinkler;
    };

    std::map<std::string, std::vector<ResolvedComparer>> comparersByPass_;
    MatchThresholds thresholds_;
};
