#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rl_candidates.h"
#include "rl_exclusion.h"
#include "rl_records.h"

// The two datasets of a run with their field maps. In dedup mode side B is
// side A.
struct MatchSides {
    const RecordSet& recordsA;
    const FieldMap& fieldsA;
    const RecordSet& recordsB;
    const FieldMap& fieldsB;
    bool dedup;

    static MatchSides linkage(const RecordSet& a, const FieldMap& fieldsA, const RecordSet& b, const FieldMap& fieldsB) {
        return MatchSides{ a, fieldsA, b, fieldsB, false };
    }

    static MatchSides deduplication(const RecordSet& a, const FieldMap& fieldsA) {
        return MatchSides{ a, fieldsA, a, fieldsA, true };
    }
};

// Blocking plan of one pass with every logical name resolved to a column
struct PassPlan {
    std::string name;          // pass name carried by its results
    std::string artifactName;  // candidate table / file stem
    BlockingKeys keys;
    std::string idColumnA;
    std::string idColumnB;
    bool dedup = false;
};

// Resolve a pass' logical blocking variables against both sides. Returns
// nothing when the variable list is empty or a variable is absent from a
// side, in which case the absent names are appended to missing.
std::optional<PassPlan> resolvePassPlan(const MatchSides& sides, const std::string& name,
                                        const std::string& artifactName,
                                        const std::vector<std::string>& logicalVars, bool inverted,
                                        std::vector<std::string>& missing);

// Full candidate condition of a pass: its join predicate, minus anything an
// earlier pass could produce, plus the dedup self/mirror exclusions
Predicate candidatePredicate(const PassPlan& plan, const ExclusionState& exclusion);

struct CandidateResult {
    std::int64_t rows = 0;
    ExclusionState exclusion;  // state to commit once the pass succeeded
};

// Source of candidate pairs for blocking passes. Implementations must yield
// the same pairs for the same data, plan and exclusion state.
class CandidateBackend {
public:
    virtual ~CandidateBackend() = default;

    // Materialize the pass' candidates; exclusion is read, never modified
    virtual CandidateResult generateCandidates(const PassPlan& plan, const ExclusionState& exclusion) = 0;

    // Open the materialized candidates; null if none exist for the pass
    virtual std::unique_ptr<CandidateStream> openCandidates(const PassPlan& plan) = 0;

    // Drop the materialized candidates of the pass
    virtual void discardCandidates(const PassPlan& plan) = 0;
};
