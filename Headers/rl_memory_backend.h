#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "rl_backend.h"

// Candidate pairs of one pass by sort-merge join of the two record sets on
// the pass' blocking keys. Records with an empty key value are left out, and
// a pair that also agrees on every column of a prior block is dropped.
// Result is ordered by (ordinalA, ordinalB).
std::vector<CandidatePair> blockInMemory(const RecordSet& a, const RecordSet& b, const PassPlan& plan,
                                         const std::vector<BlockingKeys>& priorBlocks);

// File-based backend: joins in process and keeps each pass' candidates as a
// CSV file in the working directory until they are discarded
class InMemoryBackend : public CandidateBackend {
public:
    InMemoryBackend(const MatchSides& sides, std::filesystem::path workDir);

    CandidateResult generateCandidates(const PassPlan& plan, const ExclusionState& exclusion) override;
    std::unique_ptr<CandidateStream> openCandidates(const PassPlan& plan) override;
    void discardCandidates(const PassPlan& plan) override;

private:
    std::filesystem::path candidatePath(const PassPlan& plan) const;

    MatchSides sides_;
    std::filesystem::path workDir_;
};
