#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "rl_backend.h"
#include "rl_config.h"
#include "rl_dispatcher.h"
#include "rl_exclusion.h"
#include "rl_output.h"

// Lifecycle of one pass:
// Pending -> Generating -> Streaming -> Exhausted, or Skipped when the pass
// has no usable blocking variables or no candidate set to stream.
enum class PassState {
    Pending,
    Generating,
    Streaming,
    Exhausted,
    Skipped
};

const char* toString(PassState state);

struct PassOutcome {
    std::string name;
    PassState state = PassState::Pending;
    std::int64_t rows = 0;
    std::size_t chunks = 0;
};

// Runs the ground-truth passes, then the numbered passes in ascending order,
// committing the exclusion state after each pass' candidates are generated
class PassOrchestrator {
public:
    PassOrchestrator(const MatchConfig& config, const MatchSides& sides, CandidateBackend& backend,
                     MatchDispatcher& dispatcher, OutputAssembler& output,
                     std::ofstream& logFile, bool silent);

    // Pairs sharing a ground-truth identifier, written unscored to the ground-truth shard
    std::vector<PassOutcome> runGroundTruthPasses();

    // Numbered passes; candidates go to the dispatcher, which is flushed at the end
    std::vector<PassOutcome> runNumberedPasses();

    // Both of the above
    std::vector<PassOutcome> run();

    const ExclusionState& exclusion() const { return exclusion_; }

    // Ground-truth pass names followed by the numbered pass names
    std::vector<std::string> passNames() const;

private:
    std::optional<PassPlan> planPass(const std::string& name, const std::string& artifactName,
                                     const std::vector<std::string>& blockingVars, bool inverted,
                                     const std::vector<std::string>& comparers);
    void generate(PassOutcome& outcome, const PassPlan& plan);

    const MatchConfig& config_;
    MatchSides sides_;
    CandidateBackend& backend_;
    MatchDispatcher& dispatcher_;
    OutputAssembler& output_;
    std::ofstream& logFile_;
    bool silent_;
    ExclusionState exclusion_;
};
