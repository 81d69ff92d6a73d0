#pragma once
#include <cstddef>
#include <fstream>
#include <vector>

#include "rl_config.h"
#include "rl_orchestrator.h"
#include "rl_output.h"
#include "rl_records.h"

struct MatchSummary {
    std::vector<PassOutcome> outcomes;
    PassCounts counts;
    std::size_t shardsWritten = 0;
    std::size_t batchesSubmitted = 0;
};

// Run every pass of the configuration over loaded record sets: picks the
// relational backend when a database is configured, the in-memory one
// otherwise, and writes the shards to the output directory. recordsB is
// ignored in dedup mode.
MatchSummary runMatch(const MatchConfig& config, const RecordSet& recordsA, const RecordSet* recordsB,
                      std::ofstream& logFile, bool silent);
