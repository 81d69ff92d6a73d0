#include <memory>
#include <optional>
#include <stdexcept>

#include "database.h"
#include "rl_comparers.h"
#include "rl_dispatcher.h"
#include "rl_logger.h"
#include "rl_match_run.h"
#include "rl_memory_backend.h"
#include "rl_sql_backend.h"
#include "rl_worker_pool.h"

MatchSummary runMatch(const MatchConfig& config, const RecordSet& recordsA, const RecordSet* recordsB,
                      std::ofstream& logFile, bool silent) {
    if (!config.dedup() && (!recordsB || !config.datasetB)) {
        throw std::invalid_argument("Linkage match requires a second dataset");
    }

    std::filesystem::create_directories(config.outputDir);

    const MatchSides sides = config.dedup()
        ? MatchSides::deduplication(recordsA, config.datasetA.vars)
        : MatchSides::linkage(recordsA, config.datasetA.vars, *recordsB, config.datasetB->vars);

    FieldComparer comparer(config, sides);
    OutputAssembler output(config.outputDir, config.comparerColumns(), computePassWeights(config.passes));

    WorkerPool pool(config.workerCount);
    MatchDispatcher dispatcher(pool, comparer, sides.recordsA, sides.recordsB,
                               config.batchThreshold(), config.chunkRetries,
                               [&](std::vector<MatchResult>&& results) {
                                   const auto count = results.size();
                                   const auto path = output.writeBatch(std::move(results));
                                   if (!silent) {
                                       logMessage("Saved " + std::to_string(count) + " scored pairs to " + path.string(), logFile);
                                   }
                               });

    // The connection stays on this thread; workers only see materialized chunks
    std::optional<Database> db;
    std::unique_ptr<CandidateBackend> backend;
    if (config.databasePath) {
        db.emplace(*config.databasePath);
        auto sqlBackend = std::make_unique<SqliteBackend>(*db, sides);
        sqlBackend->stageRecords();
        if (!silent) {
            logMessage("Database opened successfully, records staged in " + sqlBackend->tableA() +
                       (sides.dedup ? std::string() : " and " + sqlBackend->tableB()), logFile);
        }
        backend = std::move(sqlBackend);
    }
    else {
        backend = std::make_unique<InMemoryBackend>(sides, config.outputDir);
        if (!silent) {
            logMessage("No database configured - blocking in memory...", logFile);
        }
    }

    PassOrchestrator orchestrator(config, sides, *backend, dispatcher, output, logFile, silent);

    MatchSummary summary;
    summary.outcomes = orchestrator.run();
    summary.counts = output.counts();
    summary.shardsWritten = output.shardsWritten();
    summary.batchesSubmitted = dispatcher.batchesSubmitted();

    reportCounts(summary.counts, orchestrator.passNames(), logFile);
    return summary;
}
