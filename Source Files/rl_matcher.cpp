#include <fmt/format.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include "rl_config.h"
#include "rl_constants.h"
#include "rl_logger.h"
#include "rl_match_run.h"
#include "rl_options.h"
#include "rl_records.h"

// Main function
int main(int argc, char* argv[]) {
    // Parse command line arguments
    ProgramOptions options = parseArguments(argc, argv);

    // Display program information
    if (!options.silentMode) {
        std::cout << PROGRAM_NAME << "\n" << PROGRAM_VERSION << "\n\n";
    }

    // Clear the previous run's log, then open it for this run
    logClear(LOG_FILE);
    std::ofstream logFile(LOG_FILE, std::ios::app);
    if (!logFile.is_open()) {
        logErrorAndExit("ERROR - failed to open log file!\n", logFile);
    }

    // Load the match configuration
    MatchConfig config;
    try {
        config = loadConfig(options.configFile);
    }
    catch (const ConfigError& e) {
        logErrorAndExit("ERROR - invalid configuration: " + std::string(e.what()) + "\n", logFile);
    }

    // Command line values override the configuration
    if (options.outputDir) config.outputDir = *options.outputDir;
    if (options.workers) config.workerCount = *options.workers;

    const auto programStart = std::chrono::steady_clock::now();

    try {
        // Load preprocessed data
        std::optional<RecordSet> recordsB;
        if (config.dedup()) {
            logMessage("Loading preprocessed data for deduplication: " + config.datasetA.name + "...", logFile);
        }
        else {
            logMessage("Loading preprocessed data...\n(A) " + config.datasetA.name + "\n(B) " + config.datasetB->name, logFile);
        }

        RecordSet recordsA = loadRecordSet(config.datasetA.filepath, config.datasetA.name);
        if (!config.dedup()) {
            recordsB = loadRecordSet(config.datasetB->filepath, config.datasetB->name);
        }

        if (!options.silentMode) {
            logMessage(fmt::format("Loaded {} records from {}", recordsA.size(), config.datasetA.filepath.string()), logFile);
            if (recordsB) {
                logMessage(fmt::format("Loaded {} records from {}", recordsB->size(), config.datasetB->filepath.string()), logFile);
            }
        }

        const MatchSummary summary = runMatch(config, recordsA, recordsB ? &*recordsB : nullptr, logFile, options.silentMode);

        if (!options.silentMode) {
            logMessage(fmt::format("\nAll passes completed: {} shard(s) written to {}",
                                   summary.shardsWritten, config.outputDir.string()), logFile);
        }
    }
    catch (const std::exception& e) {
        // Shards already written stay in place and remain loadable
        logErrorAndExit("ERROR - match aborted: " + std::string(e.what()) + "\n", logFile);
    }

    // Time total
    const auto seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - programStart).count();
    if (!options.silentMode) {
        logMessage(fmt::format("\nTotal processing time: {:.3f} seconds", seconds), logFile);
    }

    logFile.close();
    return EXIT_SUCCESS;
}
