#include <fmt/format.h>
#include <chrono>

#include "rl_constants.h"
#include "rl_logger.h"
#include "rl_orchestrator.h"

namespace {

    std::string joinNames(const std::vector<std::string>& names) {
        std::string joined;
        for (const auto& name : names) {
            if (!joined.empty()) joined += ", ";
            joined += name;
        }
        return joined;
    }

}

const char* toString(PassState state) {
    switch (state) {
    case PassState::Pending: return "pending";
    case PassState::Generating: return "generating";
    case PassState::Streaming: return "streaming";
    case PassState::Exhausted: return "exhausted";
    case PassState::Skipped: return "skipped";
    }
    return "unknown";
}

PassOrchestrator::PassOrchestrator(const MatchConfig& config, const MatchSides& sides, CandidateBackend& backend,
                                   MatchDispatcher& dispatcher, OutputAssembler& output,
                                   std::ofstream& logFile, bool silent)
    : config_(config), sides_(sides), backend_(backend), dispatcher_(dispatcher), output_(output),
      logFile_(logFile), silent_(silent) {}

std::vector<std::string> PassOrchestrator::passNames() const {
    std::vector<std::string> names;
    for (const auto& gid : config_.groundTruthIds) {
        names.push_back("dup_" + gid);
    }
    for (const auto& pass : config_.passes) {
        names.push_back(pass.name);
    }
    return names;
}

// Function to resolve a pass, reporting every variable missing from a side
std::optional<PassPlan> PassOrchestrator::planPass(const std::string& name, const std::string& artifactName,
                                                   const std::vector<std::string>& blockingVars, bool inverted,
                                                   const std::vector<std::string>& comparers) {
    std::vector<std::string> missing;
    auto plan = resolvePassPlan(sides_, name, artifactName, blockingVars, inverted, missing);

    for (const auto& comparerName : comparers) {
        const ComparerSpec spec = config_.comparerFor(comparerName);
        if (!resolveField(sides_.fieldsA, sides_.recordsA, spec.var) ||
            !resolveField(sides_.fieldsB, sides_.recordsB, spec.var)) {
            missing.push_back(spec.var);
        }
    }

    if (!missing.empty()) {
        logMessage("\tPass " + name + " is being skipped since {" + joinNames(missing) + "} is not included.", logFile_);
        return std::nullopt;
    }
    return plan;
}

// Function to materialize a pass' candidates and commit the exclusion state
void PassOrchestrator::generate(PassOutcome& outcome, const PassPlan& plan) {
    outcome.state = PassState::Generating;
    const auto start = std::chrono::steady_clock::now();

    CandidateResult result = backend_.generateCandidates(plan, exclusion_);
    exclusion_ = std::move(result.exclusion);
    outcome.rows = result.rows;

    if (!silent_) {
        const auto seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        logMessage("***Table: " + plan.artifactName, logFile_);
        logMessage(fmt::format("***Rows inserted: {}", result.rows), logFile_);
        logMessage(fmt::format("***Time: {:.3f} seconds", seconds), logFile_);
    }
}

std::vector<PassOutcome> PassOrchestrator::runGroundTruthPasses() {
    std::vector<PassOutcome> outcomes;
    if (config_.groundTruthIds.empty()) return outcomes;

    if (!silent_) {
        logMessage("Finding pairs sharing ground truth IDs...", logFile_);
    }

    std::vector<MatchResult> matches;
    for (const auto& gid : config_.groundTruthIds) {
        PassOutcome outcome;
        outcome.name = "dup_" + gid;
        if (!silent_) {
            logMessage("- " + gid, logFile_);
        }

        outcome.state = PassState::Generating;
        auto plan = planPass(outcome.name, "candidates_" + config_.matchName() + "_matching_" + gid, { gid }, false, {});
        if (!plan) {
            outcome.state = PassState::Skipped;
            outcomes.push_back(outcome);
            continue;
        }

        generate(outcome, *plan);

        auto stream = backend_.openCandidates(*plan);
        if (!stream) {
            logMessage("No candidate table for pass " + outcome.name + ", skipping", logFile_);
            outcome.state = PassState::Skipped;
            outcomes.push_back(outcome);
            continue;
        }

        outcome.state = PassState::Streaming;
        for (auto chunk = stream->nextChunk(DEFAULT_CHUNK_SIZE); !chunk.empty(); chunk = stream->nextChunk(DEFAULT_CHUNK_SIZE)) {
            ++outcome.chunks;
            for (auto& pair : chunk) {
                MatchResult match;
                match.pair = std::move(pair);
                match.passName = outcome.name;
                match.strict = match.moderate = match.relaxed = match.review = true;
                match.weight = output_.weights().groundTruth;
                matches.push_back(std::move(match));
            }
        }
        stream.reset();
        backend_.discardCandidates(*plan);

        outcome.state = PassState::Exhausted;
        outcomes.push_back(outcome);
    }

    output_.writeGroundTruth(std::move(matches));
    return outcomes;
}

std::vector<PassOutcome> PassOrchestrator::runNumberedPasses() {
    std::vector<PassOutcome> outcomes;

    if (!silent_) {
        logMessage("Starting matching...", logFile_);
    }

    for (const auto& pass : config_.passes) {
        PassOutcome outcome;
        outcome.name = pass.name;

        if (pass.blockingVars.empty()) {
            logMessage("Pass " + pass.name + " - Skipped according to config_match", logFile_);
            outcome.state = PassState::Skipped;
            outcomes.push_back(outcome);
            continue;
        }

        outcome.state = PassState::Generating;
        if (!silent_) {
            logMessage("Pass " + pass.name + " - Blocking on: " + joinNames(pass.blockingVars) +
                       (pass.inverted ? " (inverted)" : ""), logFile_);
        }

        auto plan = planPass(pass.name, "candidates_" + config_.matchName() + "_p" + pass.name,
                             pass.blockingVars, pass.inverted, pass.comparers);
        if (!plan) {
            outcome.state = PassState::Skipped;
            outcomes.push_back(outcome);
            continue;
        }

        generate(outcome, *plan);

        auto stream = backend_.openCandidates(*plan);
        if (!stream) {
            logMessage("No candidate table for pass " + pass.name + ", skipping", logFile_);
            outcome.state = PassState::Skipped;
            outcomes.push_back(outcome);
            continue;
        }

        // Chunks follow stream order; the dispatcher bounds how many are held
        outcome.state = PassState::Streaming;
        for (auto chunk = stream->nextChunk(pass.chunkSize); !chunk.empty(); chunk = stream->nextChunk(pass.chunkSize)) {
            ++outcome.chunks;
            dispatcher_.addChunk(CandidateChunk{ pass.name, std::move(chunk) });
        }
        stream.reset();
        backend_.discardCandidates(*plan);

        outcome.state = PassState::Exhausted;
        outcomes.push_back(outcome);
    }

    dispatcher_.flush();
    return outcomes;
}

std::vector<PassOutcome> PassOrchestrator::run() {
    auto outcomes = runGroundTruthPasses();
    auto numbered = runNumberedPasses();
    outcomes.insert(outcomes.end(), numbered.begin(), numbered.end());

    if (!silent_) {
        logMessage("\nPass summary:", logFile_);
        for (const auto& outcome : outcomes) {
            logMessage(fmt::format("  {:<16} {:<10} {} pairs in {} chunk(s)",
                                   outcome.name, toString(outcome.state), outcome.rows, outcome.chunks), logFile_);
        }
    }
    return outcomes;
}
