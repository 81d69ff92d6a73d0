#include <exception>
#include <future>
#include <stdexcept>

#include "rl_dispatcher.h"

MatchDispatcher::MatchDispatcher(WorkerPool& pool, const PairComparer& comparer, const RecordSet& recordsA,
                                 const RecordSet& recordsB, std::size_t batchThreshold, int chunkRetries,
                                 BatchHandler onBatch)
    : pool_(pool), comparer_(comparer), recordsA_(recordsA), recordsB_(recordsB),
      batchThreshold_(batchThreshold == 0 ? 1 : batchThreshold), chunkRetries_(chunkRetries),
      onBatch_(std::move(onBatch)) {}

void MatchDispatcher::addChunk(CandidateChunk chunk) {
    if (chunk.pairs.empty()) return;

    pending_.push_back(std::move(chunk));
    if (pending_.size() >= batchThreshold_) {
        runBatch();
    }
}

void MatchDispatcher::flush() {
    if (!pending_.empty()) {
        runBatch();
    }
}

std::vector<MatchResult> MatchDispatcher::scoreChunk(const CandidateChunk& chunk) const {
    for (int attempt = 0;; ++attempt) {
        try {
            return comparer_.compare(chunk, recordsA_, recordsB_);
        }
        catch (const std::exception&) {
            if (attempt >= chunkRetries_) throw;
        }
    }
}

void MatchDispatcher::runBatch() {
    std::vector<std::future<std::vector<MatchResult>>> futures;
    futures.reserve(pending_.size());
    for (const auto& chunk : pending_) {
        futures.push_back(pool_.submit([this, &chunk] { return scoreChunk(chunk); }));
    }
    ++batchesSubmitted_;

    // Wait for every task so none still reads pending_ when it is cleared
    std::vector<MatchResult> results;
    std::exception_ptr failure;
    for (auto& future : futures) {
        try {
            auto chunkResults = future.get();
            if (!failure) {
                results.insert(results.end(), std::make_move_iterator(chunkResults.begin()),
                               std::make_move_iterator(chunkResults.end()));
            }
        }
        catch (const std::future_error&) {
            // Task cancelled after an earlier failure
            if (!failure) failure = std::current_exception();
        }
        catch (...) {
            // First scoring failure is rethrown once the batch settled
            if (!failure) {
                failure = std::current_exception();
                pool_.cancelPending();
            }
        }
    }

    pending_.clear();
    if (failure) {
        std::rethrow_exception(failure);
    }

    onBatch_(std::move(results));
}
