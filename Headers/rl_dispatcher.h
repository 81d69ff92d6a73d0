#pragma once
#include <cstddef>
#include <functional>
#include <vector>

#include "rl_candidates.h"
#include "rl_comparers.h"
#include "rl_worker_pool.h"

// Accumulates candidate chunks and scores them on the worker pool one batch
// at a time. A batch is submitted once it holds batchThreshold chunks and is
// fully settled before the next chunk is accepted.
class MatchDispatcher {
public:
    using BatchHandler = std::function<void(std::vector<MatchResult>&&)>;

    MatchDispatcher(WorkerPool& pool, const PairComparer& comparer, const RecordSet& recordsA,
                    const RecordSet& recordsB, std::size_t batchThreshold, int chunkRetries,
                    BatchHandler onBatch);

    // Queue a chunk; runs the batch when the threshold is reached
    void addChunk(CandidateChunk chunk);

    // Run the trailing partial batch, if any
    void flush();

    std::size_t pendingChunks() const { return pending_.size(); }
    std::size_t batchesSubmitted() const { return batchesSubmitted_; }

private:
    void runBatch();
    std::vector<MatchResult> scoreChunk(const CandidateChunk& chunk) const;

    WorkerPool& pool_;
    const PairComparer& comparer_;
    const RecordSet& recordsA_;
    const RecordSet& recordsB_;
    std::size_t batchThreshold_;
    int chunkRetries_;
    BatchHandler onBatch_;
    std::vector<CandidateChunk> pending_;
    std::size_t batchesSubmitted_ = 0;
};
