#include <algorithm>
#include <stdexcept>

#include "rl_memory_backend.h"

namespace {

    std::vector<std::size_t> columnIndices(const RecordSet& records, const std::vector<std::string>& columns) {
        std::vector<std::size_t> indices;
        indices.reserve(columns.size());
        for (const auto& column : columns) {
            auto index = records.columnIndex(column);
            if (!index) {
                throw std::out_of_range("Blocking column '" + column + "' not found in dataset " + records.name());
            }
            indices.push_back(*index);
        }
        return indices;
    }

    // Ordinals of the records whose key values are all non-empty, sorted by key
    std::vector<std::size_t> sortedKeyedRecords(const RecordSet& records, const std::vector<std::size_t>& key) {
        std::vector<std::size_t> ordinals;
        ordinals.reserve(records.size());
        for (std::size_t ordinal = 0; ordinal < records.size(); ++ordinal) {
            const bool blank = std::any_of(key.begin(), key.end(), [&](std::size_t column) {
                return records.value(ordinal, column).empty();
            });
            if (!blank) ordinals.push_back(ordinal);
        }

        std::stable_sort(ordinals.begin(), ordinals.end(), [&](std::size_t l, std::size_t r) {
            for (std::size_t column : key) {
                const int cmp = records.value(l, column).compare(records.value(r, column));
                if (cmp != 0) return cmp < 0;
            }
            return false;
        });
        return ordinals;
    }

    int compareKeys(const RecordSet& a, std::size_t ordinalA, const std::vector<std::size_t>& keyA,
                    const RecordSet& b, std::size_t ordinalB, const std::vector<std::size_t>& keyB) {
        for (std::size_t i = 0; i < keyA.size(); ++i) {
            const int cmp = a.value(ordinalA, keyA[i]).compare(b.value(ordinalB, keyB[i]));
            if (cmp != 0) return cmp;
        }
        return 0;
    }

    struct ResolvedBlock {
        std::vector<std::size_t> columnsA;
        std::vector<std::size_t> columnsB;
    };

    // Same rule as a guarded equality: every column equal and non-empty
    bool agreesOn(const RecordSet& a, std::size_t ordinalA, const RecordSet& b, std::size_t ordinalB,
                  const ResolvedBlock& block) {
        for (std::size_t i = 0; i < block.columnsA.size(); ++i) {
            const std::string& valueA = a.value(ordinalA, block.columnsA[i]);
            if (valueA.empty() || valueA != b.value(ordinalB, block.columnsB[i])) return false;
        }
        return true;
    }

}

std::vector<CandidatePair> blockInMemory(const RecordSet& a, const RecordSet& b, const PassPlan& plan,
                                         const std::vector<BlockingKeys>& priorBlocks) {
    std::vector<CandidatePair> pairs;
    if (plan.keys.empty()) return pairs;

    const auto keyA = columnIndices(a, plan.keys.columnsA);
    const auto keyB = columnIndices(b, plan.keys.columnsB);
    const auto idA = columnIndices(a, { plan.idColumnA }).front();
    const auto idB = columnIndices(b, { plan.idColumnB }).front();

    // Prior columns are resolved per side, so equal names on both sides never collide
    std::vector<ResolvedBlock> prior;
    prior.reserve(priorBlocks.size());
    for (const auto& block : priorBlocks) {
        prior.push_back(ResolvedBlock{ columnIndices(a, block.columnsA), columnIndices(b, block.columnsB) });
    }

    const auto left = sortedKeyedRecords(a, keyA);
    const auto right = sortedKeyedRecords(b, keyB);

    std::size_t i = 0, j = 0;
    while (i < left.size() && j < right.size()) {
        const int cmp = compareKeys(a, left[i], keyA, b, right[j], keyB);
        if (cmp < 0) {
            ++i;
            continue;
        }
        if (cmp > 0) {
            ++j;
            continue;
        }

        // Equal-key ranges on both sides
        std::size_t iEnd = i + 1;
        while (iEnd < left.size() && compareKeys(a, left[iEnd], keyA, a, left[i], keyA) == 0) ++iEnd;
        std::size_t jEnd = j + 1;
        while (jEnd < right.size() && compareKeys(b, right[jEnd], keyB, b, right[j], keyB) == 0) ++jEnd;

        for (std::size_t l = i; l < iEnd; ++l) {
            for (std::size_t r = j; r < jEnd; ++r) {
                const std::size_t ordinalA = left[l];
                const std::size_t ordinalB = right[r];

                if (plan.dedup && (ordinalA >= ordinalB || a.value(ordinalA, idA) == b.value(ordinalB, idB))) {
                    continue;
                }

                const bool seen = std::any_of(prior.begin(), prior.end(), [&](const ResolvedBlock& block) {
                    return agreesOn(a, ordinalA, b, ordinalB, block);
                });
                if (seen) continue;

                pairs.push_back(CandidatePair{ a.value(ordinalA, idA), b.value(ordinalB, idB),
                                               static_cast<std::int64_t>(ordinalA),
                                               static_cast<std::int64_t>(ordinalB) });
            }
        }

        i = iEnd;
        j = jEnd;
    }

    std::sort(pairs.begin(), pairs.end(), [](const CandidatePair& l, const CandidatePair& r) {
        return l.ordinalA != r.ordinalA ? l.ordinalA < r.ordinalA : l.ordinalB < r.ordinalB;
    });
    return pairs;
}

InMemoryBackend::InMemoryBackend(const MatchSides& sides, std::filesystem::path workDir)
    : sides_(sides), workDir_(std::move(workDir)) {}

CandidateResult InMemoryBackend::generateCandidates(const PassPlan& plan, const ExclusionState& exclusion) {
    const auto pairs = blockInMemory(sides_.recordsA, sides_.recordsB, plan, exclusion.priorBlocks());
    writeCandidateFile(candidatePath(plan), pairs);

    CandidateResult result;
    result.rows = static_cast<std::int64_t>(pairs.size());
    result.exclusion = exclusion.commit(plan.keys);
    return result;
}

std::unique_ptr<CandidateStream> InMemoryBackend::openCandidates(const PassPlan& plan) {
    const auto path = candidatePath(plan);
    if (!std::filesystem::exists(path)) return nullptr;
    return std::make_unique<CsvCandidateStream>(path);
}

void InMemoryBackend::discardCandidates(const PassPlan& plan) {
    std::error_code ec;
    std::filesystem::remove(candidatePath(plan), ec);
    if (ec) {
        throw std::runtime_error("Failed to remove candidate file " + candidatePath(plan).string() + ": " + ec.message());
    }
}

std::filesystem::path InMemoryBackend::candidatePath(const PassPlan& plan) const {
    return workDir_ / (plan.artifactName + ".csv");
}
