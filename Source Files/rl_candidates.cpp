#include <fstream>
#include <stdexcept>

#include "rl_candidates.h"

const std::vector<std::string> CANDIDATE_COLUMNS = { "indv_id_a", "indv_id_b", "idx_a", "idx_b" };

// Two candidates are the same pair when both identifiers and ordinals agree
bool CandidatePair::operator==(const CandidatePair& other) const noexcept {
    return ordinalA == other.ordinalA && ordinalB == other.ordinalB &&
           idA == other.idA && idB == other.idB;
}

size_t std::hash<CandidatePair>::operator()(const CandidatePair& p) const {
    size_t h1 = hash<std::int64_t>{}(p.ordinalA);
    size_t h2 = hash<std::int64_t>{}(p.ordinalB);
    size_t h3 = hash<std::string>{}(p.idA);
    size_t h4 = hash<std::string>{}(p.idB);
    size_t h = h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
    h ^= h3 + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h ^ (h4 + 0x9e3779b9 + (h << 6) + (h >> 2));
}

CsvCandidateStream::CsvCandidateStream(const std::filesystem::path& path) : path_(path), reader_(path) {
    if (!reader_.is_open()) {
        throw std::runtime_error("Failed to open candidate file: " + path.string());
    }

    std::vector<std::string> header;
    if (!reader_.readRow(header) || header != CANDIDATE_COLUMNS) {
        throw std::runtime_error("Unexpected header in candidate file: " + path.string());
    }
}

std::vector<CandidatePair> CsvCandidateStream::nextChunk(std::size_t maxPairs) {
    std::vector<CandidatePair> chunk;
    std::vector<std::string> fields;

    while (chunk.size() < maxPairs && reader_.readRow(fields)) {
        if (fields.size() != CANDIDATE_COLUMNS.size()) {
            throw std::runtime_error("Malformed row in candidate file: " + path_.string());
        }
        chunk.push_back(CandidatePair{ fields[0], fields[1], std::stoll(fields[2]), std::stoll(fields[3]) });
    }
    return chunk;
}

// Function to persist a candidate set for chunked reading
void writeCandidateFile(const std::filesystem::path& path, const std::vector<CandidatePair>& pairs) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to create candidate file: " + path.string());
    }

    writeCsvRow(out, CANDIDATE_COLUMNS);
    for (const auto& pair : pairs) {
        writeCsvRow(out, { pair.idA, pair.idB, std::to_string(pair.ordinalA), std::to_string(pair.ordinalB) });
    }

    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write candidate file: " + path.string());
    }
}
