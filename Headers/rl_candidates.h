#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rl_csv.h"

// Pair of records selected by one blocking pass for similarity scoring
struct CandidatePair {
    std::string idA;
    std::string idB;
    std::int64_t ordinalA;
    std::int64_t ordinalB;

    // Equality comparison operator
    bool operator==(const CandidatePair& other) const noexcept;
};

// Hash function specialization for CandidatePair to enable unordered_set usage
namespace std {
    template<> struct hash<CandidatePair> {
        size_t operator()(const CandidatePair& p) const;
    };
}

// Slice of one pass' candidates handed to a worker
struct CandidateChunk {
    std::string passName;
    std::vector<CandidatePair> pairs;
};

// Forward-only source of a materialized candidate set
class CandidateStream {
public:
    virtual ~CandidateStream() = default;

    // Up to maxPairs further pairs; empty once exhausted
    virtual std::vector<CandidatePair> nextChunk(std::size_t maxPairs) = 0;
};

// Candidate set persisted as CSV (indv_id_a, indv_id_b, idx_a, idx_b)
class CsvCandidateStream : public CandidateStream {
public:
    explicit CsvCandidateStream(const std::filesystem::path& path);

    std::vector<CandidatePair> nextChunk(std::size_t maxPairs) override;

private:
    std::filesystem::path path_;
    CsvReader reader_;
};

// Column names shared by candidate tables and candidate files
extern const std::vector<std::string> CANDIDATE_COLUMNS;

// Write a candidate set to a CSV file, throws if the file cannot be written
void writeCandidateFile(const std::filesystem::path& path, const std::vector<CandidatePair>& pairs);
