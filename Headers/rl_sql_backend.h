#pragma once
#include <memory>
#include <string>

#include "database.h"
#include "rl_backend.h"

// Stage a record set as table (idx INTEGER PRIMARY KEY, <columns> TEXT)
void stageRecordSet(const Database& db, const std::string& table, const RecordSet& records);

// CREATE TABLE ... AS SELECT statement materializing one pass' candidates
std::string buildCandidateQuery(const PassPlan& plan, const ExclusionState& exclusion,
                                const std::string& tableA, const std::string& tableB);

// Candidates read back from a materialized table with a prepared statement
class SqliteCandidateStream : public CandidateStream {
public:
    SqliteCandidateStream(const Database& db, const std::string& table);

    std::vector<CandidatePair> nextChunk(std::size_t maxPairs) override;

private:
    Statement stmt_;
    bool done_ = false;
};

// Relational backend: joins inside SQLite on the coordinator's connection.
// Candidate tables are pass-scoped and dropped once streamed.
class SqliteBackend : public CandidateBackend {
public:
    SqliteBackend(const Database& db, const MatchSides& sides);

    // Copy the record sets into records_a_<name> and records_b_<name>; one table in dedup mode
    void stageRecords();

    CandidateResult generateCandidates(const PassPlan& plan, const ExclusionState& exclusion) override;
    std::unique_ptr<CandidateStream> openCandidates(const PassPlan& plan) override;
    void discardCandidates(const PassPlan& plan) override;

    const std::string& tableA() const { return tableA_; }
    const std::string& tableB() const { return tableB_; }

private:
    const Database& db_;
    MatchSides sides_;
    std::string tableA_;
    std::string tableB_;
};
