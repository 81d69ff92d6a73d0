#include "rl_predicate.h"
#include "rl_sql_backend.h"

// Function to copy a record set into a fresh table
void stageRecordSet(const Database& db, const std::string& table, const RecordSet& records) {
    // The ordinal column is generated, a source column of the same name is not staged
    std::vector<std::size_t> staged;
    std::string columns = quoteIdentifier(ORDINAL_COLUMN) + " INTEGER PRIMARY KEY";
    std::string placeholders = "?";
    for (std::size_t i = 0; i < records.columns().size(); ++i) {
        if (records.columns()[i] == ORDINAL_COLUMN) continue;
        staged.push_back(i);
        columns += ", " + quoteIdentifier(records.columns()[i]) + " TEXT NOT NULL";
        placeholders += ", ?";
    }

    Transaction transaction(db);
    db.execute("DROP TABLE IF EXISTS " + quoteIdentifier(table) + ";");
    db.execute("CREATE TABLE " + quoteIdentifier(table) + " (" + columns + ");");

    Statement insert(db, "INSERT INTO " + quoteIdentifier(table) + " VALUES (" + placeholders + ");");
    for (std::size_t ordinal = 0; ordinal < records.size(); ++ordinal) {
        insert.bindInt64(1, static_cast<std::int64_t>(ordinal));
        for (std::size_t i = 0; i < staged.size(); ++i) {
            insert.bindText(static_cast<int>(i + 2), records.value(ordinal, staged[i]));
        }
        insert.step();
        insert.reset();
    }
    transaction.commit();
}

std::string buildCandidateQuery(const PassPlan& plan, const ExclusionState& exclusion,
                                const std::string& tableA, const std::string& tableB) {
    const Predicate condition = candidatePredicate(plan, exclusion);

    return "CREATE TABLE " + quoteIdentifier(plan.artifactName) + " AS SELECT "
        "a." + quoteIdentifier(plan.idColumnA) + " AS indv_id_a, "
        "b." + quoteIdentifier(plan.idColumnB) + " AS indv_id_b, "
        "a." + quoteIdentifier(ORDINAL_COLUMN) + " AS idx_a, "
        "b." + quoteIdentifier(ORDINAL_COLUMN) + " AS idx_b "
        "FROM " + quoteIdentifier(tableA) + " AS a "
        "INNER JOIN " + quoteIdentifier(tableB) + " AS b "
        "ON " + condition.toSql("a", "b") + " "
        "ORDER BY idx_a, idx_b;";
}

SqliteCandidateStream::SqliteCandidateStream(const Database& db, const std::string& table)
    : stmt_(db, "SELECT indv_id_a, indv_id_b, idx_a, idx_b FROM " + quoteIdentifier(table) + " ORDER BY idx_a, idx_b;") {}

std::vector<CandidatePair> SqliteCandidateStream::nextChunk(std::size_t maxPairs) {
    std::vector<CandidatePair> chunk;
    while (!done_ && chunk.size() < maxPairs) {
        if (!stmt_.step()) {
            done_ = true;
            break;
        }
        chunk.push_back(CandidatePair{ stmt_.columnText(0), stmt_.columnText(1),
                                       stmt_.columnInt64(2), stmt_.columnInt64(3) });
    }
    return chunk;
}

SqliteBackend::SqliteBackend(const Database& db, const MatchSides& sides)
    : db_(db), sides_(sides),
      tableA_("records_a_" + sides.recordsA.name()),
      tableB_(sides.dedup ? tableA_ : "records_b_" + sides.recordsB.name()) {}

void SqliteBackend::stageRecords() {
    stageRecordSet(db_, tableA_, sides_.recordsA);
    if (!sides_.dedup) {
        stageRecordSet(db_, tableB_, sides_.recordsB);
    }
}

CandidateResult SqliteBackend::generateCandidates(const PassPlan& plan, const ExclusionState& exclusion) {
    db_.execute("DROP TABLE IF EXISTS " + quoteIdentifier(plan.artifactName) + ";");
    db_.execute(buildCandidateQuery(plan, exclusion, tableA_, tableB_));

    CandidateResult result;
    result.rows = db_.countRows(plan.artifactName);
    result.exclusion = exclusion.commit(plan.keys);
    return result;
}

std::unique_ptr<CandidateStream> SqliteBackend::openCandidates(const PassPlan& plan) {
    if (!db_.tableExists(plan.artifactName)) return nullptr;
    return std::make_unique<SqliteCandidateStream>(db_, plan.artifactName);
}

void SqliteBackend::discardCandidates(const PassPlan& plan) {
    db_.execute("DROP TABLE IF EXISTS " + quoteIdentifier(plan.artifactName) + ";");
}
