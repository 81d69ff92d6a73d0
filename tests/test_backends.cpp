#include <gtest/gtest.h>
#include <memory>
#include <set>

#include "rl_memory_backend.h"
#include "rl_sql_backend.h"
#include "test_helpers.hpp"

using test_utils::make_records;
using test_utils::ordinal_pairs;

namespace {

    RecordSet people_a() {
        return make_records("people_a", { "id", "first", "last", "ssn", "dob" }, {
            { "a0", "ann", "lee", "111", "1990" },
            { "a1", "lee", "ann", "", "1990" },
            { "a2", "bob", "ray", "222", "1985" },
            { "a3", "bob", "ray", "", "" },
            { "a4", "cat", "", "333", "1970" },
        });
    }

    RecordSet people_b() {
        return make_records("people_b", { "pid", "fname", "lname", "social", "birth" }, {
            { "b0", "ann", "lee", "111", "1990" },
            { "b1", "ann", "lee", "999", "1990" },
            { "b2", "ray", "bob", "222", "1985" },
            { "b3", "bob", "ray", "", "1985" },
            { "b4", "cat", "", "", "1970" },
        });
    }

    const FieldMap FIELDS_A = { { "indv_id", "id" }, { "first_name", "first" }, { "last_name", "last" },
                                { "ssn", "ssn" }, { "dob", "dob" } };
    const FieldMap FIELDS_B = { { "indv_id", "pid" }, { "first_name", "fname" }, { "last_name", "lname" },
                                { "ssn", "social" }, { "dob", "birth" } };

    struct PassSpec {
        std::string name;
        std::vector<std::string> vars;
        bool inverted;
    };

    const std::vector<PassSpec> PASSES = {
        { "1", { "ssn" }, false },
        { "2", { "first_name", "last_name" }, false },
        { "3", { "first_name", "last_name" }, true },
        { "4", { "dob" }, false },
    };

    PassPlan plan_for(const MatchSides& sides, const PassSpec& pass) {
        std::vector<std::string> missing;
        auto plan = resolvePassPlan(sides, pass.name, "candidates_people_p" + pass.name, pass.vars,
                                    pass.inverted, missing);
        EXPECT_TRUE(missing.empty());
        return *plan;
    }

    std::vector<CandidatePair> drain(CandidateBackend& backend, const PassPlan& plan) {
        std::vector<CandidatePair> pairs;
        auto stream = backend.openCandidates(plan);
        if (!stream) return pairs;
        for (auto chunk = stream->nextChunk(2); !chunk.empty(); chunk = stream->nextChunk(2)) {
            pairs.insert(pairs.end(), chunk.begin(), chunk.end());
        }
        return pairs;
    }

    // Pairs of every pass, exclusion state threaded from one pass to the next
    std::vector<std::vector<CandidatePair>> run_passes(CandidateBackend& backend, const MatchSides& sides,
                                                       ExclusionState* finalState = nullptr) {
        std::vector<std::vector<CandidatePair>> result;
        ExclusionState exclusion;
        for (const auto& pass : PASSES) {
            const auto plan = plan_for(sides, pass);
            const auto generated = backend.generateCandidates(plan, exclusion);
            EXPECT_EQ(generated.exclusion.version(), exclusion.version() + 1);
            exclusion = generated.exclusion;

            auto pairs = drain(backend, plan);
            EXPECT_EQ(static_cast<std::int64_t>(pairs.size()), generated.rows);
            backend.discardCandidates(plan);
            result.push_back(std::move(pairs));
        }
        if (finalState) *finalState = exclusion;
        return result;
    }

    class MemoryBackendFactory {
    public:
        std::unique_ptr<CandidateBackend> make(const MatchSides& sides) {
            return std::make_unique<InMemoryBackend>(sides, dir_.path());
        }

    private:
        test_utils::TempDir dir_;
    };

    class SqliteBackendFactory {
    public:
        std::unique_ptr<CandidateBackend> make(const MatchSides& sides) {
            auto backend = std::make_unique<SqliteBackend>(db_, sides);
            backend->stageRecords();
            return backend;
        }

    private:
        Database db_{ ":memory:" };
    };

}

template <typename Factory>
class CandidateBackendTest : public ::testing::Test {
protected:
    RecordSet a_ = people_a();
    RecordSet b_ = people_b();
    Factory factory_;
};

using BackendFactories = ::testing::Types<MemoryBackendFactory, SqliteBackendFactory>;
TYPED_TEST_SUITE(CandidateBackendTest, BackendFactories);

TYPED_TEST(CandidateBackendTest, MissingArtifactOpensAsNull) {
    const auto sides = MatchSides::linkage(this->a_, FIELDS_A, this->b_, FIELDS_B);
    auto backend = this->factory_.make(sides);

    EXPECT_EQ(backend->openCandidates(plan_for(sides, PASSES[0])), nullptr);
}

TYPED_TEST(CandidateBackendTest, DiscardRemovesArtifact) {
    const auto sides = MatchSides::linkage(this->a_, FIELDS_A, this->b_, FIELDS_B);
    auto backend = this->factory_.make(sides);
    const auto plan = plan_for(sides, PASSES[0]);

    backend->generateCandidates(plan, ExclusionState());
    EXPECT_NE(backend->openCandidates(plan), nullptr);

    backend->discardCandidates(plan);
    EXPECT_EQ(backend->openCandidates(plan), nullptr);
}

TYPED_TEST(CandidateBackendTest, ExclusionInputIsNotModified) {
    const auto sides = MatchSides::linkage(this->a_, FIELDS_A, this->b_, FIELDS_B);
    auto backend = this->factory_.make(sides);

    const ExclusionState before = ExclusionState().commit(BlockingKeys{ { "ssn" }, { "social" } });
    const auto result = backend->generateCandidates(plan_for(sides, PASSES[3]), before);

    EXPECT_EQ(before.version(), 1u);
    EXPECT_EQ(before.priorBlocks().size(), 1u);
    EXPECT_EQ(result.exclusion.priorBlocks().size(), 2u);
}

TYPED_TEST(CandidateBackendTest, LinkagePassesAreDisjoint) {
    const auto sides = MatchSides::linkage(this->a_, FIELDS_A, this->b_, FIELDS_B);
    auto backend = this->factory_.make(sides);

    const auto passes = run_passes(*backend, sides);

    EXPECT_EQ(ordinal_pairs(passes[0]), (std::vector<std::pair<std::int64_t, std::int64_t>>{ { 0, 0 }, { 2, 2 } }));
    EXPECT_EQ(ordinal_pairs(passes[1]), (std::vector<std::pair<std::int64_t, std::int64_t>>{ { 0, 1 }, { 2, 3 }, { 3, 3 } }));
    EXPECT_EQ(ordinal_pairs(passes[2]), (std::vector<std::pair<std::int64_t, std::int64_t>>{ { 1, 0 }, { 1, 1 }, { 3, 2 } }));
    EXPECT_EQ(ordinal_pairs(passes[3]), (std::vector<std::pair<std::int64_t, std::int64_t>>{ { 4, 4 } }));

    std::set<std::pair<std::int64_t, std::int64_t>> seen;
    for (const auto& pass : passes) {
        for (const auto& p : pass) {
            EXPECT_TRUE(seen.emplace(p.ordinalA, p.ordinalB).second)
                << "pair (" << p.ordinalA << ", " << p.ordinalB << ") offered twice";
        }
    }
}

TYPED_TEST(CandidateBackendTest, EveryPairSatisfiesItsCandidatePredicate) {
    const auto sides = MatchSides::linkage(this->a_, FIELDS_A, this->b_, FIELDS_B);
    auto backend = this->factory_.make(sides);

    ExclusionState exclusion;
    for (const auto& pass : PASSES) {
        const auto plan = plan_for(sides, pass);
        const auto condition = candidatePredicate(plan, exclusion);
        exclusion = backend->generateCandidates(plan, exclusion).exclusion;

        for (const auto& p : drain(*backend, plan)) {
            EXPECT_TRUE(condition.evaluate(this->a_, p.ordinalA, this->b_, p.ordinalB));
            EXPECT_EQ(p.idA, this->a_.value(p.ordinalA, 0));
            EXPECT_EQ(p.idB, this->b_.value(p.ordinalB, 0));
        }
        backend->discardCandidates(plan);
    }
}

TYPED_TEST(CandidateBackendTest, DedupNeverPairsARecordWithItselfOrItsMirror) {
    const auto records = make_records("people", { "id", "first", "last", "ssn", "dob" }, {
        { "p0", "ann", "lee", "111", "1990" },
        { "p1", "ann", "lee", "111", "1990" },
        { "p0", "ann", "lee", "111", "1990" },
        { "p3", "lee", "ann", "", "1990" },
    });
    const auto sides = MatchSides::deduplication(records, FIELDS_A);
    auto backend = this->factory_.make(sides);

    const auto passes = run_passes(*backend, sides);

    std::set<std::pair<std::int64_t, std::int64_t>> seen;
    for (const auto& pass : passes) {
        for (const auto& p : pass) {
            EXPECT_LT(p.ordinalA, p.ordinalB);
            EXPECT_NE(p.idA, p.idB);
            EXPECT_TRUE(seen.emplace(p.ordinalA, p.ordinalB).second);
        }
    }
    EXPECT_EQ(ordinal_pairs(passes[0]), (std::vector<std::pair<std::int64_t, std::int64_t>>{ { 0, 1 }, { 1, 2 } }));
    EXPECT_TRUE(passes[1].empty());
    EXPECT_EQ(ordinal_pairs(passes[2]), (std::vector<std::pair<std::int64_t, std::int64_t>>{ { 0, 3 }, { 1, 3 }, { 2, 3 } }));
    EXPECT_TRUE(passes[3].empty());
}

TYPED_TEST(CandidateBackendTest, SingleKeyJoinMatchesSharedValues) {
    const auto a = test_utils::make_keyed_records("a", "ssn", { "1", "1", "2", "3", "4" });
    const auto b = test_utils::make_keyed_records("b", "ssn", { "1", "2", "2", "3", "5" });
    const FieldMap fields = { { "indv_id", "id" }, { "ssn", "ssn" } };
    const auto sides = MatchSides::linkage(a, fields, b, fields);
    auto backend = this->factory_.make(sides);
    const auto plan = plan_for(sides, PASSES[0]);

    const auto result = backend->generateCandidates(plan, ExclusionState());
    const auto pairs = drain(*backend, plan);

    EXPECT_EQ(result.rows, 5);
    EXPECT_EQ(ordinal_pairs(pairs), (std::vector<std::pair<std::int64_t, std::int64_t>>{ { 0, 0 }, { 1, 0 }, { 2, 1 }, { 2, 2 }, { 3, 3 } }));
    ASSERT_FALSE(pairs.empty());
    EXPECT_EQ(pairs.front().idA, "a_id0");
    EXPECT_EQ(pairs.front().idB, "b_id0");
}

TYPED_TEST(CandidateBackendTest, DatasetsSharingANameStayApart) {
    const auto a = make_records("people", { "id", "ssn" }, {
        { "a0", "1" }, { "a1", "1" }, { "a2", "2" }, { "a3", "3" }, { "a4", "4" },
    });
    const auto b = make_records("people", { "id", "ssn" }, {
        { "b0", "1" }, { "b1", "2" }, { "b2", "2" }, { "b3", "3" }, { "b4", "5" },
    });
    const FieldMap fields = { { "indv_id", "id" }, { "ssn", "ssn" } };
    const auto sides = MatchSides::linkage(a, fields, b, fields);
    auto backend = this->factory_.make(sides);
    const auto plan = plan_for(sides, PASSES[0]);

    EXPECT_EQ(backend->generateCandidates(plan, ExclusionState()).rows, 5);
    const auto pairs = drain(*backend, plan);

    EXPECT_EQ(ordinal_pairs(pairs), (std::vector<std::pair<std::int64_t, std::int64_t>>{ { 0, 0 }, { 1, 0 }, { 2, 1 }, { 2, 2 }, { 3, 3 } }));
    for (const auto& p : pairs) {
        EXPECT_EQ(p.idA.front(), 'a');
        EXPECT_EQ(p.idB.front(), 'b');
    }
}

TYPED_TEST(CandidateBackendTest, OrdinalColumnNameIsNeverAField) {
    const auto a = make_records("a", { "id", "idx" }, { { "a0", "7" }, { "a1", "8" } });
    const auto b = make_records("b", { "id", "idx" }, { { "b0", "8" }, { "b1", "7" } });
    const FieldMap fields = { { "indv_id", "id" }, { "code", "idx" } };
    const auto sides = MatchSides::linkage(a, fields, b, fields);
    // Records carrying a source column named idx still stage
    auto backend = this->factory_.make(sides);
    ASSERT_NE(backend, nullptr);

    std::vector<std::string> missing;
    EXPECT_FALSE(resolvePassPlan(sides, "1", "candidates_ab_p1", { "code" }, false, missing).has_value());
    EXPECT_EQ(missing, (std::vector<std::string>{ "code" }));
}

TEST(BackendEquivalenceTest, SameCandidatesFromBothBackends) {
    const auto a = people_a();
    const auto b = people_b();
    const auto sides = MatchSides::linkage(a, FIELDS_A, b, FIELDS_B);

    MemoryBackendFactory memoryFactory;
    SqliteBackendFactory sqliteFactory;
    auto memory = memoryFactory.make(sides);
    auto sqlite = sqliteFactory.make(sides);

    ExclusionState memoryState, sqliteState;
    const auto fromMemory = run_passes(*memory, sides, &memoryState);
    const auto fromSqlite = run_passes(*sqlite, sides, &sqliteState);

    ASSERT_EQ(fromMemory.size(), fromSqlite.size());
    for (std::size_t i = 0; i < fromMemory.size(); ++i) {
        EXPECT_EQ(test_utils::id_pairs(fromMemory[i]), test_utils::id_pairs(fromSqlite[i])) << "pass " << PASSES[i].name;
        EXPECT_EQ(ordinal_pairs(fromMemory[i]), ordinal_pairs(fromSqlite[i])) << "pass " << PASSES[i].name;
    }
    EXPECT_EQ(memoryState.version(), sqliteState.version());
}

TEST(SqliteBackendTest, CandidateQueryQuotesEveryIdentifier) {
    PassPlan plan;
    plan.name = "1";
    plan.artifactName = "candidates_x_p1";
    plan.keys = BlockingKeys{ { "weird\"col" }, { "other" } };
    plan.idColumnA = "id";
    plan.idColumnB = "id";

    const auto sql = buildCandidateQuery(plan, ExclusionState(), "records_a", "records_b");

    EXPECT_EQ(sql.rfind("CREATE TABLE \"candidates_x_p1\" AS SELECT", 0), 0u);
    EXPECT_NE(sql.find("a.\"weird\"\"col\""), std::string::npos);
    EXPECT_NE(sql.find("FROM \"records_a\" AS a INNER JOIN \"records_b\" AS b"), std::string::npos);
    EXPECT_NE(sql.find("ORDER BY idx_a, idx_b"), std::string::npos);
}

TEST(SqliteBackendTest, DedupStagesOneTable) {
    const auto records = test_utils::make_keyed_records("people", "ssn", { "1", "1" });
    const FieldMap fields = { { "indv_id", "id" }, { "ssn", "ssn" } };
    Database db(":memory:");

    SqliteBackend backend(db, MatchSides::deduplication(records, fields));
    backend.stageRecords();

    EXPECT_EQ(backend.tableA(), "records_a_people");
    EXPECT_EQ(backend.tableB(), backend.tableA());
    EXPECT_EQ(db.countRows("records_a_people"), 2);
    EXPECT_FALSE(db.tableExists("records_b_people"));
}

TEST(SqliteBackendTest, LinkageStagesOneTablePerSide) {
    const auto a = test_utils::make_keyed_records("people", "ssn", { "1", "2" });
    const auto b = test_utils::make_keyed_records("people", "ssn", { "3" });
    const FieldMap fields = { { "indv_id", "id" }, { "ssn", "ssn" } };
    Database db(":memory:");

    SqliteBackend backend(db, MatchSides::linkage(a, fields, b, fields));
    backend.stageRecords();

    EXPECT_EQ(backend.tableA(), "records_a_people");
    EXPECT_EQ(backend.tableB(), "records_b_people");
    EXPECT_EQ(db.countRows(backend.tableA()), 2);
    EXPECT_EQ(db.countRows(backend.tableB()), 1);
}
