#include <gtest/gtest.h>
#include <iterator>
#include <stdexcept>

#include "rl_output.h"
#include "test_helpers.hpp"

namespace {

    PassConfig make_pass(const std::string& name) {
        PassConfig pass;
        pass.name = name;
        pass.number = std::stoi(name);
        return pass;
    }

    MatchResult make_result(const std::string& pass, std::int64_t ordinal, bool strict, bool review,
                            std::vector<std::pair<std::string, double>> scores = {}) {
        MatchResult result;
        result.pair = CandidatePair{ "a" + std::to_string(ordinal), "b" + std::to_string(ordinal), ordinal, ordinal };
        result.passName = pass;
        result.strict = strict;
        result.moderate = strict;
        result.relaxed = strict;
        result.review = review;
        result.scores = std::move(scores);
        return result;
    }

    std::vector<std::vector<std::string>> read_rows(const std::filesystem::path& path) {
        CsvReader reader(path);
        std::vector<std::vector<std::string>> rows;
        std::vector<std::string> fields;
        while (reader.readRow(fields)) {
            rows.push_back(fields);
        }
        return rows;
    }

}

TEST(PassWeightsTest, EarlierPassesOutrankLaterOnes) {
    const auto weights = computePassWeights({ make_pass("1"), make_pass("2"), make_pass("3") });

    EXPECT_DOUBLE_EQ(weights.groundTruth, 10000.0);
    EXPECT_DOUBLE_EQ(weights.weightFor("1"), 1000.0);
    EXPECT_DOUBLE_EQ(weights.weightFor("2"), 100.0);
    EXPECT_DOUBLE_EQ(weights.weightFor("3"), 10.0);
    EXPECT_THROW(weights.weightFor("4"), std::out_of_range);
}

TEST(PassWeightsTest, NoPassesLeavesGroundTruthAtTen) {
    const auto weights = computePassWeights({});
    EXPECT_DOUBLE_EQ(weights.groundTruth, 10.0);
    EXPECT_TRUE(weights.byPass.empty());
}

TEST(PassCountsTest, TalliesPerPassAndTotal) {
    PassCounts counts;
    counts.tally({ make_result("1", 0, true, true), make_result("1", 1, false, true), make_result("2", 2, false, false) });
    counts.tally({ make_result("2", 3, true, true) });

    const auto first = counts.forPass("1");
    EXPECT_EQ(first.evaluated, 2u);
    EXPECT_EQ(first.strict, 1u);
    EXPECT_EQ(first.review, 2u);

    const auto second = counts.forPass("2");
    EXPECT_EQ(second.evaluated, 2u);
    EXPECT_EQ(second.strict, 1u);

    EXPECT_EQ(counts.forPass("unknown").evaluated, 0u);
    EXPECT_EQ(counts.total().evaluated, 4u);
    EXPECT_EQ(counts.total().relaxed, 2u);
}

TEST(PassCountsTest, ReportListsEveryPass) {
    test_utils::TempDir dir;
    const auto logPath = dir.path() / "counts.log";
    {
        std::ofstream log(logPath);
        PassCounts counts;
        counts.tally({ make_result("1", 0, true, true) });
        reportCounts(counts, { "dup_ssn", "1" }, log);
    }

    std::ifstream in(logPath);
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("dup_ssn"), std::string::npos);
    EXPECT_NE(text.find("total"), std::string::npos);
}

class OutputAssemblerTest : public ::testing::Test {
protected:
    test_utils::TempDir dir_;
    OutputAssembler output_{ dir_.path(), { "first_name", "dob" },
                             computePassWeights({ make_pass("1"), make_pass("2") }) };
};

TEST_F(OutputAssemblerTest, ColumnsAppendComparers) {
    auto expected = OUTPUT_COLUMNS;
    expected.push_back("first_name");
    expected.push_back("dob");
    EXPECT_EQ(output_.columns(), expected);
}

TEST_F(OutputAssemblerTest, BatchIsWeightedAndSortedDescending) {
    const auto path = output_.writeBatch({
        make_result("2", 0, false, true, { { "dob", 0.5 } }),
        make_result("1", 1, true, true, { { "first_name", 1.0 }, { "dob", 1.0 } }),
        make_result("2", 2, false, false),
    });

    EXPECT_EQ(path.filename().string(), "temp_match_0.csv");
    const auto rows = read_rows(path);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0], output_.columns());

    EXPECT_EQ(rows[1][4], "1");
    EXPECT_DOUBLE_EQ(std::stod(rows[1][9]), 100.0);
    EXPECT_EQ(rows[1][5], "True");
    EXPECT_DOUBLE_EQ(std::stod(rows[1][10]), 1.0);

    // Equal weights keep their batch order
    EXPECT_EQ(rows[2][2], "0");
    EXPECT_EQ(rows[3][2], "2");
    EXPECT_DOUBLE_EQ(std::stod(rows[2][9]), 10.0);
    EXPECT_EQ(rows[2][5], "False");
    EXPECT_EQ(rows[2][8], "True");
    EXPECT_EQ(rows[2][10], "");
    EXPECT_DOUBLE_EQ(std::stod(rows[2][11]), 0.5);

    EXPECT_EQ(output_.counts().forPass("2").evaluated, 2u);
    EXPECT_EQ(output_.shardsWritten(), 1u);
}

TEST_F(OutputAssemblerTest, ShardsAreNumberedInOrder) {
    EXPECT_EQ(output_.writeBatch({ make_result("1", 0, true, true) }).filename().string(), "temp_match_0.csv");
    EXPECT_EQ(output_.writeBatch({ make_result("1", 1, true, true) }).filename().string(), "temp_match_1.csv");
    EXPECT_EQ(output_.writeGroundTruth({}).filename().string(), "temp_match_gid.csv");
    EXPECT_EQ(output_.shardsWritten(), 3u);
}

TEST_F(OutputAssemblerTest, UnknownPassIsRejected) {
    EXPECT_THROW(output_.writeBatch({ make_result("9", 0, true, true) }), std::out_of_range);
}

TEST(OutputAssemblerErrorTest, UnwritableDirectoryThrows) {
    test_utils::TempDir dir;
    OutputAssembler output(dir.path() / "missing", {}, computePassWeights({ make_pass("1") }));

    EXPECT_THROW(output.writeBatch({ make_result("1", 0, true, true) }), std::runtime_error);
}
