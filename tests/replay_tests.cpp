#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "api/replay.hpp"
#include "tests/harness/scenario_builder.hpp"

namespace {

constexpr const char* script = R"(# two candidates for one right record
L|+|1|amount=1001
L|+|2|amount=1004
R|+|3|amount=1000

!min_confidence 0.95
!min_confidence 0.5
R|-|3
L|?|4
)";

TEST(ReplayScriptTest, BatchesDirectivesAndParseFailures) {
    core::IncrementalMatcher matcher(test::amount_only_config());
    core::ResultMaterializer materializer;
    std::vector<std::string> output;
    std::istringstream in(script);

    const auto stats = api::replay_script(in, matcher, materializer, output);
    EXPECT_EQ(stats.events, 4u);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_EQ(stats.parse_failures, 1u);
    EXPECT_EQ(stats.batches, 2u);
    EXPECT_EQ(stats.threshold_changes, 2u);
    EXPECT_EQ(stats.rejected_batches, 0u);

    const std::vector<std::string> expected{
        "upsert 1 3 0.900000",
        "upsert 2 - 0.000000",
        // tau 0.95 releases the 0.9 pair
        "retract 1 3 0.900000",
        "upsert 1 - 0.000000",
        // back to 0.5
        "upsert 1 3 0.900000",
        // R3 leaves
        "retract 1 3 0.900000",
        "upsert 1 - 0.000000",
    };
    EXPECT_EQ(output, expected);
    EXPECT_EQ(stats.output_events, expected.size());
}

TEST(ReplayScriptTest, BadThresholdIsCountedNotFatal) {
    core::IncrementalMatcher matcher(test::amount_only_config());
    core::ResultMaterializer materializer;
    std::vector<std::string> output;
    std::istringstream in("!min_confidence abc\n!min_confidence 3\nL|+|1|amount=5\n");

    const auto stats = api::replay_script(in, matcher, materializer, output);
    EXPECT_EQ(stats.parse_failures, 2u);
    EXPECT_EQ(stats.events, 1u);
    EXPECT_DOUBLE_EQ(matcher.min_confidence(), 0.5);
    EXPECT_EQ(output, (std::vector<std::string>{"upsert 1 - 0.000000"}));
}

TEST(ReplayScriptTest, MaxEventsStopsEarly) {
    core::IncrementalMatcher matcher(test::amount_only_config());
    core::ResultMaterializer materializer;
    std::vector<std::string> output;
    std::istringstream in("L|+|1|amount=5\nL|+|2|amount=6\nL|+|3|amount=7\n");

    const auto stats = api::replay_script(in, matcher, materializer, output, 2);
    EXPECT_EQ(stats.events, 2u);
    EXPECT_EQ(output.size(), 2u);
}

class ReplayToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("fuzzy_recon_replay_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path write(const std::string& name, const std::string& text) const {
        const auto path = dir_ / name;
        std::ofstream out(path);
        out << text;
        return path;
    }

    static std::string read(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path dir_;
};

TEST_F(ReplayToolTest, WritesOutputAndVerifies) {
    api::ReplayConfig cfg{};
    cfg.input = write("script.txt",
                      "L|+|0|date=2020-06-04|amount=8946|recipient=M. Perez|recipient_acc_no=HU30186000000000000008280573\n"
                      "R|+|0|description=EUR 8944 on 2020-06-06 by INTERNATIONAL transfer credited to "
                      "00000000008280573 (M. Perez), amount EUR 8946.\n");
    cfg.output_path = dir_ / "out.txt";
    cfg.snapshot = true;
    cfg.quiet = true;

    ASSERT_EQ(api::run_replay(cfg), 0);
    const std::string produced = read(cfg.output_path);
    EXPECT_NE(produced.find("upsert 0 0 "), std::string::npos) << produced;
    EXPECT_NE(produced.find("row 0 0 "), std::string::npos) << produced;

    cfg.verify_against = cfg.output_path;
    cfg.output_path = dir_ / "again.txt";
    EXPECT_EQ(api::run_replay(cfg), 0);

    cfg.verify_against = write("wrong.txt", "upsert 0 - 0.000000\n");
    EXPECT_EQ(api::run_replay(cfg), 2);
}

TEST_F(ReplayToolTest, SetupFailuresReturnOne) {
    api::ReplayConfig cfg{};
    cfg.quiet = true;
    EXPECT_EQ(api::run_replay(cfg), 1);

    cfg.input = dir_ / "missing.txt";
    EXPECT_EQ(api::run_replay(cfg), 1);

    cfg.input = write("script.txt", "L|+|1|amount=5\n");
    cfg.config_path = write("bad.json", R"({"preset": "transaction", "min_confidence": 7})");
    EXPECT_EQ(api::run_replay(cfg), 1);
}

TEST_F(ReplayToolTest, CustomConfigIsUsed) {
    api::ReplayConfig cfg{};
    cfg.quiet = true;
    cfg.input = write("script.txt", "L|+|1|amount=1001\nR|+|2|amount=1000\n");
    cfg.config_path = write("cfg.json", R"({
        "min_confidence": 0.5,
        "left_schema": {"fields": [{"name": "amount", "kind": "number", "required": true}]},
        "right_schema": {"fields": [{"name": "amount", "kind": "number", "required": true}]},
        "blocking": [{"left_field": "amount", "right_field": "amount", "kind": "numeric_bucket", "width": 100}],
        "scorer": {"rules": [{"left_field": "amount", "right_field": "amount",
                              "comparator": "numeric_tolerance", "tolerance": 10, "required": true}]}
    })");
    cfg.output_path = dir_ / "out.txt";
    ASSERT_EQ(api::run_replay(cfg), 0);
    EXPECT_EQ(read(cfg.output_path), "upsert 1 2 0.900000\n");
}

} // namespace
