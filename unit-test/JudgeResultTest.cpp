#include "gtest/gtest.h"
#include "judgecell/common/utils.hpp"
#include "judgecell/model/submission.hpp"

using namespace std;
using namespace judgecell;

class JudgeResultTest : public ::testing::Test {
protected:
    void SetUp() override {
        sub = submission::create(generate_uuid(), generate_uuid(), language::CPP17, "int main() {}", 1000, 262144);
    }

    test_case_result make_result(const string &id, const judge_status &status, uint64_t time_used = 10, uint64_t memory_used = 1024) {
        test_case_result result;
        result.id = id;
        result.status = status;
        result.time_used = time_used;
        result.memory_used = memory_used;
        return result;
    }

    submission sub;
};

TEST_F(JudgeResultTest, SubmissionFactories) {
    EXPECT_EQ(sub.priority, 0);
    EXPECT_FALSE(sub.contest_id);
    EXPECT_EQ(sub.filename(), "main.cpp");
    EXPECT_TRUE(sub.needs_compilation());

    auto contest = generate_uuid();
    auto in_contest = submission::for_contest(sub.problem_id, sub.user_id, contest, language::PYTHON3, "print(1)", 1000, 65536);
    EXPECT_EQ(in_contest.priority, 10);
    EXPECT_EQ(in_contest.contest_id, contest);
    EXPECT_NE(in_contest.id, sub.id);
    EXPECT_FALSE(in_contest.needs_compilation());
}

TEST_F(JudgeResultTest, TestCaseLimits) {
    auto plain = test_case::create("1", "1 2", "3");
    EXPECT_EQ(plain.weight, 1.0);
    EXPECT_FALSE(plain.is_hidden);
    EXPECT_EQ(plain.effective_time_limit(1000), 1000u);

    auto limited = test_case::with_limits("2", "", "", 3000, 1024);
    EXPECT_EQ(limited.effective_time_limit(1000), 3000u);
    EXPECT_EQ(limited.effective_memory_limit(262144), 1024u);
    EXPECT_TRUE(test_case::hidden("3", "", "").is_hidden);

    auto task = judge_task::create(sub, {plain, limited});
    EXPECT_TRUE(task.needs_compilation);
    EXPECT_TRUE(task.use_sandbox);
    EXPECT_EQ(task.compile_flags, sub.default_compile_flags());
    EXPECT_EQ(task.test_case_count(), 2u);
    EXPECT_DOUBLE_EQ(task.total_weight(), 2.0);
    EXPECT_EQ(task.max_time_limit(), 3000u);
    EXPECT_EQ(task.max_memory_limit(), 262144u);
}

TEST_F(JudgeResultTest, FinalizeWeightedScore) {
    auto a = test_case::create("a", "", "");
    auto b = test_case::create("b", "", "");
    b.weight = 3;
    auto task = judge_task::create(sub, {a, b});

    auto result = judge_result::pending(sub);
    result.start_judging();
    EXPECT_EQ(result.status.code(), status_code::JUDGING);
    result.add_test_case(make_result("a", status_code::ACCEPTED, 30, 2048));
    result.add_test_case(make_result("b", status_code::WRONG_ANSWER, 50, 1024));
    result.finalize(task);

    EXPECT_EQ(result.status.code(), status_code::WRONG_ANSWER);
    EXPECT_DOUBLE_EQ(result.score, 25.0);
    EXPECT_EQ(result.time_used, 50u);
    EXPECT_EQ(result.memory_used, 2048u);
    EXPECT_EQ(result.passed_test_cases(), 1u);
    EXPECT_EQ(result.total_test_cases(), 2u);
}

TEST_F(JudgeResultTest, ScoreRoundsToTwoDecimals) {
    auto task = judge_task::create(sub, {test_case::create("1", "", ""), test_case::create("2", "", ""), test_case::create("3", "", "")});
    auto result = judge_result::pending(sub);
    result.add_test_case(make_result("1", status_code::ACCEPTED));
    result.add_test_case(make_result("2", status_code::TIME_LIMIT_EXCEEDED));
    result.add_test_case(make_result("3", status_code::WRONG_ANSWER));
    result.finalize(task);

    EXPECT_EQ(result.status.code(), status_code::TIME_LIMIT_EXCEEDED);
    EXPECT_DOUBLE_EQ(result.score, 33.33);
}

TEST_F(JudgeResultTest, NoTestCasesIsAccepted) {
    auto task = judge_task::create(sub, {});
    auto result = judge_result::pending(sub);
    result.finalize(task);
    EXPECT_TRUE(result.status.is_accepted());
    EXPECT_DOUBLE_EQ(result.score, 100);
}

TEST_F(JudgeResultTest, ZeroTotalWeight) {
    auto a = test_case::create("a", "", "");
    a.weight = 0;
    auto task = judge_task::create(sub, {a});

    auto passed = judge_result::pending(sub);
    passed.add_test_case(make_result("a", status_code::ACCEPTED));
    passed.finalize(task);
    EXPECT_DOUBLE_EQ(passed.score, 100);

    auto failed = judge_result::pending(sub);
    failed.add_test_case(make_result("a", judge_status::runtime_error(runtime_error_kind::OTHER)));
    failed.finalize(task);
    EXPECT_DOUBLE_EQ(failed.score, 0);
    EXPECT_TRUE(failed.status.is_runtime_error());
}

TEST_F(JudgeResultTest, FinalizeOnlyOnce) {
    auto task = judge_task::create(sub, {});
    auto result = judge_result::pending(sub);
    result.finalize(status_code::COMPILATION_ERROR, error_info::compilation_error("Compilation failed", string("error: expected ';'")));
    EXPECT_EQ(result.status.code(), status_code::COMPILATION_ERROR);
    EXPECT_DOUBLE_EQ(result.score, 0);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->error_output, "error: expected ';'");

    EXPECT_THROW(result.finalize(task), logic_error);
    EXPECT_THROW(result.finalize(status_code::SYSTEM_ERROR, nullopt), logic_error);
    EXPECT_THROW(result.start_judging(), logic_error);
}

TEST_F(JudgeResultTest, CannotFinalizeAsNonFinal) {
    auto result = judge_result::pending(sub);
    EXPECT_THROW(result.finalize(status_code::JUDGING, nullopt), invalid_argument);
}

TEST_F(JudgeResultTest, Factories) {
    auto ok = judge_result::accepted(10, 20, sub.id, sub.problem_id, sub.user_id);
    EXPECT_TRUE(ok.status.is_accepted());
    EXPECT_DOUBLE_EQ(ok.score, 100);

    auto failed = judge_result::with_error(status_code::SYSTEM_ERROR, 0, 0, error_info::from_message("runc missing"),
                                           sub.id, sub.problem_id, sub.user_id);
    EXPECT_EQ(failed.status.code(), status_code::SYSTEM_ERROR);
    EXPECT_DOUBLE_EQ(failed.score, 0);
    EXPECT_EQ(failed.error->message, "runc missing");
}

TEST(ErrorInfoTest, Factories) {
    auto from_stderr = error_info::from_stderr("Traceback (most recent call last):");
    EXPECT_EQ(from_stderr.message, "Traceback (most recent call last):");
    EXPECT_EQ(from_stderr.error_output, "Traceback (most recent call last):");
    EXPECT_FALSE(from_stderr.signal);

    auto crashed = error_info::runtime_error("Segmentation fault", 11, nullopt);
    EXPECT_EQ(crashed.signal, 11);
    EXPECT_FALSE(crashed.error_output);
    EXPECT_NE(crashed, error_info::from_message("Segmentation fault"));
}

TEST(ErrorInfoTest, CapStreams) {
    auto info = error_info::compilation_error("Compilation failed", string(100, 'e'));
    info.standard_output = string(10, 'o');
    info.cap_streams(16);
    EXPECT_EQ(info.error_output->size(), 16u);
    EXPECT_EQ(info.standard_output, string(10, 'o'));
    EXPECT_EQ(info.message, "Compilation failed");
}
