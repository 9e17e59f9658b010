#include <signal.h>
#include <unistd.h>
#include <chrono>
#include <filesystem>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judgecell/common/cancellation.hpp"
#include "judgecell/common/exceptions.hpp"
#include "judgecell/common/utils.hpp"
#include "judgecell/config.hpp"
#include "judgecell/judge/evaluator.hpp"
#include "test/fake_runtime.hpp"

using namespace std;
using namespace judgecell;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Throw;
namespace fs = std::filesystem;

/**
 * @brief 把 node 和 gcc 替换为 shell，选手代码均为 shell 脚本
 */
static vector<string> shell_toolchain(const vector<string> &args) {
    if (args[0] == "node")
        return {"/bin/sh", args[1]};
    if (args[0] == "gcc") {
        // gcc [flags...] source -o output
        string source = args[args.size() - 3], output = args.back();
        return {"/bin/sh", "-c",
                "if grep -q SYNTAX_ERROR \"$0\"; then echo \"$0:1:1: error: expected ';' before '}' token\" >&2; exit 1; fi; "
                "cp \"$0\" \"$1\" && chmod +x \"$1\"",
                source, output};
    }
    return args;
}

class EvaluatorTest : public ::testing::Test {
protected:
    EvaluatorTest()
        : runtime(shell_toolchain) {}

    void SetUp() override {
        saved_grace_period = GRACE_PERIOD_MS;
        saved_fail_fast = FAIL_FAST;
        saved_parallelism = PARALLELISM;
        saved_retries = SYSTEM_ERROR_RETRIES;
        GRACE_PERIOD_MS = 100;
    }

    void TearDown() override {
        GRACE_PERIOD_MS = saved_grace_period;
        FAIL_FAST = saved_fail_fast;
        PARALLELISM = saved_parallelism;
        SYSTEM_ERROR_RETRIES = saved_retries;
        EXPECT_EQ(runtime.alive(), 0u);
        if (!DEBUG) {
            EXPECT_TRUE(fs::is_empty(RUN_DIR / "tasks"));
            EXPECT_TRUE(fs::is_empty(RUN_DIR / "sandboxes"));
        }
    }

    judge_task make_task(language lang, const string &source, const vector<test_case> &cases) {
        auto sub = submission::create(generate_uuid(), generate_uuid(), lang, source, 1000, 262144);
        return judge_task::create(sub, cases);
    }

    judge_result evaluate(const judge_task &task) {
        sandbox box(runtime, semaphore, RUN_DIR / "sandboxes");
        evaluator judger(box, RUN_DIR / "tasks");
        return judger.evaluate(task, token);
    }

    static test_case weighted(const string &id, const string &input, const string &expected, double weight) {
        auto tc = test_case::create(id, input, expected);
        tc.weight = weight;
        return tc;
    }

    NiceMock<test::mock_runtime> runtime;
    admission_semaphore semaphore{4};
    cancel_token token;
    uint64_t saved_grace_period;
    bool saved_fail_fast;
    size_t saved_parallelism;
    int saved_retries;
};

static const string APLUSB = "read a b\necho $((a + b))\n";

TEST_F(EvaluatorTest, AllAccepted) {
    auto task = make_task(language::JAVASCRIPT, APLUSB,
                          {test_case::create("1", "1 2\n", "3\n"), test_case::create("2", "10 20\n", "30")});
    auto result = evaluate(task);

    EXPECT_TRUE(result.status.is_accepted()) << result.status;
    EXPECT_DOUBLE_EQ(result.score, 100);
    ASSERT_EQ(result.test_cases.size(), 2u);
    EXPECT_EQ(result.test_cases[0].id, "1");
    EXPECT_EQ(result.test_cases[0].actual_output, "3\n");
    EXPECT_EQ(result.test_cases[1].expected_output, "30");
    EXPECT_EQ(result.submission_id, task.submission.id);
    EXPECT_FALSE(result.error);
}

TEST_F(EvaluatorTest, WeightedPartialScore) {
    auto task = make_task(language::JAVASCRIPT, APLUSB,
                          {weighted("1", "1 2\n", "3\n", 1), weighted("2", "2 2\n", "4\n", 1), weighted("3", "1 1\n", "3\n", 2)});
    auto result = evaluate(task);

    EXPECT_EQ(result.status.code(), status_code::WRONG_ANSWER);
    EXPECT_DOUBLE_EQ(result.score, 50.0);
    ASSERT_EQ(result.test_cases.size(), 3u);
    EXPECT_EQ(result.passed_test_cases(), 2u);
    EXPECT_EQ(result.test_cases[2].status.code(), status_code::WRONG_ANSWER);
    EXPECT_EQ(result.test_cases[2].actual_output, "2\n");
}

TEST_F(EvaluatorTest, CompileThenRun) {
    auto task = make_task(language::C, "#!/bin/sh\n" + APLUSB, {test_case::create("1", "4 5\n", "9\n")});
    auto result = evaluate(task);

    EXPECT_TRUE(result.status.is_accepted()) << result.status;
    EXPECT_DOUBLE_EQ(result.score, 100);
    EXPECT_EQ(runtime.created(), 2u);
}

TEST_F(EvaluatorTest, CompileErrorSkipsTestCases) {
    EXPECT_CALL(runtime, create(_, _, _, _, _)).Times(1);
    EXPECT_CALL(runtime, remove(_)).Times(1);

    auto task = make_task(language::C, "int main() { SYNTAX_ERROR }",
                          {test_case::create("1", "", ""), test_case::create("2", "", "")});
    auto result = evaluate(task);

    EXPECT_EQ(result.status.code(), status_code::COMPILATION_ERROR);
    EXPECT_DOUBLE_EQ(result.score, 0);
    EXPECT_TRUE(result.test_cases.empty());
    ASSERT_TRUE(result.error);
    ASSERT_TRUE(result.error->error_output);
    EXPECT_THAT(*result.error->error_output, ::testing::HasSubstr("error: expected ';'"));
    EXPECT_EQ(result.error->exit_code, 1);
    EXPECT_EQ(result.error->line, 1u);
    EXPECT_EQ(result.error->column, 1u);
}

TEST_F(EvaluatorTest, TimeLimitExceeded) {
    auto task = make_task(language::JAVASCRIPT, "sleep 10\n", {test_case::with_limits("1", "", "", 200, 262144)});
    auto started = chrono::steady_clock::now();
    auto result = evaluate(task);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - started);

    EXPECT_EQ(result.status.code(), status_code::TIME_LIMIT_EXCEEDED);
    EXPECT_DOUBLE_EQ(result.score, 0);
    EXPECT_LT(elapsed.count(), 5000);
    ASSERT_EQ(result.test_cases.size(), 1u);
    EXPECT_GE(result.test_cases[0].time_used, 200u);
}

TEST_F(EvaluatorTest, RuntimeErrorFromDiagnostics) {
    auto task = make_task(language::JAVASCRIPT, "echo 'ZeroDivisionError: division by zero' >&2\nexit 1\n",
                          {test_case::create("1", "", "")});
    auto result = evaluate(task);

    EXPECT_EQ(result.status, judge_status::runtime_error(runtime_error_kind::DIVISION_BY_ZERO));
    ASSERT_EQ(result.test_cases.size(), 1u);
    ASSERT_TRUE(result.test_cases[0].error);
    EXPECT_EQ(result.test_cases[0].error->exit_code, 1);
}

TEST_F(EvaluatorTest, FailFastStopsAtFirstFailure) {
    FAIL_FAST = true;
    auto task = make_task(language::JAVASCRIPT, APLUSB,
                          {test_case::create("1", "1 2\n", "3\n"), test_case::create("2", "1 2\n", "4\n"), test_case::create("3", "1 2\n", "3\n")});
    auto result = evaluate(task);

    EXPECT_EQ(result.status.code(), status_code::WRONG_ANSWER);
    ASSERT_EQ(result.test_cases.size(), 2u);
    EXPECT_EQ(result.test_cases[1].id, "2");
    EXPECT_DOUBLE_EQ(result.score, 33.33);
}

TEST_F(EvaluatorTest, ParallelResultsInTaskOrder) {
    PARALLELISM = 3;
    vector<test_case> cases;
    for (int i = 0; i < 6; ++i)
        cases.push_back(test_case::create(to_string(i), to_string(i) + " 0\n", to_string(i) + "\n"));
    auto task = make_task(language::JAVASCRIPT, "sleep 0.1\n" + APLUSB, cases);
    auto result = evaluate(task);

    EXPECT_TRUE(result.status.is_accepted()) << result.status;
    ASSERT_EQ(result.test_cases.size(), 6u);
    for (int i = 0; i < 6; ++i) EXPECT_EQ(result.test_cases[i].id, to_string(i));
}

TEST_F(EvaluatorTest, ParallelFailFast) {
    PARALLELISM = 2;
    FAIL_FAST = true;
    auto task = make_task(language::JAVASCRIPT, APLUSB,
                          {test_case::create("1", "1 1\n", "2\n"), test_case::create("2", "1 1\n", "3\n"),
                           test_case::create("3", "1 1\n", "2\n"), test_case::create("4", "1 1\n", "2\n")});
    auto result = evaluate(task);

    EXPECT_EQ(result.status.code(), status_code::WRONG_ANSWER);
    ASSERT_EQ(result.test_cases.size(), 2u);
    EXPECT_EQ(result.test_cases[1].id, "2");
}

TEST_F(EvaluatorTest, Cancellation) {
    auto task = make_task(language::JAVASCRIPT, "sleep 10\n", {test_case::with_limits("1", "", "", 8000, 262144)});
    thread canceller([this] {
        this_thread::sleep_for(chrono::milliseconds(200));
        token.cancel();
    });
    auto result = evaluate(task);
    canceller.join();

    EXPECT_EQ(result.status.code(), status_code::CANCELLED);
    EXPECT_DOUBLE_EQ(result.score, 0);
}

TEST_F(EvaluatorTest, TerminationSignalCancelsTask) {
    cancel_on_signals(token);
    // 信号到达时容器仍在创建中
    EXPECT_CALL(runtime, create(_, _, _, _, _))
        .WillOnce(Invoke([this](const string &id, const fs::path &bundle, int stdin_fd, int stdout_fd, int stderr_fd) {
            this_thread::sleep_for(chrono::milliseconds(300));
            return runtime.fake_runtime::create(id, bundle, stdin_fd, stdout_fd, stderr_fd);
        }));
    EXPECT_CALL(runtime, remove(_)).Times(1);

    thread sender([] {
        this_thread::sleep_for(chrono::milliseconds(100));
        kill(getpid(), SIGTERM);
    });
    auto result = evaluate(make_task(language::JAVASCRIPT, "sleep 10\n", {test_case::with_limits("1", "", "", 8000, 262144)}));
    sender.join();
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    EXPECT_EQ(result.status.code(), status_code::CANCELLED);
    EXPECT_DOUBLE_EQ(result.score, 0);
    EXPECT_TRUE(token.is_cancelled());
}

TEST_F(EvaluatorTest, EnvironmentFailureIsSystemError) {
    SYSTEM_ERROR_RETRIES = 1;
    EXPECT_CALL(runtime, create(_, _, _, _, _))
        .Times(2)
        .WillRepeatedly(Throw(backend_error("runc: container_linux.go: starting container process caused")));

    auto result = evaluate(make_task(language::JAVASCRIPT, APLUSB, {test_case::create("1", "1 2\n", "3\n")}));

    EXPECT_EQ(result.status.code(), status_code::SYSTEM_ERROR);
    EXPECT_DOUBLE_EQ(result.score, 0);
    EXPECT_TRUE(result.test_cases.empty());
    ASSERT_TRUE(result.error);
    EXPECT_THAT(result.error->message, ::testing::HasSubstr("starting container process"));
}

TEST_F(EvaluatorTest, NoTestCases) {
    auto result = evaluate(make_task(language::JAVASCRIPT, APLUSB, {}));
    EXPECT_TRUE(result.status.is_accepted());
    EXPECT_DOUBLE_EQ(result.score, 100);
    EXPECT_EQ(runtime.created(), 0u);
}
