#include "judgecell/judge/evaluator.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include "judgecell/common/concurrent_queue.hpp"
#include "judgecell/common/defer.hpp"
#include "judgecell/common/exceptions.hpp"
#include "judgecell/common/io_utils.hpp"
#include "judgecell/common/utils.hpp"
#include "judgecell/config.hpp"

namespace judgecell {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 选手代码和编译产物在沙箱内的路径
 */
static const string PROGRAM_DIR = "/program";

evaluator::evaluator(sandbox &box, const fs::path &task_root)
    : box(box), task_root(task_root) {}

judge_result evaluator::evaluate(const judge_task &task, const cancel_token &token) {
    judge_result result;
    for (int attempt = 0;; ++attempt) {
        result = evaluate_once(task, token);
        if (result.status.code() != status_code::SYSTEM_ERROR || attempt >= SYSTEM_ERROR_RETRIES || token.is_cancelled())
            break;
        LOG(WARNING) << "Judging submission " << task.submission.id << " ended with system error, retrying ("
                     << attempt + 1 << "/" << SYSTEM_ERROR_RETRIES << ")";
    }
    LOG(INFO) << "Submission " << task.submission.id << " judged: " << result.status << ", score " << result.score;
    return result;
}

/**
 * @brief 写入选手代码，并将目录交给沙箱内的 root 用户
 */
static void prepare_program(const judge_task &task, const fs::path &program_dir) {
    try {
        fs::create_directories(program_dir);
        fs::path source = program_dir / assert_safe_path(task.submission.filename());
        write_file_content(source, task.submission.source_code);
        if (geteuid() == 0) {
            if (chown(program_dir.c_str(), SANDBOX_UID, SANDBOX_GID) < 0 || chown(source.c_str(), SANDBOX_UID, SANDBOX_GID) < 0)
                throw system_error(errno, system_category(), "unable to chown " + program_dir.string());
        }
    } catch (fs::filesystem_error &e) {
        throw provision_error(string("Unable to prepare program directory: ") + e.what());
    } catch (system_error &e) {
        throw provision_error(string("Unable to prepare program directory: ") + e.what());
    }
}

static vector<string> environment_for(language lang) {
    vector<string> env = default_environment();
    if (lang == language::GO) {
        env.push_back("GOCACHE=/workspace/.cache/go-build");
        env.push_back("GOPATH=/workspace/go");
    }
    return env;
}

optional<classification> evaluator::compile(const judge_task &task, const fs::path &program_dir, const cancel_token &token) {
    language lang = task.submission.lang;

    launch_spec spec;
    spec.args = compile_command(lang, task.compile_flags.value_or(task.submission.default_compile_flags()), PROGRAM_DIR);
    spec.env = environment_for(lang);
    spec.cwd = PROGRAM_DIR;
    spec.time_limit_ms = COMPILE_TIME_LIMIT_MS;
    spec.memory_limit_kb = COMPILE_MEMORY_LIMIT_KB;
    spec.pids_limit = PIDS_LIMIT;
    spec.mounts.push_back({program_dir.string(), PROGRAM_DIR, false});

    execution_outcome outcome = box.execute(spec, "", token);

    classify_context context;
    context.phase = execution_phase::COMPILE;
    context.time_limit_ms = COMPILE_TIME_LIMIT_MS;
    context.memory_limit_kb = COMPILE_MEMORY_LIMIT_KB;
    context.mode = COMPARE_MODE;
    context.stream_limit = OUTPUT_LIMIT;
    classification result = classify(outcome, context);
    if (result.status.is_accepted()) return nullopt;

    LOG(INFO) << "Compilation of submission " << task.submission.id << " failed: " << result.status;
    return result;
}

test_case_result evaluator::run_test_case(const judge_task &task, const test_case &tc, const fs::path &program_dir, const cancel_token &token) {
    language lang = task.submission.lang;

    launch_spec spec;
    spec.args = run_command(lang, task.runtime_args.value_or(vector<string>{}), PROGRAM_DIR);
    spec.env = environment_for(lang);
    spec.cwd = "/workspace";
    spec.time_limit_ms = tc.effective_time_limit(task.submission.time_limit);
    spec.memory_limit_kb = tc.effective_memory_limit(task.submission.memory_limit);
    spec.pids_limit = PIDS_LIMIT;
    spec.mounts.push_back({program_dir.string(), PROGRAM_DIR, true});

    execution_outcome outcome = box.execute(spec, tc.input, token);

    classify_context context;
    context.phase = execution_phase::RUN;
    context.time_limit_ms = spec.time_limit_ms;
    context.memory_limit_kb = spec.memory_limit_kb;
    context.expected_output = tc.expected_output;
    context.mode = COMPARE_MODE;
    context.stream_limit = OUTPUT_LIMIT;
    classification verdict = classify(outcome, context);

    test_case_result result;
    result.id = tc.id;
    result.status = verdict.status;
    result.time_used = outcome.wall_time_ms;
    result.memory_used = outcome.memory_kb;
    result.input = tc.input;
    result.expected_output = tc.expected_output;
    result.actual_output = outcome.output;
    result.error = verdict.error;
    LOG(INFO) << "Test case " << tc.id << " of submission " << task.submission.id << ": " << result.status
              << ", " << result.time_used << "ms, " << result.memory_used << "KB";
    return result;
}

/**
 * @brief 该测试点之后的测试点是否不需要再运行
 */
static bool stops_after(const test_case_result &result) {
    if (result.status.code() == status_code::CANCELLED) return true;
    return FAIL_FAST && !result.status.is_accepted();
}

vector<test_case_result> evaluator::run_test_cases(const judge_task &task, const fs::path &program_dir, const cancel_token &token) {
    size_t n = task.test_cases.size();
    size_t workers = max<size_t>(1, min(PARALLELISM, n));
    vector<optional<test_case_result>> slots(n);

    if (workers == 1) {
        for (size_t i = 0; i < n; ++i) {
            slots[i] = run_test_case(task, task.test_cases[i], program_dir, token);
            if (stops_after(*slots[i])) break;
        }
    } else {
        atomic<size_t> next(0);
        atomic<size_t> stop_index(n);  // 下标大于它的测试点不再运行
        concurrent_queue<pair<size_t, test_case_result>> finished;
        mutex error_mut;
        exception_ptr error;

        auto worker = [&] {
            for (size_t i; (i = next++) < n && i <= stop_index;) {
                try {
                    test_case_result result = run_test_case(task, task.test_cases[i], program_dir, token);
                    if (stops_after(result)) {
                        size_t current = stop_index;
                        while (i < current && !stop_index.compare_exchange_weak(current, i)) {}
                    }
                    finished.push({i, move(result)});
                } catch (std::exception &) {
                    lock_guard<mutex> lock(error_mut);
                    if (!error) error = current_exception();
                    stop_index = 0;
                    return;
                }
            }
        };

        vector<thread> threads;
        for (size_t i = 0; i < workers; ++i) threads.emplace_back(worker);
        for (auto &t : threads) t.join();
        finished.close();

        if (error) rethrow_exception(error);
        while (auto item = finished.pop()) slots[item->first] = move(item->second);
    }

    // 结果按任务顺序记录，快速失败或取消时只保留到第一个未通过的测试点
    vector<test_case_result> results;
    for (auto &slot : slots) {
        if (!slot) break;
        results.push_back(*slot);
        if (stops_after(*slot)) break;
    }
    return results;
}

judge_result evaluator::evaluate_once(const judge_task &task, const cancel_token &token) {
    judge_result result = judge_result::pending(task.submission);
    result.start_judging();

    fs::path workdir = task_root / boost::uuids::to_string(generate_uuid());
    fs::path program_dir = workdir / "program";
    defer {
        if (!DEBUG) {
            error_code ec;
            fs::remove_all(workdir, ec);
            if (ec) LOG(ERROR) << "Unable to remove task directory " << workdir << ": " << ec.message();
        }
    };

    try {
        prepare_program(task, program_dir);

        if (task.needs_compilation) {
            if (auto failure = compile(task, program_dir, token)) {
                result.finalize(failure->status, failure->error);
                return result;
            }
        }

        vector<test_case_result> results = run_test_cases(task, program_dir, token);
        bool cancelled = token.is_cancelled() || any_of(results.begin(), results.end(), [](const test_case_result &r) {
                             return r.status.code() == status_code::CANCELLED;
                         });
        if (cancelled) {
            LOG(INFO) << "Judging submission " << task.submission.id << " is cancelled";
            result.finalize(status_code::CANCELLED, nullopt);
            return result;
        }

        for (auto &r : results) result.add_test_case(r);
        result.finalize(task);
    } catch (environment_error &e) {
        LOG(ERROR) << "Environment failure while judging submission " << task.submission.id << ": " << e;
        result.test_cases.clear();
        result.finalize(token.is_cancelled() ? judge_status(status_code::CANCELLED) : judge_status(status_code::SYSTEM_ERROR),
                        error_info::from_message(e.what()));
    } catch (std::exception &e) {
        LOG(ERROR) << "Unexpected failure while judging submission " << task.submission.id << ": " << boost::diagnostic_information(e);
        result.test_cases.clear();
        result.finalize(token.is_cancelled() ? judge_status(status_code::CANCELLED) : judge_status(status_code::SYSTEM_ERROR),
                        error_info::from_message(e.what()));
    }
    return result;
}

}  // namespace judgecell
