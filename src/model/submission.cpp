#include "judgecell/model/submission.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <tuple>
#include <unordered_map>
#include "judgecell/common/utils.hpp"

namespace judgecell {
using namespace std;

submission submission::create(const boost::uuids::uuid &problem_id, const boost::uuids::uuid &user_id,
                              language lang, const string &source_code,
                              uint64_t time_limit, uint64_t memory_limit) {
    submission result;
    result.id = generate_uuid();
    result.problem_id = problem_id;
    result.user_id = user_id;
    result.lang = lang;
    result.source_code = source_code;
    result.created_at = now_timestamp();
    result.time_limit = time_limit;
    result.memory_limit = memory_limit;
    result.priority = 0;
    return result;
}

submission submission::for_contest(const boost::uuids::uuid &problem_id, const boost::uuids::uuid &user_id,
                                   const boost::uuids::uuid &contest_id,
                                   language lang, const string &source_code,
                                   uint64_t time_limit, uint64_t memory_limit) {
    submission result = create(problem_id, user_id, lang, source_code, time_limit, memory_limit);
    result.contest_id = contest_id;
    result.priority = 10;
    return result;
}

string submission::filename() const {
    return source_filename(lang);
}

bool submission::needs_compilation() const {
    return judgecell::needs_compilation(lang);
}

vector<string> submission::default_compile_flags() const {
    return judgecell::default_compile_flags(lang);
}

const char *submission::default_runtime() const {
    return judgecell::default_runtime(lang);
}

bool submission::operator==(const submission &other) const {
    return tie(id, problem_id, user_id, contest_id, lang, source_code, created_at, time_limit, memory_limit, priority) ==
           tie(other.id, other.problem_id, other.user_id, other.contest_id, other.lang, other.source_code, other.created_at, other.time_limit, other.memory_limit, other.priority);
}

test_case test_case::create(const string &id, const string &input, const string &expected_output) {
    test_case result;
    result.id = id;
    result.input = input;
    result.expected_output = expected_output;
    return result;
}

test_case test_case::hidden(const string &id, const string &input, const string &expected_output) {
    test_case result = create(id, input, expected_output);
    result.is_hidden = true;
    return result;
}

test_case test_case::with_limits(const string &id, const string &input, const string &expected_output,
                                 uint64_t time_limit, uint64_t memory_limit) {
    test_case result = create(id, input, expected_output);
    result.time_limit = time_limit;
    result.memory_limit = memory_limit;
    return result;
}

uint64_t test_case::effective_time_limit(uint64_t default_time_limit) const {
    return time_limit.value_or(default_time_limit);
}

uint64_t test_case::effective_memory_limit(uint64_t default_memory_limit) const {
    return memory_limit.value_or(default_memory_limit);
}

bool test_case::operator==(const test_case &other) const {
    return tie(id, input, expected_output, time_limit, memory_limit, is_hidden, weight) ==
           tie(other.id, other.input, other.expected_output, other.time_limit, other.memory_limit, other.is_hidden, other.weight);
}

judge_task judge_task::create(const struct submission &submission, const vector<test_case> &test_cases) {
    judge_task task;
    task.submission = submission;
    task.test_cases = test_cases;
    task.needs_compilation = submission.needs_compilation();
    if (task.needs_compilation)
        task.compile_flags = submission.default_compile_flags();
    return task;
}

size_t judge_task::test_case_count() const {
    return test_cases.size();
}

double judge_task::total_weight() const {
    double sum = 0;
    for (auto &tc : test_cases) sum += tc.weight;
    return sum;
}

uint64_t judge_task::max_time_limit() const {
    uint64_t result = 0;
    for (auto &tc : test_cases)
        result = max(result, tc.effective_time_limit(submission.time_limit));
    return test_cases.empty() ? submission.time_limit : result;
}

uint64_t judge_task::max_memory_limit() const {
    uint64_t result = 0;
    for (auto &tc : test_cases)
        result = max(result, tc.effective_memory_limit(submission.memory_limit));
    return test_cases.empty() ? submission.memory_limit : result;
}

bool judge_task::operator==(const judge_task &other) const {
    return tie(submission, test_cases, needs_compilation, use_sandbox, compile_flags, runtime_args) ==
           tie(other.submission, other.test_cases, other.needs_compilation, other.use_sandbox, other.compile_flags, other.runtime_args);
}

bool test_case_result::operator==(const test_case_result &other) const {
    return tie(id, status, time_used, memory_used, input, expected_output, actual_output, error) ==
           tie(other.id, other.status, other.time_used, other.memory_used, other.input, other.expected_output, other.actual_output, other.error);
}

judge_result judge_result::pending(const struct submission &submission) {
    judge_result result;
    result.status = status_code::PENDING;
    result.submission_id = submission.id;
    result.problem_id = submission.problem_id;
    result.user_id = submission.user_id;
    result.judged_at = now_timestamp();
    return result;
}

judge_result judge_result::accepted(uint64_t time_used, uint64_t memory_used,
                                    const boost::uuids::uuid &submission_id, const boost::uuids::uuid &problem_id, const boost::uuids::uuid &user_id) {
    judge_result result;
    result.status = status_code::ACCEPTED;
    result.time_used = time_used;
    result.memory_used = memory_used;
    result.submission_id = submission_id;
    result.problem_id = problem_id;
    result.user_id = user_id;
    result.judged_at = now_timestamp();
    result.score = 100;
    return result;
}

judge_result judge_result::with_error(const judge_status &status, uint64_t time_used, uint64_t memory_used,
                                      const error_info &error,
                                      const boost::uuids::uuid &submission_id, const boost::uuids::uuid &problem_id, const boost::uuids::uuid &user_id) {
    judge_result result;
    result.status = status;
    result.time_used = time_used;
    result.memory_used = memory_used;
    result.error = error;
    result.submission_id = submission_id;
    result.problem_id = problem_id;
    result.user_id = user_id;
    result.judged_at = now_timestamp();
    result.score = 0;
    return result;
}

void judge_result::add_test_case(const test_case_result &result) {
    test_cases.push_back(result);
}

size_t judge_result::passed_test_cases() const {
    return count_if(test_cases.begin(), test_cases.end(), [](const test_case_result &tc) {
        return tc.status.is_accepted();
    });
}

size_t judge_result::total_test_cases() const {
    return test_cases.size();
}

void judge_result::start_judging() {
    if (status.code() != status_code::PENDING)
        throw logic_error(string("Cannot start judging a result in state ") + status.display_name());
    status = status_code::JUDGING;
}

static double round_score(double score) {
    return round(score * 100) / 100;
}

void judge_result::finalize(const judge_task &task) {
    if (status.is_final())
        throw logic_error(string("Judge result is already finalized as ") + status.display_name());

    unordered_map<string, double> weights;
    for (auto &tc : task.test_cases) weights.emplace(tc.id, tc.weight);

    judge_status overall = status_code::ACCEPTED;
    double passed_weight = 0;
    time_used = memory_used = 0;
    for (size_t i = 0; i < test_cases.size(); ++i) {
        auto &tc = test_cases[i];
        time_used = max(time_used, tc.time_used);
        memory_used = max(memory_used, tc.memory_used);
        if (tc.status.is_accepted()) {
            // 结果按任务中测试点的顺序记录，快速失败时只是少了末尾的若干个
            if (i < task.test_cases.size() && task.test_cases[i].id == tc.id)
                passed_weight += task.test_cases[i].weight;
            else if (auto it = weights.find(tc.id); it != weights.end())
                passed_weight += it->second;
        } else if (overall.is_accepted()) {
            overall = tc.status;
        }
    }

    double total = task.total_weight();
    if (task.test_cases.empty())
        score = 100;
    else if (total <= 0)
        score = overall.is_accepted() ? 100 : 0;
    else
        score = round_score(min(100.0, passed_weight / total * 100));

    status = overall;
    judged_at = now_timestamp();
}

void judge_result::finalize(const judge_status &status, const optional<error_info> &error) {
    if (this->status.is_final())
        throw logic_error(string("Judge result is already finalized as ") + this->status.display_name());
    if (!status.is_final())
        throw invalid_argument(string("Cannot finalize a judge result as ") + status.display_name());
    this->status = status;
    this->error = error;
    score = 0;
    judged_at = now_timestamp();
}

bool judge_result::operator==(const judge_result &other) const {
    return tie(status, time_used, memory_used, error, test_cases, submission_id, problem_id, user_id, judged_at, score) ==
           tie(other.status, other.time_used, other.memory_used, other.error, other.test_cases, other.submission_id, other.problem_id, other.user_id, other.judged_at, other.score);
}

}  // namespace judgecell
