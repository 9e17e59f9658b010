#pragma once

#include <boost/uuid/uuid.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "judgecell/model/error_info.hpp"
#include "judgecell/model/language.hpp"
#include "judgecell/model/status.hpp"
#include "judgecell/model/timestamp.hpp"

namespace judgecell {

/**
 * @brief 选手提交
 * 是否需要编译、默认编译选项、默认运行命令都由 lang 推出，不单独保存。
 */
struct submission {
    boost::uuids::uuid id;
    boost::uuids::uuid problem_id;
    boost::uuids::uuid user_id;

    /**
     * @brief 比赛提交的比赛 id
     */
    std::optional<boost::uuids::uuid> contest_id;

    language lang;

    std::string source_code;

    timestamp created_at;

    /**
     * @brief 时间限制，单位为毫秒
     */
    std::uint64_t time_limit;

    /**
     * @brief 内存限制，单位为 KB
     */
    std::uint64_t memory_limit;

    /**
     * @brief 调度优先级，数值越大越优先，评测本身不使用
     */
    int priority;

    /**
     * @brief 创建一个普通提交，生成新的 id，优先级为 0
     */
    static submission create(const boost::uuids::uuid &problem_id, const boost::uuids::uuid &user_id,
                             language lang, const std::string &source_code,
                             std::uint64_t time_limit, std::uint64_t memory_limit);

    /**
     * @brief 创建一个比赛提交，优先级为 10
     */
    static submission for_contest(const boost::uuids::uuid &problem_id, const boost::uuids::uuid &user_id,
                                  const boost::uuids::uuid &contest_id,
                                  language lang, const std::string &source_code,
                                  std::uint64_t time_limit, std::uint64_t memory_limit);

    /**
     * @brief 源代码文件名
     */
    std::string filename() const;

    bool needs_compilation() const;

    std::vector<std::string> default_compile_flags() const;

    const char *default_runtime() const;

    bool operator==(const submission &other) const;
};

/**
 * @brief 测试点
 */
struct test_case {
    std::string id;

    std::string input;

    std::string expected_output;

    /**
     * @brief 本测试点的时间限制（毫秒），为空时使用提交的时间限制
     */
    std::optional<std::uint64_t> time_limit;

    /**
     * @brief 本测试点的内存限制（KB），为空时使用提交的内存限制
     */
    std::optional<std::uint64_t> memory_limit;

    /**
     * @brief 是否对选手隐藏，评测本身不使用
     */
    bool is_hidden = false;

    /**
     * @brief 本测试点的分数权重，非负
     */
    double weight = 1.0;

    static test_case create(const std::string &id, const std::string &input, const std::string &expected_output);

    static test_case hidden(const std::string &id, const std::string &input, const std::string &expected_output);

    static test_case with_limits(const std::string &id, const std::string &input, const std::string &expected_output,
                                 std::uint64_t time_limit, std::uint64_t memory_limit);

    std::uint64_t effective_time_limit(std::uint64_t default_time_limit) const;

    std::uint64_t effective_memory_limit(std::uint64_t default_memory_limit) const;

    bool operator==(const test_case &other) const;
};

/**
 * @brief 评测任务，一个提交及其全部测试点，创建后不再修改
 */
struct judge_task {
    struct submission submission;

    std::vector<test_case> test_cases;

    /**
     * @brief 由提交的语言推出
     */
    bool needs_compilation;

    /**
     * @brief 恒为 true，不存在不使用沙箱的执行路径
     */
    bool use_sandbox = true;

    /**
     * @brief 编译选项，需要编译时默认为语言的默认编译选项
     */
    std::optional<std::vector<std::string>> compile_flags;

    /**
     * @brief 追加给选手程序的运行参数
     */
    std::optional<std::vector<std::string>> runtime_args;

    static judge_task create(const struct submission &submission, const std::vector<test_case> &test_cases);

    std::size_t test_case_count() const;

    double total_weight() const;

    /**
     * @brief 所有测试点中最大的有效时间限制，没有测试点时为提交的时间限制
     */
    std::uint64_t max_time_limit() const;

    /**
     * @brief 所有测试点中最大的有效内存限制，没有测试点时为提交的内存限制
     */
    std::uint64_t max_memory_limit() const;

    bool operator==(const judge_task &other) const;
};

/**
 * @brief 单个测试点的评测结果
 */
struct test_case_result {
    std::string id;
    judge_status status;

    /**
     * @brief 运行时间，单位为毫秒
     */
    std::uint64_t time_used = 0;

    /**
     * @brief 内存峰值，单位为 KB
     */
    std::uint64_t memory_used = 0;

    std::optional<std::string> input;
    std::optional<std::string> expected_output;
    std::optional<std::string> actual_output;
    std::optional<error_info> error;

    bool operator==(const test_case_result &other) const;
};

/**
 * @brief 整个提交的评测结果
 * 生命周期：pending() 创建时为 PENDING，评测开始时 start_judging() 进入 JUDGING，
 * 每完成一个测试点 add_test_case()，最后 finalize() 恰好一次得出最终状态和分数。
 */
struct judge_result {
    judge_status status;

    /**
     * @brief 所有测试点中最长的运行时间（毫秒）
     */
    std::uint64_t time_used = 0;

    /**
     * @brief 所有测试点中最大的内存峰值（KB）
     */
    std::uint64_t memory_used = 0;

    std::optional<error_info> error;

    /**
     * @brief 测试点结果，按评测任务中测试点的顺序排列
     */
    std::vector<test_case_result> test_cases;

    boost::uuids::uuid submission_id;
    boost::uuids::uuid problem_id;
    boost::uuids::uuid user_id;

    timestamp judged_at;

    /**
     * @brief 得分，范围 [0, 100]，保留两位小数
     */
    double score = 0;

    static judge_result pending(const struct submission &submission);

    static judge_result accepted(std::uint64_t time_used, std::uint64_t memory_used,
                                 const boost::uuids::uuid &submission_id, const boost::uuids::uuid &problem_id, const boost::uuids::uuid &user_id);

    static judge_result with_error(const judge_status &status, std::uint64_t time_used, std::uint64_t memory_used,
                                   const error_info &error,
                                   const boost::uuids::uuid &submission_id, const boost::uuids::uuid &problem_id, const boost::uuids::uuid &user_id);

    void add_test_case(const test_case_result &result);

    std::size_t passed_test_cases() const;

    std::size_t total_test_cases() const;

    /**
     * @brief PENDING -> JUDGING
     * @throw std::logic_error 当前状态不是 PENDING
     */
    void start_judging();

    /**
     * @brief 根据已记录的测试点结果得出最终状态和分数
     * 所有测试点 AC 时为 AC，否则为按测试点顺序第一个未 AC 的测试点的状态。
     * 分数为通过的测试点权重之和除以全部测试点权重之和再乘以 100，保留两位小数；
     * 没有测试点时为 AC、100 分；总权重为 0 时全部通过得 100 分，否则 0 分。
     * 运行时间和内存峰值取所有测试点的最大值。
     * @param task 提供测试点的权重，未运行的测试点同样计入总权重
     * @throw std::logic_error 已经得出了最终状态
     */
    void finalize(const judge_task &task);

    /**
     * @brief 以给定状态提前结束评测，分数为 0
     * 用于编译错误、系统错误和取消。
     * @throw std::logic_error 已经得出了最终状态
     */
    void finalize(const judge_status &status, const std::optional<error_info> &error);

    bool operator==(const judge_result &other) const;
};

}  // namespace judgecell
