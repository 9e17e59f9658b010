#pragma once

#include <filesystem>
#include "judgecell/common/cancellation.hpp"
#include "judgecell/judge/classifier.hpp"
#include "judgecell/model/submission.hpp"
#include "judgecell/sandbox/sandbox.hpp"

namespace judgecell {

/**
 * @brief 评测一个评测任务
 * 需要编译时先在沙箱中编译（/program 可写），编译失败则直接以 CE 结束，不运行任何测试点；
 * 否则对每个测试点在新的沙箱中运行选手程序（/program 只读，工作目录为 /workspace），
 * 判定结果后按测试点在任务中的顺序记录。
 *
 * 整体状态：所有测试点 AC 时为 AC，否则为按任务顺序第一个未 AC 的测试点的状态，
 * 与测试点的完成顺序和错误的严重程度无关。
 * 评测环境出错时整体状态为 SystemError，整个任务会重试 SYSTEM_ERROR_RETRIES 次。
 * 任务被取消时整体状态为 Cancelled，分数为 0。
 */
struct evaluator {
    /**
     * @param box 执行编译和运行的沙箱
     * @param task_root 存放选手代码和编译产物的目录
     */
    evaluator(sandbox &box, const std::filesystem::path &task_root);

    /**
     * @brief 评测任务，不会抛出评测环境相关的异常
     * @param task 评测任务
     * @param token 取消令牌
     * @return 最终的评测结果
     */
    judge_result evaluate(const judge_task &task, const cancel_token &token);

private:
    judge_result evaluate_once(const judge_task &task, const cancel_token &token);

    /**
     * @brief 编译选手程序
     * @return 编译失败时的判定结果，编译成功时返回 std::nullopt
     */
    std::optional<classification> compile(const judge_task &task, const std::filesystem::path &program_dir, const cancel_token &token);

    test_case_result run_test_case(const judge_task &task, const test_case &tc, const std::filesystem::path &program_dir, const cancel_token &token);

    /**
     * @brief 运行所有测试点，返回按任务顺序排列的结果
     * 快速失败时，第一个未 AC 的测试点之后的测试点不会被记录
     */
    std::vector<test_case_result> run_test_cases(const judge_task &task, const std::filesystem::path &program_dir, const cancel_token &token);

    sandbox &box;
    std::filesystem::path task_root;
};

}  // namespace judgecell
