#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "judgecell/config.hpp"
#include "judgecell/model/error_info.hpp"
#include "judgecell/model/status.hpp"
#include "judgecell/sandbox/sandbox.hpp"

namespace judgecell {

/**
 * @brief 执行阶段
 */
enum class execution_phase {
    COMPILE,
    RUN
};

/**
 * @brief 判定一次执行结果所需的上下文
 */
struct classify_context {
    execution_phase phase = execution_phase::RUN;

    /**
     * @brief 有效时间限制（毫秒）
     */
    std::uint64_t time_limit_ms = 0;

    /**
     * @brief 有效内存限制（KB）
     */
    std::uint64_t memory_limit_kb = 0;

    /**
     * @brief 标准输出，为空时正常退出即为通过（编译、单独执行命令）
     */
    std::optional<std::string> expected_output;

    compare_mode mode = compare_mode::IGNORE_TRAILING_SPACE;

    /**
     * @brief error_info 中附带的 stdout 和 stderr 的长度上限
     */
    std::size_t stream_limit = 0;
};

struct classification {
    judge_status status;
    std::optional<error_info> error;
};

/**
 * @brief 将沙箱执行的原始结果判定为评测状态
 * 按以下优先级判定：
 * 1. 被取消 -> CANCELLED
 * 2. 超过截止时间被杀死，或者墙上时间超过时间限制 -> TLE
 * 3. 内存峰值达到内存限制 -> MLE
 * 4. 输出达到捕获上限 -> OLE
 * 5. 被信号杀死 -> RE，类型由信号和 stderr 决定
 * 6. 返回值非 0 -> RE，类型由 stderr 中解释器的报错决定
 * 7. 比较输出 -> AC 或 WA
 * 编译阶段除 CANCELLED 外的所有失败都判定为 CE，编译器的 stderr 作为诊断信息。
 */
classification classify(const execution_outcome &outcome, const classify_context &context);

/**
 * @brief 比较选手输出和标准输出
 * EXACT 模式要求逐字节相同；IGNORE_TRAILING_SPACE 模式忽略每行末尾的空白字符和文末的空行。
 */
bool compare_output(const std::string &expected, const std::string &actual, compare_mode mode);

/**
 * @brief 根据导致进程退出的信号判断运行时错误类型
 * @param signal 信号
 * @param error_output stderr，用于识别栈溢出等无法仅由信号区分的错误
 */
runtime_error_kind classify_signal(int signal, const std::string &error_output);

/**
 * @brief 根据 stderr 中的解释器或运行时报错判断运行时错误类型
 * @return 无法识别时返回 runtime_error_kind::OTHER
 */
runtime_error_kind classify_error_output(const std::string &error_output);

/**
 * @brief 从编译器输出中找出第一个错误的位置，填入 info 的 line、column 和 code
 * 支持 gcc/clang/go (file:line:col:)、javac (File.java:line: error:)、
 * tsc (file(line,col): error TSxxxx:) 和 rustc (error[Exxxx] 之后的 --> file:line:col)。
 * 找不到时 info 保持不变。
 */
void locate_compile_error(const std::string &diagnostic, error_info &info);

}  // namespace judgecell
