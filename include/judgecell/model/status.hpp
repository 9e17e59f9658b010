#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace judgecell {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 只有 PENDING 和 JUDGING 是非终止状态，其余状态一旦得出就不会再变化。
 */
enum class status_code {
    /**
     * @brief 用户程序本测试点评测通过
     * 在 diff-ign-space 比较模式下，行末空白字符和文末空行的差异也会返回 AC。
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * 运行到 时间限制 + 宽限时间 被杀死，或者正常退出但墙上时间超过时间限制。
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序内存峰值达到内存限制
     * 包括被 cgroup 的 OOM killer 杀死的情况。
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序出现运行时错误，具体类型见 runtime_error_kind
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 用户程序无法通过编译
     */
    COMPILATION_ERROR = 5,

    /**
     * @brief 访问受限的操作
     * 本评测系统不会主动返回该结果，沙箱依赖 namespace 和 cgroup 隔离，
     * 保留该值以便与上层系统的结果定义保持一致。
     */
    RESTRICTED_OPERATION = 6,

    /**
     * @brief 用户程序 stdout 和 stderr 合计输出超过捕获上限
     */
    OUTPUT_LIMIT_EXCEEDED = 7,

    /**
     * @brief 内部错误，评测系统出错
     * 比如 rootfs 创建失败、config.json 写入失败、runc 启动失败。
     */
    SYSTEM_ERROR = 8,

    /**
     * @brief 提交正在等待队列中
     */
    PENDING = 9,

    /**
     * @brief 提交正在评测中
     */
    JUDGING = 10,

    /**
     * @brief 评测任务被取消
     */
    CANCELLED = 11
};

/**
 * @brief 运行时错误的具体类型
 */
enum class runtime_error_kind {
    SEGMENTATION_FAULT = 0,
    FLOATING_POINT_EXCEPTION = 1,
    DIVISION_BY_ZERO = 2,
    ASSERTION_FAILED = 3,
    STACK_OVERFLOW = 4,
    NULL_POINTER_DEREFERENCE = 5,
    FILE_OPERATION_ERROR = 6,
    PERMISSION_DENIED = 7,
    OTHER = 8
};

/**
 * @brief 评测状态，只有 RUNTIME_ERROR 携带 runtime_error_kind
 */
struct judge_status {
    /**
     * @brief 构造不带附加信息的评测状态
     * RUNTIME_ERROR 将携带 runtime_error_kind::OTHER
     */
    judge_status(status_code code = status_code::PENDING);

    static judge_status runtime_error(runtime_error_kind kind);

    status_code code() const;

    /**
     * @brief 运行时错误的类型，不是运行时错误时返回 std::nullopt
     */
    std::optional<runtime_error_kind> runtime_error_type() const;

    bool is_accepted() const;

    /**
     * @brief 是否为终止状态（不是 PENDING 或 JUDGING）
     */
    bool is_final() const;

    /**
     * @brief 是否为错误状态（TLE、MLE、RE、CE、RO、OLE、SE），不包括 WA
     */
    bool is_error() const;

    bool is_runtime_error() const;

    /**
     * @brief 用于展示的名称，如 "Wrong Answer"
     */
    const char *display_name() const;

    /**
     * @brief 简写，如 "WA"
     */
    const char *short_code() const;

    bool operator==(const judge_status &other) const;
    bool operator!=(const judge_status &other) const;

private:
    status_code status;
    runtime_error_kind kind;
};

std::ostream &operator<<(std::ostream &os, const judge_status &status);

/**
 * @brief 运行时错误类型的描述，如 "Segmentation fault"
 */
const char *get_display_message(runtime_error_kind kind);

/**
 * @brief 状态码在 JSON 中的名称，如 "TimeLimitExceeded"
 */
const char *get_serial_name(status_code code);

const char *get_serial_name(runtime_error_kind kind);

/**
 * @throw std::invalid_argument 名称无法识别
 */
status_code parse_status_code(const std::string &name);

/**
 * @throw std::invalid_argument 名称无法识别
 */
runtime_error_kind parse_runtime_error_kind(const std::string &name);

}  // namespace judgecell
