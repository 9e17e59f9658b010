#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace judgecell {

/**
 * @brief 评测出错时的详细信息
 */
struct error_info {
    /**
     * @brief 人类可读的错误描述
     */
    std::string message;

    /**
     * @brief 错误代码，如编译器给出的错误编号
     */
    std::optional<std::string> code;

    /**
     * @brief 出错的源代码行号
     */
    std::optional<std::uint32_t> line;

    /**
     * @brief 出错的源代码列号
     */
    std::optional<std::uint32_t> column;

    /**
     * @brief 被捕获的标准错误输出，长度受捕获上限约束
     */
    std::optional<std::string> error_output;

    /**
     * @brief 被捕获的标准输出，长度受捕获上限约束
     */
    std::optional<std::string> standard_output;

    /**
     * @brief 进程返回值
     */
    std::optional<int> exit_code;

    /**
     * @brief 导致进程退出的信号
     */
    std::optional<int> signal;

    static error_info from_message(const std::string &message);

    /**
     * @brief 以 stderr 同时作为错误描述和附带的标准错误输出
     */
    static error_info from_stderr(const std::string &error_output);

    static error_info compilation_error(const std::string &message, const std::optional<std::string> &error_output);

    static error_info runtime_error(const std::string &message, int signal, const std::optional<std::string> &error_output);

    /**
     * @brief 将附带的 stdout 和 stderr 截断到 limit 字节以内
     * @return *this
     */
    error_info &cap_streams(std::size_t limit);

    bool operator==(const error_info &other) const;
    bool operator!=(const error_info &other) const;
};

}  // namespace judgecell
