#pragma once

#include <chrono>
#include <string>

namespace judgecell {

/**
 * @brief 毫秒精度的 UTC 时间戳
 */
using timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

timestamp now_timestamp();

/**
 * @brief 格式化为 RFC 3339 字符串，如 "2024-01-02T03:04:05.678Z"
 */
std::string format_timestamp(timestamp time);

/**
 * @brief 解析 RFC 3339 UTC 字符串，毫秒部分可省略，更高精度的小数部分被截断
 * @throw std::invalid_argument 格式不正确
 */
timestamp parse_timestamp(const std::string &str);

}  // namespace judgecell
