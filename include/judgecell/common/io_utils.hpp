#pragma once

#include <filesystem>
#include <string>

namespace judgecell {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将 content 写入文件，若文件已存在则覆盖
 * @throw std::system_error 文件无法打开或写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，由于评测系统
 * 运行时需要 root 权限，如果拿到的文件名包含 "../"，那么
 * 最后有可能导致系统重要文件被覆盖导致安全问题。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 截断字符串到至多 limit 字节，且不会切断 UTF-8 多字节字符
 */
std::string truncate_utf8(const std::string &str, std::size_t limit);

/**
 * @brief 检查 str 是否为合法的 UTF-8 编码（RFC 3629）
 * 过长编码、代理区码点和超过 U+10FFFF 的码点都不合法。
 */
bool is_valid_utf8(const std::string &str);

}  // namespace judgecell
