#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace judgecell {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测环境的错误
 * 评测环境（文件系统、沙箱配置、容器运行时）出现的问题，与选手程序无关。
 * 这类错误最终都会被报告为 SystemError，且整个评测任务允许重试。
 */
struct environment_error : public judge_exception {
    environment_error();
    explicit environment_error(const std::string &message);
};

/**
 * @brief 沙箱根文件系统无法创建，或者目标路径被之前未清理的沙箱占用
 */
struct provision_error : public environment_error {
    explicit provision_error(const std::string &message);
};

/**
 * @brief 沙箱配置文件 config.json 无法生成或写入
 */
struct spec_error : public environment_error {
    explicit spec_error(const std::string &message);
};

/**
 * @brief 容器运行时出错
 * 比如 runc 不存在、runc 崩溃、runc 拒绝了配置文件
 */
struct backend_error : public environment_error {
    explicit backend_error(const std::string &message);
};

}  // namespace judgecell
