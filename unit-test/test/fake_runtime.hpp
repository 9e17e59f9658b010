#pragma once

#include <gmock/gmock.h>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "judgecell/sandbox/container_runtime.hpp"

namespace judgecell::test {

/**
 * @brief 直接在宿主机上执行 bundle 中 process.args 的容器运行时
 * 沙箱内的挂载点路径会被替换为宿主机上对应的源路径，
 * 进程运行在独立的进程组中，terminate 时杀死整个进程组。
 * 不做资源限制，也不统计 cgroup 内存。
 */
struct fake_runtime : public container_runtime {
    /**
     * @brief 在执行前改写命令，比如把编译器替换为宿主机上的 shell 脚本
     */
    typedef std::function<std::vector<std::string>(const std::vector<std::string> &)> command_rewriter;

    explicit fake_runtime(command_rewriter rewriter = nullptr);

    pid_t create(const std::string &id, const std::filesystem::path &bundle, int stdin_fd, int stdout_fd, int stderr_fd) override;

    void start(const std::string &id) override;

    std::optional<container_exit> wait(const std::string &id, std::chrono::milliseconds timeout) override;

    void terminate(const std::string &id) override;

    container_usage usage(const std::string &id) override;

    void remove(const std::string &id) override;

    /**
     * @brief 已创建但尚未 remove 的容器数
     */
    std::size_t alive() const;

    /**
     * @brief 曾经创建过的容器数
     */
    std::size_t created() const;

private:
    struct process {
        pid_t pid = -1;
        int start_fd = -1;
        std::optional<container_exit> exit;
    };

    std::optional<container_exit> reap(process &proc, bool block);

    command_rewriter rewriter;
    mutable std::mutex mut;
    std::map<std::string, process> processes;
    std::size_t created_count = 0;
};

/**
 * @brief 委托给 fake_runtime 的 mock，用于检查 create 和 remove 的调用
 */
struct mock_runtime : public fake_runtime {
    explicit mock_runtime(command_rewriter rewriter = nullptr);

    MOCK_METHOD(pid_t, create, (const std::string &id, const std::filesystem::path &bundle, int stdin_fd, int stdout_fd, int stderr_fd), (override));
    MOCK_METHOD(void, remove, (const std::string &id), (override));
};

}  // namespace judgecell::test
