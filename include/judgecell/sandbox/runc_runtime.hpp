#pragma once

#include <map>
#include <mutex>
#include "judgecell/sandbox/container_runtime.hpp"

namespace judgecell {

/**
 * @brief 基于 runc 的容器运行时
 * runc create --bundle B --pid-file P ID 创建容器（标准输入输出直接传给容器进程），
 * runc start ID 开始执行，runc kill ID KILL 杀死容器，runc delete --force ID 删除容器。
 * 容器进程在 runc create 退出后被托管给本进程，因此本进程必须是 child subreaper，
 * 才能通过 wait4 拿到容器进程的退出状态和 rusage。
 */
struct runc_runtime : public container_runtime {
    /**
     * @param runtime_path runc 可执行文件路径
     * @param cgroup_root cgroup 文件系统挂载点
     */
    explicit runc_runtime(const std::string &runtime_path, const std::filesystem::path &cgroup_root = "/sys/fs/cgroup");

    pid_t create(const std::string &id, const std::filesystem::path &bundle, int stdin_fd, int stdout_fd, int stderr_fd) override;
    void start(const std::string &id) override;
    std::optional<container_exit> wait(const std::string &id, std::chrono::milliseconds timeout) override;
    void terminate(const std::string &id) override;
    container_usage usage(const std::string &id) override;
    void remove(const std::string &id) override;

private:
    struct container_state {
        pid_t pid;
        std::optional<container_exit> exit;
    };

    pid_t pid_of(const std::string &id);

    std::string runtime_path;
    std::filesystem::path cgroup_root;
    std::mutex mut;
    std::map<std::string, container_state> containers;
};

/**
 * @brief 将本进程设为 child subreaper，使容器进程退出后由本进程回收
 * @throw std::system_error prctl 失败
 */
void become_subreaper();

}  // namespace judgecell
