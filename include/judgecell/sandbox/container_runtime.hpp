#pragma once

#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace judgecell {

/**
 * @brief 容器中进程的退出状态
 */
struct container_exit {
    /**
     * @brief 进程返回值，被信号杀死时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 导致进程退出的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 内核统计的进程常驻内存峰值（KB），来自 wait4 的 rusage
     */
    std::uint64_t max_rss_kb = 0;
};

/**
 * @brief 容器的资源统计，在容器删除前读取
 */
struct container_usage {
    /**
     * @brief cgroup 统计的内存峰值（KB），无法读取时为空
     */
    std::optional<std::uint64_t> peak_memory_kb;

    /**
     * @brief 容器内是否有进程被 OOM killer 杀死
     */
    bool oom_killed = false;
};

/**
 * @brief 容器运行时接口
 * 把 bundle（config.json + rootfs）交给具体的隔离后端执行，
 * 后端可以被替换而不影响 config.json 的生成和评测结果的判定。
 * 所有方法在后端出错时抛出 backend_error。
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 根据 bundle 创建容器，容器进程创建后暂停，等待 start
     * @param id 容器 id，每次执行都必须重新生成
     * @param bundle bundle 路径
     * @param stdin_fd 容器进程的标准输入
     * @param stdout_fd 容器进程的标准输出
     * @param stderr_fd 容器进程的标准错误输出
     * @return 容器进程在宿主机上的 pid
     */
    virtual pid_t create(const std::string &id, const std::filesystem::path &bundle, int stdin_fd, int stdout_fd, int stderr_fd) = 0;

    /**
     * @brief 开始执行容器进程
     */
    virtual void start(const std::string &id) = 0;

    /**
     * @brief 等待容器进程退出
     * @param timeout 最长等待时间，为 0 时不阻塞
     * @return 容器进程的退出状态，超时仍未退出时返回 std::nullopt
     */
    virtual std::optional<container_exit> wait(const std::string &id, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 强制杀死容器内的所有进程
     */
    virtual void terminate(const std::string &id) = 0;

    /**
     * @brief 读取容器的资源统计，必须在 remove 之前调用
     */
    virtual container_usage usage(const std::string &id) = 0;

    /**
     * @brief 从后端删除容器的注册信息，容器不存在时不报错
     */
    virtual void remove(const std::string &id) = 0;
};

}  // namespace judgecell
