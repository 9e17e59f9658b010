#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "judgecell/common/cancellation.hpp"
#include "judgecell/common/semaphore.hpp"
#include "judgecell/sandbox/container_runtime.hpp"
#include "judgecell/sandbox/runtime_spec.hpp"

namespace judgecell {

/**
 * @brief 一次沙箱执行的原始结果，由 classify 判定评测状态
 */
struct execution_outcome {
    /**
     * @brief 本次执行的沙箱实例 id
     */
    std::string instance_id;

    /**
     * @brief 进程返回值，被信号杀死时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 导致进程退出的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 墙上时间（毫秒），从 start 到进程退出
     */
    std::uint64_t wall_time_ms = 0;

    /**
     * @brief 内存峰值（KB），取 rusage 和 cgroup 统计的较大值，OOM 时至少为内存限制
     */
    std::uint64_t memory_kb = 0;

    std::string output;
    std::string error_output;

    /**
     * @brief 到达 时间限制 + 宽限时间 后被强制杀死
     */
    bool timed_out = false;

    /**
     * @brief stdout 与 stderr 合计达到捕获上限后被强制杀死
     */
    bool output_limit_exceeded = false;

    /**
     * @brief 等待名额或等待进程结束时任务被取消
     */
    bool cancelled = false;

    /**
     * @brief cgroup 记录到 OOM kill
     */
    bool oom_killed = false;
};

/**
 * @brief 沙箱执行器
 * 每次 execute 都生成新的实例 id 和私有的 bundle 目录，
 * 执行结束后无论结果如何都会删除容器注册信息和 bundle 目录。
 * 多个线程可以同时调用 execute，同时存活的沙箱数受准入信号量限制。
 */
struct sandbox {
    /**
     * @param runtime 容器运行时
     * @param semaphore 沙箱准入信号量
     * @param bundle_root 存放 bundle 的目录
     */
    sandbox(container_runtime &runtime, admission_semaphore &semaphore, const std::filesystem::path &bundle_root);

    /**
     * @brief 在新的沙箱中执行命令
     * @param spec 命令和限制
     * @param input 标准输入内容
     * @param token 取消令牌
     * @return 执行结果，超时、输出超限、取消都是正常的结果而不是异常
     * @throw environment_error rootfs 创建失败、config.json 写入失败、容器运行时出错
     */
    execution_outcome execute(const launch_spec &spec, const std::string &input, const cancel_token &token);

private:
    container_runtime &runtime;
    admission_semaphore &semaphore;
    std::filesystem::path bundle_root;
};

}  // namespace judgecell
