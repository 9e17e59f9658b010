#pragma once

#include <atomic>
#include <memory>

namespace judgecell {

/**
 * @brief 取消令牌
 * 令牌可被复制，所有副本共享同一个取消标记。评测任务的所有沙箱执行
 * 持有同一个令牌的副本，信号处理或上层队列调用 cancel() 后，
 * 等待沙箱名额和等待进程结束的循环都会尽快退出。
 */
struct cancel_token {
    cancel_token();

    /**
     * @brief 标记取消，可以在任何线程（包括信号处理函数所在线程）中调用
     */
    void cancel() const noexcept;

    bool is_cancelled() const noexcept;

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

/**
 * @brief 收到 SIGINT 或 SIGTERM 时取消 token
 * 进程内只保留最后一次注册的令牌。
 */
void cancel_on_signals(const cancel_token &token);

}  // namespace judgecell
