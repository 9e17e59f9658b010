#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include "judgecell/common/cancellation.hpp"

namespace judgecell {

struct admission_semaphore;

/**
 * @brief 沙箱名额，析构时归还给信号量
 */
struct admission_permit {
    admission_permit(admission_permit &&other) noexcept;
    admission_permit(const admission_permit &) = delete;
    admission_permit &operator=(const admission_permit &) = delete;
    ~admission_permit();

private:
    friend struct admission_semaphore;
    explicit admission_permit(admission_semaphore *owner);

    admission_semaphore *owner;
};

/**
 * @brief 有界准入信号量，限制同一台机器上同时存活的沙箱实例数
 */
struct admission_semaphore {
    explicit admission_semaphore(std::size_t capacity);

    /**
     * @brief 获取一个名额，没有空闲名额时阻塞
     * @param token 等待期间若令牌被取消，立即放弃等待
     * @return 名额，若等待被取消则返回 std::nullopt
     */
    std::optional<admission_permit> acquire(const cancel_token &token);

    std::size_t available() const;

    std::size_t capacity() const;

private:
    friend struct admission_permit;
    void release();

    mutable std::mutex mut;
    std::condition_variable cond;
    std::size_t total;
    std::size_t free_slots;
};

}  // namespace judgecell
