#include "judgecell/common/semaphore.hpp"
#include <chrono>

namespace judgecell {
using namespace std;

// 取消令牌没有通知机制，等待时按这个间隔检查一次
static constexpr chrono::milliseconds CANCEL_CHECK_INTERVAL(10);

admission_permit::admission_permit(admission_semaphore *owner)
    : owner(owner) {}

admission_permit::admission_permit(admission_permit &&other) noexcept
    : owner(other.owner) {
    other.owner = nullptr;
}

admission_permit::~admission_permit() {
    if (owner) owner->release();
}

admission_semaphore::admission_semaphore(size_t capacity)
    : total(capacity == 0 ? 1 : capacity), free_slots(total) {}

optional<admission_permit> admission_semaphore::acquire(const cancel_token &token) {
    unique_lock<mutex> lock(mut);
    while (free_slots == 0) {
        if (token.is_cancelled()) return nullopt;
        cond.wait_for(lock, CANCEL_CHECK_INTERVAL);
    }
    if (token.is_cancelled()) return nullopt;
    --free_slots;
    return admission_permit(this);
}

size_t admission_semaphore::available() const {
    lock_guard<mutex> lock(mut);
    return free_slots;
}

size_t admission_semaphore::capacity() const {
    return total;
}

void admission_semaphore::release() {
    {
        lock_guard<mutex> lock(mut);
        ++free_slots;
    }
    cond.notify_one();
}

}  // namespace judgecell
