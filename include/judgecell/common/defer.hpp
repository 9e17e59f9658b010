#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = judgecell::scoped_guard() + [&]

namespace judgecell {

/**
 * @brief 作用域结束时执行回调
 * 沙箱的清理（删除容器注册、删除 rootfs）依赖这个类保证在任何退出路径上都会执行。
 * 回调内不允许抛出异常，析构时若回调抛出异常将被记录并吞掉。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace judgecell
