#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行代码块
 * @code{.cpp}
 *     lock_session(s);
 *     defer { unlock_session(s); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = tci::scoped_guard() + [&]

namespace tci {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace tci
