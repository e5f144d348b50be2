#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在作用域结束时执行一段代码，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     int fd = open(path, O_RDONLY);
 *     defer { close(fd); };
 * @endcode
 */
#define defer auto DEFER_0(_deferred_action) = executor::scope_guard() + [&]

namespace executor {

struct scope_guard {
    scope_guard();
    explicit scope_guard(std::function<void()> action);
    scope_guard(scope_guard &&other) noexcept;
    scope_guard(const scope_guard &) = delete;
    ~scope_guard();

    scope_guard &operator=(const scope_guard &) = delete;

    scope_guard operator+(std::function<void()> action) const;

    /**
     * @brief 取消执行
     */
    void dismiss();

private:
    std::function<void()> action;
};

}  // namespace executor
