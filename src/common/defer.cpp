#include "common/defer.hpp"
#include <glog/logging.h>

namespace executor {

scope_guard::scope_guard() : action() {}

scope_guard::scope_guard(std::function<void()> action) : action(std::move(action)) {}

scope_guard::scope_guard(scope_guard &&other) noexcept : action(std::move(other.action)) {
    other.action = nullptr;
}

scope_guard::~scope_guard() {
    if (!action) return;
    try {
        action();
    } catch (std::exception &ex) {
        // 析构函数不能抛出异常，否则在栈展开时会直接 terminate
        LOG(ERROR) << "Deferred action failed: " << ex.what();
    }
}

scope_guard scope_guard::operator+(std::function<void()> action) const {
    return scope_guard(std::move(action));
}

void scope_guard::dismiss() {
    action = nullptr;
}

}  // namespace executor
