#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

scoped_guard::scoped_guard() : f() {}
scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}
scoped_guard::scoped_guard(scoped_guard &&other) : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 析构函数不能抛出异常，清理失败只能记录下来
    try {
        f();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Scoped cleanup failed: " << ex.what();
    }
}

scoped_guard scoped_guard::operator+(const std::function<void()> &f) const {
    return scoped_guard(f);
}

void scoped_guard::dismiss() {
    f = nullptr;
}
