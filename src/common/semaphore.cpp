#include "common/semaphore.hpp"
#include <glog/logging.h>

namespace grader {
using namespace std;

counting_semaphore::counting_semaphore(size_t count)
    : total(count), count(count) {}

void counting_semaphore::acquire() {
    unique_lock<mutex> lock(mut);
    cond.wait(lock, [this] { return count > 0; });
    --count;
}

void counting_semaphore::release() {
    {
        lock_guard<mutex> lock(mut);
        // 多归还说明有调用方重复释放，这会破坏槽位上限
        CHECK_LT(count, total) << "counting_semaphore released more times than acquired";
        ++count;
    }
    cond.notify_one();
}

size_t counting_semaphore::available() {
    lock_guard<mutex> lock(mut);
    return count;
}

size_t counting_semaphore::capacity() const {
    return total;
}

}  // namespace grader
