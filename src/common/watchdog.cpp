#include "common/watchdog.hpp"
#include <glog/logging.h>
#include <exception>

namespace grader {
using namespace std;

watchdog::watchdog() {
    thd = thread([this] { loop(); });
}

watchdog::~watchdog() {
    {
        lock_guard<mutex> lock(mut);
        stopped = true;
    }
    cond.notify_all();
    thd.join();
}

watchdog::timer_id watchdog::schedule(clock::time_point deadline, function<void()> callback) {
    timer_id id;
    {
        lock_guard<mutex> lock(mut);
        id = next_id++;
        timers.emplace(deadline, make_pair(id, move(callback)));
    }
    cond.notify_all();
    return id;
}

bool watchdog::cancel(timer_id id) {
    unique_lock<mutex> lock(mut);
    for (auto it = timers.begin(); it != timers.end(); ++it) {
        if (it->second.first == id) {
            timers.erase(it);
            return true;
        }
    }
    // 定时器已经触发，等待回调结束
    finished.wait(lock, [&] { return running_id != id; });
    return false;
}

size_t watchdog::pending() {
    lock_guard<mutex> lock(mut);
    return timers.size();
}

void watchdog::loop() {
    unique_lock<mutex> lock(mut);
    while (!stopped) {
        if (timers.empty()) {
            cond.wait(lock);
            continue;
        }

        auto deadline = timers.begin()->first;
        if (clock::now() < deadline) {
            cond.wait_until(lock, deadline);
            continue;
        }

        auto [id, callback] = move(timers.begin()->second);
        timers.erase(timers.begin());
        running_id = id;
        lock.unlock();

        try {
            callback();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Watchdog timer " << id << " failed: " << ex.what();
        }

        lock.lock();
        running_id = 0;
        finished.notify_all();
    }
}

}  // namespace grader
