#include "sandbox/pool.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

scoped_sandbox::scoped_sandbox(sandbox_pool &pool, shared_ptr<sandbox_handle> handle)
    : pool(&pool), sandbox(move(handle)) {}

scoped_sandbox::scoped_sandbox(scoped_sandbox &&other)
    : pool(other.pool), sandbox(move(other.sandbox)) {
    other.pool = nullptr;
}

scoped_sandbox::~scoped_sandbox() {
    try {
        release();
    } catch (grader_exception &ex) {
        LOG(ERROR) << "Unable to release sandbox during cleanup: " << ex;
    }
}

sandbox_handle &scoped_sandbox::operator*() const {
    return *sandbox;
}

sandbox_handle *scoped_sandbox::operator->() const {
    return sandbox.get();
}

const shared_ptr<sandbox_handle> &scoped_sandbox::handle() const {
    return sandbox;
}

void scoped_sandbox::release() {
    if (!pool || !sandbox) return;
    sandbox_pool *owner = pool;
    pool = nullptr;
    owner->give_back(*sandbox);
}

sandbox_pool::sandbox_pool(const string &name, sandbox_runtime &runtime, size_t slots, const provision_policy &policy)
    : pool_name(name), rt(runtime), slots(slots), policy(policy) {}

scoped_sandbox sandbox_pool::acquire(const resource_limits &limits) {
    slots.acquire();
    scoped_guard slot_guard([this] { slots.release(); });

    auto backoff = policy.backoff;
    for (int attempt = 1;; ++attempt) {
        try {
            auto handle = rt.acquire(limits);
            slot_guard.dismiss();
            return scoped_sandbox(*this, handle);
        } catch (provisioning_error &ex) {
            if (attempt >= policy.attempts) {
                LOG(ERROR) << "[pool " << pool_name << "] Unable to provision sandbox after " << attempt << " attempt(s): " << ex.what();
                throw;
            }
            LOG(WARNING) << "[pool " << pool_name << "] Provisioning attempt " << attempt << " failed, retrying in "
                         << backoff.count() << "ms: " << ex.what();
            this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
}

void sandbox_pool::give_back(sandbox_handle &handle) {
    defer { slots.release(); };
    rt.release(handle);
}

const string &sandbox_pool::name() const {
    return pool_name;
}

size_t sandbox_pool::available() {
    return slots.available();
}

size_t sandbox_pool::capacity() const {
    return slots.capacity();
}

}  // namespace grader
