#include "sandbox/cgroup_runtime.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <cstring>
#include <fstream>
#include <mutex>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/cgroup.hpp"
#include "sandbox/spawn.hpp"

namespace grader {
using namespace std;

static const chrono::milliseconds RELEASE_KILL_TIMEOUT(1000);
static const chrono::milliseconds TERMINATE_KILL_TIMEOUT(100);
static const chrono::milliseconds KILL_INTERVAL(10);

cgroup_sandbox_runtime::cgroup_sandbox_runtime(const runtime_options &options)
    : sandbox_runtime(options) {
    static once_flag init_flag;
    call_once(init_flag, cgroup_guard::init);
}

string cgroup_sandbox_runtime::name() const {
    return "cgroup";
}

string cgroup_sandbox_runtime::cgroup_name(const string &sandbox_id) const {
    return fmt::format("/{}/{}", options.cgroup_parent, sandbox_id);
}

shared_ptr<sandbox_handle> cgroup_sandbox_runtime::acquire(const resource_limits &limits) {
    auto handle = make_shared<sandbox_handle>();
    handle->id = "sandbox_" + random_uuid();
    handle->limits = limits;
    string cgroup = cgroup_name(handle->id);

    try {
        cgroup_guard cg(cgroup);

        // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
        cgroup_ctrl memory = cg.add_controller("memory");
        if (limits.memory >= 0) {
            memory.add_value("memory.limit_in_bytes", limits.memory);
            memory.add_value("memory.memsw.limit_in_bytes", limits.memory);
        }

        cgroup_ctrl pids = cg.add_controller("pids");
        if (limits.proc_limit > 0)
            pids.add_value("pids.max", (int64_t)limits.proc_limit);

        // 我们要统计学生程序的运行时间
        cg.add_controller("cpuacct");

        cg.create_cgroup(1);
    } catch (cgroup_exception &e) {
        throw provisioning_error(fmt::format("Unable to create cgroup {}: {}", cgroup, e.what()));
    }

    try {
        handle->root = create_sandbox_dir(handle->id);
    } catch (provisioning_error &) {
        try {
            cgroup_guard cg(cgroup);
            cg.get_cgroup();
            cg.delete_cgroup();
        } catch (cgroup_exception &e) {
            LOG(ERROR) << "Unable to delete cgroup " << cgroup << ": " << e.what();
        }
        throw;
    }

    lock_guard<mutex> guard(mut);
    cgroups[handle->id] = cgroup;
    LOG(INFO) << "Acquired sandbox " << handle->id << " in cgroup " << cgroup;
    return handle;
}

size_t cgroup_sandbox_runtime::kill_tasks(const string &cgroup, chrono::milliseconds timeout) {
    elapsed_time timer;
    while (true) {
        vector<pid_t> tasks = cgroup_tasks(cgroup, "memory");
        if (tasks.empty()) return 0;
        if (timer.duration<chrono::milliseconds>() >= timeout) return tasks.size();
        for (pid_t pid : tasks)
            if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(ERROR) << "Unable to send SIGKILL to " << pid << ": " << strerror(errno);
        this_thread::sleep_for(KILL_INTERVAL);
    }
}

void cgroup_sandbox_runtime::release(sandbox_handle &handle) {
    string cgroup;
    {
        lock_guard<mutex> guard(mut);
        if (handle.released) return;
        handle.released = true;
        auto it = cgroups.find(handle.id);
        if (it == cgroups.end()) return;
        cgroup = it->second;
        cgroups.erase(it);
    }

    size_t survivors;
    try {
        // 杀死 cgroup 内所有的进程，确保沙箱销毁后不会有进程存活
        survivors = kill_tasks(cgroup, RELEASE_KILL_TIMEOUT);
    } catch (cgroup_exception &e) {
        remove_sandbox_dir(handle);
        throw sandbox_error(fmt::format("Unable to list tasks of cgroup {}: {}", cgroup, e.what()));
    }

    remove_sandbox_dir(handle);

    if (survivors > 0) {
        // 保留 cgroup，删除 cgroup 会把进程移到上一层而失去资源限制
        LOG(ERROR) << "Sandbox " << handle.id << " leaked " << survivors << " process(es), cgroup " << cgroup << " is kept";
        throw leak_detected_error(handle.id, survivors);
    }

    try {
        cgroup_guard cg(cgroup);
        cg.get_cgroup();
        cg.delete_cgroup();
    } catch (cgroup_exception &e) {
        throw sandbox_error(fmt::format("Unable to delete cgroup {}: {}", cgroup, e.what()));
    }
    LOG(INFO) << "Released sandbox " << handle.id;
}

spawned_process cgroup_sandbox_runtime::spawn(sandbox_handle &handle, const spawn_request &request) {
    if (!request.working_dir.empty() && !is_safe_path(request.working_dir))
        throw sandbox_error("Unsafe working directory " + request.working_dir);

    string cgroup;
    {
        lock_guard<mutex> guard(mut);
        auto it = cgroups.find(handle.id);
        if (handle.released || it == cgroups.end())
            throw sandbox_error("Sandbox " + handle.id + " has been released");
        cgroup = it->second;
    }

    child_setup setup;
    setup.argv = request.argv;
    setup.env = make_environment(request.env);
    setup.work_dir = request.working_dir.empty() ? handle.root : handle.root / request.working_dir;
    // 内存由 cgroup 限制，只有命令的限制比沙箱更严格时才需要 RLIMIT_AS
    bool tighter_memory = request.limits.memory >= 0 &&
                          (handle.limits.memory < 0 || request.limits.memory < handle.limits.memory);
    setup.rlimits = make_rlimits(request.limits, tighter_memory, false);
    setup.isolate_network = !request.limits.network;
    setup.user_id = options.user_id;
    setup.group_id = options.group_id;

    return fork_child(setup, [&](pid_t pid) {
        try {
            cgroup_guard cg(cgroup);
            cg.get_cgroup();
            cg.attach_task_pid(pid);
        } catch (cgroup_exception &e) {
            throw sandbox_error(fmt::format("Unable to attach {} to cgroup {}: {}", pid, cgroup, e.what()));
        }
    });
}

void cgroup_sandbox_runtime::terminate(sandbox_handle &handle) {
    string cgroup;
    {
        lock_guard<mutex> guard(mut);
        auto it = cgroups.find(handle.id);
        if (it == cgroups.end()) return;
        cgroup = it->second;
    }
    try {
        size_t survivors = kill_tasks(cgroup, TERMINATE_KILL_TIMEOUT);
        if (survivors > 0)
            LOG(WARNING) << "Sandbox " << handle.id << " still has " << survivors << " process(es) after termination";
    } catch (cgroup_exception &e) {
        LOG(ERROR) << "Unable to terminate sandbox " << handle.id << ": " << e.what();
    }
}

size_t cgroup_sandbox_runtime::oom_kill_count(sandbox_handle &handle) {
    string cgroup;
    {
        lock_guard<mutex> guard(mut);
        auto it = cgroups.find(handle.id);
        if (it == cgroups.end()) return 0;
        cgroup = it->second;
    }

    size_t count = 0;
    ifstream fin("/sys/fs/cgroup/memory" + cgroup + "/memory.oom_control");
    while (fin.good()) {
        string token;
        fin >> token;
        if (token == "oom_kill")
            fin >> count;
    }
    return count;
}

}  // namespace grader
