#include "sandbox/process_runtime.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <shared_mutex>
#include <sstream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/spawn.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

// 杀死进程后等待进程退出的总时间和检查间隔
static const chrono::milliseconds VERIFY_TIMEOUT(1000);
static const chrono::milliseconds VERIFY_INTERVAL(10);

vector<process_entry> scan_processes() {
    vector<process_entry> processes;
    error_code ec;
    for (auto &entry : fs::directory_iterator("/proc", ec)) {
        string name = entry.path().filename().string();
        if (name.empty() || !all_of(name.begin(), name.end(), ::isdigit)) continue;

        // 格式为 "pid (comm) state ppid pgrp ..."，comm 可能包含空格和括号
        ifstream fin(entry.path() / "stat");
        string stat;
        if (!getline(fin, stat)) continue;  // 进程已经退出
        auto pos = stat.rfind(')');
        if (pos == string::npos) continue;
        istringstream sin(stat.substr(pos + 1));
        process_entry process;
        process.pid = stoi(name);
        if (!(sin >> process.state >> process.ppid >> process.pgrp)) continue;
        processes.push_back(process);
    }
    if (ec) throw sandbox_error("Unable to scan /proc: " + ec.message());
    return processes;
}

static bool is_alive(const process_entry &process) {
    return process.state != 'Z' && process.state != 'X';
}

size_t count_live_processes(const set<pid_t> &process_groups) {
    if (process_groups.empty()) return 0;
    size_t count = 0;
    for (auto &process : scan_processes())
        if (is_alive(process) && process_groups.count(process.pgrp)) ++count;
    return count;
}

static void kill_groups(const set<pid_t> &process_groups) {
    for (pid_t pgid : process_groups) {
        if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "Unable to send SIGKILL to process group " << pgid << ": " << strerror(errno);
    }
}

process_sandbox_runtime::process_sandbox_runtime(const runtime_options &options)
    : sandbox_runtime(options) {
    // 逃出进程组的进程在父进程退出后由本进程收养，而不是 init
    if (prctl(PR_SET_CHILD_SUBREAPER, 1) != 0)
        LOG(WARNING) << "Unable to become child subreaper, processes escaping their process group cannot be cleaned up: " << strerror(errno);
}

size_t process_sandbox_runtime::reap_orphans(const vector<process_entry> &processes, const set<pid_t> &released_leaders) {
    set<pid_t> leaders = released_leaders;
    {
        lock_guard<mutex> guard(mut);
        for (auto &[id, process_groups] : groups)
            leaders.insert(process_groups.begin(), process_groups.end());
    }

    pid_t self = getpid();
    size_t alive = 0;
    for (auto &process : processes) {
        // 命令的组长由执行器回收
        if (process.ppid != self || leaders.count(process.pid)) continue;
        if (is_alive(process)) {
            ++alive;
            if (kill(process.pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(ERROR) << "Unable to send SIGKILL to orphan process " << process.pid << ": " << strerror(errno);
        } else if (waitpid(process.pid, nullptr, WNOHANG) < 0 && errno != ECHILD) {
            LOG(ERROR) << "Unable to reap orphan process " << process.pid << ": " << strerror(errno);
        }
    }
    return alive;
}

string process_sandbox_runtime::name() const {
    return "process";
}

shared_ptr<sandbox_handle> process_sandbox_runtime::acquire(const resource_limits &limits) {
    auto handle = make_shared<sandbox_handle>();
    handle->id = "sandbox_" + random_uuid();
    handle->limits = limits;
    handle->root = create_sandbox_dir(handle->id);

    if (!limits.network && geteuid() != 0)
        LOG(WARNING) << "Sandbox " << handle->id << " cannot isolate network without root privileges";

    lock_guard<mutex> guard(mut);
    groups[handle->id];
    LOG(INFO) << "Acquired sandbox " << handle->id << " at " << handle->root;
    return handle;
}

void process_sandbox_runtime::release(sandbox_handle &handle) {
    set<pid_t> process_groups;
    {
        lock_guard<mutex> guard(mut);
        if (handle.released) return;
        handle.released = true;
        auto it = groups.find(handle.id);
        if (it != groups.end()) {
            process_groups = move(it->second);
            groups.erase(it);
        }
    }

    // 扫描与杀死孤儿进程期间不能有新的命令启动，否则刚 fork 出来还没有登记的组长会被当作孤儿
    unique_lock<shared_mutex> sweep(spawning);
    auto sweep_once = [&] {
        kill_groups(process_groups);
        auto processes = scan_processes();
        size_t count = reap_orphans(processes, process_groups);
        for (auto &process : processes)
            if (is_alive(process) && process_groups.count(process.pgrp)) ++count;
        return count;
    };

    size_t survivors = sweep_once();
    for (elapsed_time timer; survivors > 0 && timer.duration<chrono::milliseconds>() < VERIFY_TIMEOUT;) {
        this_thread::sleep_for(VERIFY_INTERVAL);
        survivors = sweep_once();
    }
    sweep.unlock();

    remove_sandbox_dir(handle);

    if (survivors > 0) {
        LOG(ERROR) << "Sandbox " << handle.id << " leaked " << survivors << " process(es)";
        throw leak_detected_error(handle.id, survivors);
    }
    LOG(INFO) << "Released sandbox " << handle.id;
}

spawned_process process_sandbox_runtime::spawn(sandbox_handle &handle, const spawn_request &request) {
    if (!request.working_dir.empty() && !is_safe_path(request.working_dir))
        throw sandbox_error("Unsafe working directory " + request.working_dir);

    child_setup setup;
    setup.argv = request.argv;
    setup.env = make_environment(request.env);
    setup.work_dir = request.working_dir.empty() ? handle.root : handle.root / request.working_dir;
    bool switch_user = options.user_id >= 0;
    setup.rlimits = make_rlimits(request.limits, true, switch_user);
    setup.isolate_network = !request.limits.network && geteuid() == 0;
    setup.user_id = options.user_id;
    setup.group_id = options.group_id;

    shared_lock<shared_mutex> guard(spawning);
    return fork_child(setup, [&](pid_t pid) {
        lock_guard<mutex> guard(mut);
        auto it = groups.find(handle.id);
        if (handle.released || it == groups.end())
            throw sandbox_error("Sandbox " + handle.id + " has been released");
        it->second.insert(pid);
    });
}

void process_sandbox_runtime::terminate(sandbox_handle &handle) {
    set<pid_t> process_groups;
    {
        lock_guard<mutex> guard(mut);
        auto it = groups.find(handle.id);
        if (it == groups.end()) return;
        process_groups = it->second;
    }
    DLOG(INFO) << "Terminating " << process_groups.size() << " process group(s) in sandbox " << handle.id;
    kill_groups(process_groups);
}

size_t process_sandbox_runtime::live_processes(sandbox_handle &handle) {
    set<pid_t> process_groups;
    {
        lock_guard<mutex> guard(mut);
        auto it = groups.find(handle.id);
        if (it == groups.end()) return 0;
        process_groups = it->second;
    }
    return count_live_processes(process_groups);
}

}  // namespace grader
