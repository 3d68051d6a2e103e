#include "executor/executor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <atomic>
#include <cstring>
#include <mutex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

const int BUF_SIZE = 4096;

// 主进程退出后继续读取输出的最长时间
static const chrono::milliseconds DRAIN_TIMEOUT(1000);

// 看门狗失效时，执行路径在 deadline 之后额外等待的时间
static const chrono::milliseconds DEADLINE_GRACE(1000);

static const int POLL_INTERVAL_MS = 20;

/**
 * @brief 一个输出流的捕获状态
 */
struct output_stream {
    scoped_fd &fd;
    string &data;
    bool &truncated;
    size_t limit;
};

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw sandbox_error(fmt::format("Unable to set O_NONBLOCK: {}", strerror(errno)));
}

/**
 * @brief 从输出流读取数据，超过限制的部分读出后丢弃
 */
static void pump_output(output_stream &stream, int index) {
    char buf[BUF_SIZE];
    while (stream.fd) {
        ssize_t nread = read(stream.fd.get(), buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            throw sandbox_error(fmt::format("Unable to read child fd {}: {}", index, strerror(errno)));
        }
        if (nread == 0) {
            // EOF
            stream.fd.reset();
            return;
        }
        size_t room = stream.limit - min(stream.limit, stream.data.size());
        if ((size_t)nread > room) {
            if (!stream.truncated) DLOG(INFO) << "child fd " << index << " limit reached";
            stream.truncated = true;
        }
        stream.data.append(buf, min((size_t)nread, room));
    }
}

/**
 * @brief 尽可能多地写入标准输入，全部写完或者子进程关闭了标准输入时关闭管道
 */
static void pump_input(scoped_fd &fd, const string &input, size_t &written) {
    while (fd && written < input.size()) {
        ssize_t n = write(fd.get(), input.data() + written, min((size_t)BUF_SIZE, input.size() - written));
        if (n == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            if (errno == EPIPE) break;
            throw sandbox_error(fmt::format("Unable to write child stdin: {}", strerror(errno)));
        }
        written += n;
    }
    fd.reset();
}

/**
 * @brief 检查进程是否已经退出，不回收进程，使进程组号在杀死剩余进程前保持有效
 */
static bool has_exited(pid_t pid) {
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    while (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno == EINTR) continue;
        throw sandbox_error(fmt::format("Unable to wait for {}: {}", pid, strerror(errno)));
    }
    return info.si_pid == pid;
}

command_executor::command_executor(sandbox_runtime &runtime, watchdog &dog, int64_t default_output_limit)
    : runtime(runtime), dog(dog), default_output_limit(default_output_limit) {
    // 学生程序可能不读取标准输入就退出，向关闭的管道写入不能杀死评测进程
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });
}

int64_t command_executor::output_limit(const sandbox_handle &handle, const resource_limits &limits) const {
    int64_t limit = handle.limits.tighten(limits).output_limit;
    return limit >= 0 ? limit : default_output_limit;
}

command_result command_executor::run(sandbox_handle &handle, const command &cmd) {
    command_result result;
    resource_limits limits = handle.limits.tighten(cmd.limits);

    spawn_request request;
    request.argv = cmd.argv;
    request.env = cmd.env;
    request.working_dir = cmd.working_dir;
    request.limits = limits;

    size_t oom_before = runtime.oom_kill_count(handle);
    elapsed_time timer;
    spawned_process process = runtime.spawn(handle, request);
    pid_t pid = process.pid;
    DLOG(INFO) << "Started " << cmd.argv[0] << " as " << pid << " in sandbox " << handle.id;

    // 发生错误时确保进程组被杀死且主进程被回收
    bool reaped = false;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            int status;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                ;
        }
    };

    atomic<bool> timed_out(false);
    watchdog::timer_id timer_id = 0;
    auto deadline = watchdog::clock::time_point::max();
    if (limits.wall_time >= 0) {
        deadline = watchdog::clock::now() + seconds_to_duration(limits.wall_time);
        timer_id = dog.schedule(deadline, [&timed_out, &handle, this] {
            timed_out = true;
            LOG(WARNING) << "Wall time limit exceeded in sandbox " << handle.id << ": aborting command";
            runtime.terminate(handle);
        });
    }
    defer {
        if (timer_id) dog.cancel(timer_id);
    };

    size_t capture_limit = (size_t)output_limit(handle, cmd.limits);
    output_stream streams[2] = {
        {process.stdout_fd, result.stdout_text, result.stdout_truncated, capture_limit},
        {process.stderr_fd, result.stderr_text, result.stderr_truncated, capture_limit}};
    for (auto &stream : streams) set_nonblocking(stream.fd.get());

    size_t written = 0;
    if (cmd.input.empty())
        process.stdin_fd.reset();
    else
        set_nonblocking(process.stdin_fd.get());

    bool exited = false;
    watchdog::clock::time_point drain_deadline;
    while (true) {
        struct pollfd fds[3];
        int nfds = 0;
        for (auto &stream : streams)
            if (stream.fd) fds[nfds++] = {stream.fd.get(), POLLIN, 0};
        if (process.stdin_fd) fds[nfds++] = {process.stdin_fd.get(), POLLOUT, 0};

        if (poll(fds, nfds, POLL_INTERVAL_MS) < 0 && errno != EINTR)
            throw sandbox_error(fmt::format("Unable to wait for child data: {}", strerror(errno)));

        for (int i = 0; i < 2; ++i) pump_output(streams[i], i + 1);
        if (process.stdin_fd) pump_input(process.stdin_fd, cmd.input, written);

        if (!exited && has_exited(pid)) {
            exited = true;
            // 主进程退出后杀死进程组中剩余的进程，此时主进程尚未被回收，进程组号不会被复用
            if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(WARNING) << "Unable to kill process group " << pid << ": " << strerror(errno);
            drain_deadline = watchdog::clock::now() + DRAIN_TIMEOUT;
        }

        bool drained = !streams[0].fd && !streams[1].fd;
        if (exited && (drained || watchdog::clock::now() >= drain_deadline)) {
            if (!drained)
                LOG(WARNING) << "Output of " << pid << " is still open after the command exited, discarding the rest";
            break;
        }

        if (!exited && timer_id && watchdog::clock::now() >= deadline + DEADLINE_GRACE) {
            // 看门狗没有能够杀死进程，由执行路径直接杀死进程组
            LOG(ERROR) << "Command " << pid << " survived its deadline, killing process group";
            timed_out = true;
            kill(-pid, SIGKILL);
        }
    }

    if (timer_id) {
        dog.cancel(timer_id);
        timer_id = 0;
    }

    int status = 0;
    struct rusage usage;
    pid_t ret;
    while ((ret = wait4(pid, &status, 0, &usage)) < 0 && errno == EINTR)
        ;
    if (ret != pid) throw sandbox_error(fmt::format("Unable to reap {}: {}", pid, strerror(errno)));
    reaped = true;

    result.wall_time = timer.seconds();
    result.cpu_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1e-6 +
                      usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1e-6;
    result.memory = (int64_t)usage.ru_maxrss * 1024;
    result.timed_out = timed_out;

    if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        result.signal = WTERMSIG(status);
        result.exit_status = result.signal + 128;
    } else {
        throw sandbox_error(fmt::format("Unknown status of {}: {:x}", pid, status));
    }

    bool oom_killed = runtime.oom_kill_count(handle) > oom_before;
    bool cpu_killed = result.signal == SIGXCPU ||
                      (result.signal == SIGKILL && limits.cpu_time >= 0 && result.cpu_time >= limits.cpu_time);
    bool file_killed = result.signal == SIGXFSZ;
    bool memory_killed = result.signal != 0 && !result.timed_out && limits.memory >= 0 &&
                         result.memory >= limits.memory / 10 * 9;
    result.resource_killed = oom_killed || cpu_killed || file_killed || memory_killed;

    if (result.timed_out)
        LOG(WARNING) << fmt::format("Command {} timed out after {:.3f}s", cmd.argv[0], result.wall_time);
    else if (result.resource_killed)
        LOG(WARNING) << "Command " << cmd.argv[0] << " killed for exceeding resource limits (signal " << result.signal << ")";
    DLOG(INFO) << fmt::format("run time: real {:.3f}, cpu {:.3f}, memory {}kB, exit {}",
                              result.wall_time, result.cpu_time, result.memory / 1024, result.exit_status);
    return result;
}

}  // namespace grader
