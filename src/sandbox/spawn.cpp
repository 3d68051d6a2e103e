#include "sandbox/spawn.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <math.h>
#include <sched.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstring>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

const int PIPE_OUT = 0;
const int PIPE_IN = 1;

/**
 * @brief 子进程设置失败的阶段，通过错误管道传回父进程
 */
enum class child_stage : int {
    SYNC,
    SESSION,
    RLIMIT,
    NETWORK,
    GROUP,
    USER,
    CHDIR,
    REDIRECT,
    EXEC
};

static const char *stage_names[] = {
    "waiting for parent",
    "creating session",
    "setting rlimit",
    "unsharing network namespace",
    "setting group id",
    "setting user id",
    "changing working directory",
    "redirecting standard streams",
    "executing command"};

struct child_failure {
    child_stage stage;
    int err;
};

vector<tuple<int, rlim_t, rlim_t>> make_rlimits(const resource_limits &limits, bool include_memory, bool include_nproc) {
    vector<tuple<int, rlim_t, rlim_t>> result;
    if (limits.cpu_time >= 0) {
        // 软限制到达时内核发送 SIGXCPU，硬限制多 1 秒时发送 SIGKILL，
        // 这样可以通过 SIGXCPU 可靠地判断是否是 CPU 时间超限
        rlim_t cputime_limit = (rlim_t)ceil(limits.cpu_time);
        if (cputime_limit == 0) cputime_limit = 1;
        result.emplace_back(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }
    if (include_memory && limits.memory >= 0)
        result.emplace_back(RLIMIT_AS, (rlim_t)limits.memory, (rlim_t)limits.memory);
    if (include_nproc && limits.proc_limit > 0)
        result.emplace_back(RLIMIT_NPROC, (rlim_t)limits.proc_limit, (rlim_t)limits.proc_limit);
    if (limits.file_limit >= 0)
        result.emplace_back(RLIMIT_FSIZE, (rlim_t)limits.file_limit, (rlim_t)limits.file_limit);
    result.emplace_back(RLIMIT_CORE, 0, 0);
    return result;
}

vector<string> make_environment(const vector<string> &extra) {
    vector<string> env;
    env.push_back("PATH=" + get_env("PATH", "/usr/local/bin:/usr/bin:/bin"));
    for (auto &entry : extra) env.push_back(entry);
    return env;
}

string resolve_executable(const string &program, const vector<string> &env) {
    if (program.find('/') != string::npos) return program;

    string path;
    for (auto &entry : env)
        if (boost::starts_with(entry, "PATH=")) path = entry.substr(5);

    vector<string> dirs;
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0 && !fs::is_directory(candidate))
            return candidate.string();
    }
    return program;
}

static void close_pipe(int fd[2]) {
    if (fd[PIPE_OUT] >= 0) close(fd[PIPE_OUT]);
    if (fd[PIPE_IN] >= 0) close(fd[PIPE_IN]);
}

/**
 * @brief 子进程中的设置，只能使用异步信号安全的函数
 */
[[noreturn]] static void run_child(const child_setup &setup, char *const argv[], char *const envp[],
                                   int child_pipefd[3][2], int sync_fd, int error_fd) {
    child_failure failure{child_stage::SYNC, 0};

    auto fail = [&](child_stage stage) {
        failure.stage = stage;
        failure.err = errno;
        ssize_t ignored = write(error_fd, &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    };

    // 等待父进程完成 cgroup 等设置
    char go;
    if (read(sync_fd, &go, 1) != 1) fail(child_stage::SYNC);

    // 评测进程忽略了 SIGPIPE 并屏蔽了部分信号，这些设置会被 exec 继承，需要还原
    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = SIG_DFL;
    sigaction(SIGPIPE, &sigact, nullptr);
    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);

    // 将命令运行在单独的会话和进程组中，以便一个信号就能杀死命令及其所有子进程
    if (setsid() == -1) fail(child_stage::SESSION);

    for (auto &[resource, cur, max] : setup.rlimits) {
        struct rlimit lim;
        lim.rlim_cur = cur;
        lim.rlim_max = max;
        if (setrlimit(resource, &lim) != 0) fail(child_stage::RLIMIT);
    }

    if (setup.isolate_network && unshare(CLONE_NEWNET) != 0) fail(child_stage::NETWORK);

    if (setup.group_id >= 0) {
        if (setgid(setup.group_id) != 0) fail(child_stage::GROUP);
        gid_t aux_groups[1] = {(gid_t)setup.group_id};
        if (setgroups(1, aux_groups) != 0) fail(child_stage::GROUP);
    }

    if (setup.user_id >= 0 && setuid(setup.user_id) != 0) fail(child_stage::USER);

    if (chdir(setup.work_dir.c_str()) != 0) fail(child_stage::CHDIR);

    // 将管道连接到 stdin/stdout/stderr，dup2 得到的描述符不带 FD_CLOEXEC
    if (dup2(child_pipefd[0][PIPE_OUT], STDIN_FILENO) < 0 ||
        dup2(child_pipefd[1][PIPE_IN], STDOUT_FILENO) < 0 ||
        dup2(child_pipefd[2][PIPE_IN], STDERR_FILENO) < 0)
        fail(child_stage::REDIRECT);

    execve(argv[0], argv, envp);

    // 可执行文件不存在等情况属于学生程序的结果，提示信息写入 stderr
    int err = errno;
    static const char message[] = "cannot execute ";
    ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
    ignored = write(STDERR_FILENO, argv[0], strlen(argv[0]));
    ignored = write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    errno = err;
    fail(child_stage::EXEC);
    _exit(127);
}

spawned_process fork_child(const child_setup &setup, const function<void(pid_t)> &before_start) {
    if (setup.argv.empty()) throw sandbox_error("Empty command");

    // fork 前准备好所有参数
    string executable = resolve_executable(setup.argv[0], setup.env);
    vector<string> args = setup.argv;
    args[0] = executable;
    vector<char *> argv, envp;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &entry : setup.env) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    // 所有描述符都带 O_CLOEXEC，避免并发启动的其他子进程继承到本进程的管道
    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int sync_pipe[2] = {-1, -1}, error_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int i = 0; i < 3; ++i) close_pipe(child_pipefd[i]);
        close_pipe(sync_pipe);
        close_pipe(error_pipe);
    };
    for (int i = 0; i < 3; ++i)
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) {
            int err = errno;
            close_all();
            throw sandbox_error(fmt::format("Unable to create pipe for fd {}: {}", i, strerror(err)));
        }
    if (pipe2(sync_pipe, O_CLOEXEC) != 0 || pipe2(error_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        throw sandbox_error(fmt::format("Unable to create synchronization pipe: {}", strerror(err)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw sandbox_error(fmt::format("Unable to fork: {}", strerror(err)));
    }
    if (pid == 0) run_child(setup, argv.data(), envp.data(), child_pipefd, sync_pipe[PIPE_OUT], error_pipe[PIPE_IN]);

    spawned_process process;
    process.pid = pid;
    process.stdin_fd.reset(child_pipefd[0][PIPE_IN]);
    process.stdout_fd.reset(child_pipefd[1][PIPE_OUT]);
    process.stderr_fd.reset(child_pipefd[2][PIPE_OUT]);
    close(child_pipefd[0][PIPE_OUT]);
    close(child_pipefd[1][PIPE_IN]);
    close(child_pipefd[2][PIPE_IN]);
    close(sync_pipe[PIPE_OUT]);
    close(error_pipe[PIPE_IN]);
    scoped_fd sync_fd(sync_pipe[PIPE_IN]), error_fd(error_pipe[PIPE_OUT]);

    auto kill_child = [pid] {
        kill(pid, SIGKILL);
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
    };

    try {
        before_start(pid);
    } catch (exception &) {
        kill_child();
        throw;
    }

    char go = 1;
    if (write(sync_fd.get(), &go, 1) != 1) {
        int err = errno;
        kill_child();
        throw sandbox_error(fmt::format("Unable to start child process: {}", strerror(err)));
    }
    sync_fd.reset();

    // exec 成功时错误管道因 O_CLOEXEC 被关闭，read 返回 0
    child_failure failure;
    ssize_t n;
    while ((n = read(error_fd.get(), &failure, sizeof(failure))) < 0 && errno == EINTR)
        ;
    if (n == (ssize_t)sizeof(failure)) {
        if (failure.stage == child_stage::EXEC) {
            LOG(WARNING) << "Unable to execute " << executable << ": " << strerror(failure.err);
            return process;
        }
        kill_child();
        throw sandbox_error(fmt::format("Child process failed while {}: {}",
                                        stage_names[(int)failure.stage], strerror(failure.err)));
    } else if (n != 0) {
        kill_child();
        throw sandbox_error("Unable to read child process status");
    }
    return process;
}

}  // namespace grader
