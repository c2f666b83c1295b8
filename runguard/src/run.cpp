#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "common/utils.hpp"
#include "limits.hpp"

extern char **environ;

namespace kata {
using namespace std;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

/* Granularity of deadline and cancellation checks. */
const chrono::milliseconds POLL_INTERVAL(10);

template <typename... Args>
static void error(int err, const char *format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/* Report errno to the parent through the status pipe and exit. */
[[noreturn]] static void child_fail(int status_fd, int err) {
    ssize_t ignored = write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

/* Check whether the child has exited without reaping it, so that the
   process group id cannot be reused before we kill the group. */
static bool child_exited(pid_t pid) {
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return errno == ECHILD;
    return info.si_pid == pid;
}

static void terminate(pid_t pid, chrono::milliseconds kill_delay) {
    /* First try to kill graciously, then hard.
       Don't report an already exited process as error. */
    DLOG(INFO) << "sending SIGTERM to process group " << pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH) {
        error(errno, "sending SIGTERM to command");
    }

    auto grace_end = chrono::steady_clock::now() + kill_delay;
    while (chrono::steady_clock::now() < grace_end && !child_exited(pid)) {
        this_thread::sleep_for(chrono::milliseconds(5));
    }

    /* The direct child may be gone while descendants ignore SIGTERM,
       so the whole group always receives SIGKILL. */
    DLOG(INFO) << "sending SIGKILL to process group " << pid;
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        error(errno, "sending SIGKILL to command");
    }
}

/**
 * Read everything currently available from the child pipes.
 * Data beyond stream_size is consumed and counted but thrown away.
 */
static void pump_pipes(const runguard_options &opt, int child_pipefd[3][2], string data[3], size_t data_read[3]) {
    char buf[BUF_SIZE];

    for (int i = 1; i <= 2; i++) {
        while (child_pipefd[i][PIPE_OUT] != -1) {
            ssize_t nread = read(child_pipefd[i][PIPE_OUT], buf, BUF_SIZE);
            if (nread == -1) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                error(errno, "copying data fd {}", i);
            }
            if (nread == 0) {
                /* EOF detected: close fd and indicate this with -1 */
                close_fd(child_pipefd[i][PIPE_OUT]);
                break;
            }

            size_t to_keep = nread;
            if (opt.stream_size >= 0) {
                size_t room = (size_t)opt.stream_size - min((size_t)opt.stream_size, data[i].size());
                to_keep = min(to_keep, room);
                if (to_keep < (size_t)nread && data_read[i] <= (size_t)opt.stream_size)
                    LOG(INFO) << "child fd " << i << " limit reached";
            }
            data[i].append(buf, to_keep);
            data_read[i] += nread;
        }
    }
}

static vector<string> build_environment(const runguard_options &opt) {
    vector<string> envs;
    if (opt.preserve_sys_env) {
        for (char **env = environ; env && *env; ++env) envs.push_back(*env);
    } else {
        string path = get_env("PATH", "");
        if (!path.empty()) envs.push_back("PATH=" + path);
    }

    for (auto &entry : opt.env) {
        auto idx = entry.find('=');
        string prefix = entry.substr(0, idx) + "=";
        envs.erase(remove_if(envs.begin(), envs.end(), [&](const string &env) {
                       return env.compare(0, prefix.size(), prefix) == 0;
                   }),
                   envs.end());
        envs.push_back(entry);
    }
    return envs;
}

runguard_result runit(const runguard_options &opt, const cancellation_token *cancel) {
    if (opt.command.empty())
        throw invalid_argument("runguard: empty command");

    runguard_result result;

    // fork 之后子进程只能调用 async-signal-safe 的函数，因此 argv 和 envp 必须提前准备好
    vector<string> cmd = opt.command;
    vector<char *> args;
    for (auto &arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);

    vector<string> envs = build_environment(opt);
    vector<char *> envp;
    for (auto &env : envs) envp.push_back(env.data());
    envp.push_back(nullptr);

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int status_pipefd[2] = {-1, -1};
    int stdin_fd = -1;

    auto close_all = [&] {
        for (int i = 1; i <= 2; i++) {
            close_fd(child_pipefd[i][PIPE_IN]);
            close_fd(child_pipefd[i][PIPE_OUT]);
        }
        close_fd(status_pipefd[PIPE_IN]);
        close_fd(status_pipefd[PIPE_OUT]);
        close_fd(stdin_fd);
    };

    try {
        /* Setup pipes connecting to child stdout/err streams. All descriptors
           are close-on-exec so that children spawned concurrently by other
           worker threads never inherit them. */
        for (int i = 1; i <= 2; i++) {
            if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
        }
        if (pipe2(status_pipefd, O_CLOEXEC) != 0) error(errno, "creating status pipe");

        /* Without an input file the child reads from /dev/null, never from our stdin. */
        string stdin_path = opt.stdin_filename.empty() ? "/dev/null" : opt.stdin_filename;
        stdin_fd = open(stdin_path.c_str(), O_RDONLY | O_CLOEXEC);
        if (stdin_fd < 0) error(errno, "opening file '{}'", stdin_path);
    } catch (...) {
        close_all();
        throw;
    }

    elapsed_time timer;
    pid_t child_pid = fork();
    switch (child_pid) {
        case -1: {
            int err = errno;
            close_all();
            error(err, "unable to fork");
        } break;
        case 0: {  // child process, run the command
            int status_fd = status_pipefd[PIPE_IN];

            // run the command in a separate process group,
            // so the command and all its child processes can be killed
            // off with one signal
            if (setpgid(0, 0) != 0) child_fail(status_fd, errno);

            // 将管道连接到 stdin/stdout/stderr。
            if (dup2(stdin_fd, STDIN_FILENO) < 0) child_fail(status_fd, errno);
            for (int i = 1; i <= 2; ++i) {
                if (dup2(child_pipefd[i][PIPE_IN], i) < 0) child_fail(status_fd, errno);
            }

            if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0)
                child_fail(status_fd, errno);

            if (int err = set_restrictions(opt)) child_fail(status_fd, err);

            /* Signal mask and ignored signals survive exec, reset them. */
            sigset_t emptymask;
            sigemptyset(&emptymask);
            sigprocmask(SIG_SETMASK, &emptymask, nullptr);
            signal(SIGPIPE, SIG_DFL);

            execvpe(args[0], args.data(), envp.data());
            child_fail(status_fd, errno);
        } break;
        default:
            break;
    }

    // watchdog
    result.pid = child_pid;

    /* Both sides call setpgid to avoid racing with kill(-pid). EACCES
       means the child has already called exec, which it only does after
       its own setpgid succeeded. */
    if (setpgid(child_pid, child_pid) != 0 && errno != EACCES && errno != ESRCH)
        LOG(WARNING) << "setpgid for child " << child_pid << " failed: " << strerror(errno);

    /* Close unused file descriptors */
    for (int i = 1; i <= 2; i++) close_fd(child_pipefd[i][PIPE_IN]);
    close_fd(status_pipefd[PIPE_IN]);
    close_fd(stdin_fd);

    /* The status pipe is closed by a successful exec; otherwise it carries errno. */
    int exec_errno = 0;
    {
        ssize_t nread;
        do {
            nread = read(status_pipefd[PIPE_OUT], &exec_errno, sizeof(exec_errno));
        } while (nread == -1 && errno == EINTR);
        if (nread != sizeof(exec_errno)) exec_errno = 0;
        close_fd(status_pipefd[PIPE_OUT]);
    }

    if (exec_errno != 0) {
        int status;
        while (waitpid(child_pid, &status, 0) == -1 && errno == EINTR) {}
        close_all();
        result.exec_error = fmt::format("unable to start command {}: {}", cmd[0], strerror(exec_errno));
        result.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;
        DLOG(INFO) << result.exec_error;
        return result;
    }

    for (int i = 1; i <= 2; i++) {
        int flags = fcntl(child_pipefd[i][PIPE_OUT], F_GETFL);
        if (flags == -1 || fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, flags | O_NONBLOCK) == -1) {
            int err = errno;
            kill(-child_pid, SIGKILL);
            while (waitpid(child_pid, nullptr, 0) == -1 && errno == EINTR) {}
            close_all();
            error(err, "setting pipe for fd {} non-blocking", i);
        }
    }

    string data[3];
    size_t data_read[3] = {0, 0, 0};
    auto deadline = chrono::steady_clock::now() + opt.wall_limit;

    try {
        while (true) {
            if (child_exited(child_pid)) {
                /* Collect what the command wrote before exiting. */
                pump_pipes(opt, child_pipefd, data, data_read);
                break;
            }

            auto now = chrono::steady_clock::now();
            if (now >= deadline) {
                result.timed_out = true;
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command " << cmd[0];
                terminate(child_pid, opt.kill_delay);
                break;
            }
            if (is_cancelled(cancel)) {
                result.cancelled = true;
                LOG(WARNING) << "cancellation requested: aborting command " << cmd[0];
                terminate(child_pid, opt.kill_delay);
                break;
            }

            auto wait = min(POLL_INTERVAL, chrono::duration_cast<chrono::milliseconds>(deadline - now) + chrono::milliseconds(1));
            struct pollfd fds[2];
            nfds_t nfds = 0;
            for (int i = 1; i <= 2; i++) {
                if (child_pipefd[i][PIPE_OUT] != -1) {
                    fds[nfds].fd = child_pipefd[i][PIPE_OUT];
                    fds[nfds].events = POLLIN;
                    fds[nfds].revents = 0;
                    nfds++;
                }
            }

            if (nfds == 0) {
                /* Both streams closed but the command is still running. */
                this_thread::sleep_for(wait);
                continue;
            }

            int ret = poll(fds, nfds, (int)wait.count());
            if (ret == -1) {
                if (errno == EINTR) continue;
                error(errno, "waiting for child data");
            }
            if (ret > 0) pump_pipes(opt, child_pipefd, data, data_read);
        }
    } catch (...) {
        kill(-child_pid, SIGKILL);
        while (waitpid(child_pid, nullptr, 0) == -1 && errno == EINTR) {}
        close_all();
        throw;
    }

    /* Make sure no descendant of the command survives it. The group
       leader is not reaped yet, so the group id is still ours. */
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill process group " << child_pid << ": " << strerror(errno);

    int status = 0;
    while (waitpid(child_pid, &status, 0) == -1) {
        if (errno != EINTR) {
            close_all();
            error(errno, "waiting on child");
        }
    }
    close_all();

    result.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }

    result.stdout_data = move(data[STDOUT_FILENO]);
    result.stderr_data = move(data[STDERR_FILENO]);
    result.stdout_bytes = data_read[STDOUT_FILENO];
    result.stderr_bytes = data_read[STDERR_FILENO];
    result.stdout_truncated = result.stdout_bytes > result.stdout_data.size();
    result.stderr_truncated = result.stderr_bytes > result.stderr_data.size();

    DLOG(INFO) << fmt::format("{} finished: real {:.3f}s, exitcode {}, signal {}, timed out {}",
                              cmd[0], result.wall_time, result.exitcode ? *result.exitcode : -1, result.signal, result.timed_out);

    return result;
}

}  // namespace kata
