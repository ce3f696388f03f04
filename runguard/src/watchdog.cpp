#include "watchdog.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <ctime>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>
#include "cgroup.hpp"
#include "confine.hpp"
#include "egress.hpp"

using namespace std;

static const struct timespec KILL_DELAY = {0, 100000000L};  // 0.1s

[[noreturn]] static void fail(int err, const string &what) {
    throw system_error(err, system_category(), what);
}

/**
 * @brief meta 文件，每行为 "key: value"
 */
struct meta_writer {
    explicit meta_writer(const string &path) {
        if (!path.empty()) out.open(path, ofstream::out | ofstream::trunc);
    }

    template <typename T>
    void put(const char *key, const T &value) {
        if (out) out << key << ": " << value << endl;
    }

private:
    ofstream out;
};

/**
 * @brief 用户程序的一个输出流
 * 从管道读出的数据写入文件，超出上限的部分丢弃
 */
struct output_stream {
    int pipe_fd = -1;
    int file_fd = -1;
    bool owns_file = false;
    int64_t limit = -1;
    int64_t received = 0, kept = 0;

    ~output_stream() {
        if (pipe_fd >= 0) close(pipe_fd);
        if (owns_file && file_fd >= 0) close(file_fd);
    }

    bool open() const {
        return pipe_fd >= 0;
    }

    bool truncated() const {
        return received > kept;
    }

    void redirect(const string &path, int fallback_fd) {
        if (path.empty()) {
            file_fd = fallback_fd;
            return;
        }
        file_fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
        if (file_fd < 0) fail(errno, fmt::format("opening file '{}'", path));
        owns_file = true;
    }

    /**
     * @brief 读一次管道
     * @return 是否读到了数据，读到 EOF 时关闭管道
     */
    bool pump() {
        char buf[4096];
        ssize_t n = read(pipe_fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) return false;
            fail(errno, "reading output of command");
        }
        if (n == 0) {
            close(pipe_fd);
            pipe_fd = -1;
            return false;
        }

        received += n;
        int64_t keep = limit < 0 ? n : min<int64_t>(n, max<int64_t>(limit - kept, 0));
        for (int64_t written = 0; written < keep;) {
            ssize_t w = write(file_fd, buf + written, keep - written);
            if (w < 0) {
                if (errno == EINTR) continue;
                fail(errno, "writing output of command");
            }
            written += w;
        }
        kept += keep;
        return true;
    }
};

/**
 * @brief 保证异常退出时子进程不会残留
 */
struct child_guard {
    explicit child_guard(execution_cgroup &cg) : cg(cg) {}

    ~child_guard() {
        if (pid > 0 && !reaped) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
        cg.kill_all();
    }

    pid_t pid = -1;
    bool reaped = false;
    execution_cgroup &cg;
};

/**
 * @brief 先礼后兵：SIGTERM 之后等待一会再 SIGKILL
 */
static void stop_command(pid_t pid, execution_cgroup &cg) {
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "sending SIGTERM to command: " << strerror(errno);
    nanosleep(&KILL_DELAY, nullptr);
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "sending SIGKILL to command: " << strerror(errno);
    // 调用了 setsid 的后代进程不在进程组里
    cg.kill_all();
}

/**
 * @brief 重置继承来的 OOM 分数调整
 * 负的 oom_score_adj 会被子进程继承，导致内存超限的用户代码不被 OOM killer 选中
 */
static void reset_oom_score() {
    fstream f("/proc/self/oom_score_adj", ios::in | ios::out);
    int adj = 0;
    if (!(f >> adj) || adj >= 0) return;
    f.clear();
    f.seekp(0);
    f << 0 << endl;
    LOG(INFO) << "reset oom_score_adj from " << adj << " to 0";
}

/**
 * @brief fork 出来的子进程，设置好沙箱后 exec 用户程序，不会返回
 */
[[noreturn]] static void exec_command(const launch_options &opt, execution_cgroup &cg, const sigset_t &old_mask,
                                      int out_pipe, int err_pipe, int error_report) {
    try {
        if (sigprocmask(SIG_SETMASK, &old_mask, nullptr) != 0) fail(errno, "restoring signal mask");
        if (setsid() == -1) fail(errno, "unable to setsid");
        cg.attach_self();
        apply_rlimits(opt.limits);
        prepare_environment(opt.sandbox);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) fail(errno, "redirecting stdin");
        if (dup2(out_pipe, STDOUT_FILENO) < 0) fail(errno, "redirecting stdout");
        if (dup2(err_pipe, STDERR_FILENO) < 0) fail(errno, "redirecting stderr");
        close(devnull);

        enter_sandbox(opt.sandbox);
        load_syscall_filter(opt.sandbox.syscalls);

        vector<char *> args;
        for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);
        execvp(args[0], args.data());
        fail(errno, fmt::format("unable to start command {}", opt.command[0]));
    } catch (exception &e) {
        string message = e.what();
        ssize_t ignored = write(error_report, message.data(), message.size());
        (void)ignored;
    }
    _exit(126);
}

static void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0) fail(errno, "creating pipe");
}

static int supervise(const launch_options &opt, meta_writer &meta) {
    if (opt.command.empty()) throw invalid_argument("no command given");

    // 防火墙在 cgroup 之后析构，用户代码的进程都被杀死之后才删除规则
    unique_ptr<egress_firewall> firewall;
    uint32_t classid = 0;
    if (!opt.sandbox.egress.empty()) {
        classid = egress_classid(getpid());
        firewall = make_unique<egress_firewall>(classid, resolve_egress(opt.sandbox.egress));
    }

    execution_cgroup::init();
    execution_cgroup cg(fmt::format("/tci/run_{}_{}", getpid(), (long)time(nullptr)),
                        opt.limits.memory_bytes, opt.limits.max_processes, classid);
    child_guard child(cg);

    output_stream out, err;
    int out_pipe[2], err_pipe[2], report_pipe[2];
    make_pipe(out_pipe);
    make_pipe(err_pipe);
    make_pipe(report_pipe);
    out.pipe_fd = out_pipe[0];
    err.pipe_fd = err_pipe[0];
    out.limit = err.limit = opt.limits.stream_bytes;
    out.redirect(opt.stdout_file, STDOUT_FILENO);
    if (!opt.stderr_file.empty() && opt.stderr_file == opt.stdout_file)
        err.file_fd = out.file_fd;
    else
        err.redirect(opt.stderr_file, STDERR_FILENO);

    // 信号都通过 signalfd 在主循环中处理
    sigset_t mask, old_mask;
    sigemptyset(&mask);
    for (int sig : {SIGCHLD, SIGTERM, SIGINT, SIGHUP}) sigaddset(&mask, sig);
    if (sigprocmask(SIG_BLOCK, &mask, &old_mask) != 0) fail(errno, "blocking signals");
    int sfd = signalfd(-1, &mask, SFD_CLOEXEC);
    if (sfd < 0) fail(errno, "creating signalfd");
    int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_CLOEXEC);
    if (tfd < 0) fail(errno, "creating timerfd");

    reset_oom_score();

    int flags = CLONE_FILES | CLONE_FS | CLONE_NEWIPC | CLONE_NEWNS | CLONE_NEWUTS | CLONE_SYSVSEM;
    if (opt.sandbox.egress.empty()) flags |= CLONE_NEWNET;
    if (unshare(flags) != 0) fail(errno, "unable to unshare namespaces");

    auto started = chrono::steady_clock::now();
    child.pid = fork();
    if (child.pid < 0) fail(errno, "unable to fork");
    if (child.pid == 0)
        exec_command(opt, cg, old_mask, out_pipe[1], err_pipe[1], report_pipe[1]);

    close(out_pipe[1]);
    close(err_pipe[1]);
    close(report_pipe[1]);
    for (int fd : {out.pipe_fd, err.pipe_fd})
        if (fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK) != 0) fail(errno, "setting pipe non-blocking");

    if (opt.limits.wall_time > 0) {
        struct itimerspec deadline = {};
        double whole;
        deadline.it_value.tv_sec = (time_t)opt.limits.wall_time;
        deadline.it_value.tv_nsec = (long)(modf(opt.limits.wall_time, &whole) * 1e9);
        if (timerfd_settime(tfd, 0, &deadline, nullptr) != 0) fail(errno, "setting wall time limit");
        LOG(INFO) << fmt::format("wall time limit set to {:.3f} seconds", opt.limits.wall_time);
    }

    int status = 0;
    struct rusage usage = {};
    string time_kind;
    int stop_signal = -1;
    while (!child.reaped) {
        vector<struct pollfd> fds = {{sfd, POLLIN, 0}, {tfd, POLLIN, 0}};
        vector<output_stream *> polled;
        for (auto *stream : {&out, &err}) {
            if (!stream->open()) continue;
            fds.push_back({stream->pipe_fd, POLLIN, 0});
            polled.push_back(stream);
        }

        if (poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) continue;
            fail(errno, "waiting for command");
        }

        for (size_t i = 0; i < polled.size(); ++i)
            if (fds[i + 2].revents & (POLLIN | POLLHUP | POLLERR)) polled[i]->pump();

        if (fds[1].revents & POLLIN) {
            uint64_t expirations;
            if (read(tfd, &expirations, sizeof(expirations)) < 0 && errno != EAGAIN) fail(errno, "reading timerfd");
            if (time_kind.empty() && stop_signal < 0) {
                LOG(WARNING) << "wall time limit exceeded, stopping command";
                time_kind = "wall";
                stop_command(child.pid, cg);
            }
        }

        if (fds[0].revents & POLLIN) {
            struct signalfd_siginfo info;
            if (read(sfd, &info, sizeof(info)) != sizeof(info)) fail(errno, "reading signalfd");
            if (info.ssi_signo == SIGCHLD) {
                pid_t r = wait4(child.pid, &status, WNOHANG, &usage);
                if (r < 0) fail(errno, "waiting for command");
                if (r == child.pid && (WIFEXITED(status) || WIFSIGNALED(status))) child.reaped = true;
            } else if (stop_signal < 0) {
                LOG(WARNING) << "received signal " << info.ssi_signo << ", stopping command";
                stop_signal = info.ssi_signo;
                stop_command(child.pid, cg);
            }
        }
    }
    auto finished = chrono::steady_clock::now();

    // 后代进程可能还持有管道的写端
    cg.kill_all();
    while (out.open() || err.open()) {
        vector<struct pollfd> fds;
        vector<output_stream *> polled;
        for (auto *stream : {&out, &err}) {
            if (!stream->open()) continue;
            fds.push_back({stream->pipe_fd, POLLIN, 0});
            polled.push_back(stream);
        }
        int r = poll(fds.data(), fds.size(), 100);
        if (r < 0 && errno != EINTR) fail(errno, "draining output");
        if (r == 0) break;
        for (size_t i = 0; i < polled.size(); ++i)
            if (fds[i].revents) polled[i]->pump();
    }

    string child_error;
    {
        char buf[1024];
        ssize_t n;
        while ((n = read(report_pipe[0], buf, sizeof(buf))) > 0) child_error.append(buf, n);
        close(report_pipe[0]);
    }
    close(sfd);
    close(tfd);

    int exitcode = -1, term_signal = -1;
    if (WIFEXITED(status)) {
        exitcode = WEXITSTATUS(status);
    } else {
        term_signal = WTERMSIG(status);
        exitcode = 128 + term_signal;
        LOG(WARNING) << "command terminated with signal " << term_signal << " (" << strsignal(term_signal) << ")";
    }

    cgroup_usage cg_usage = cg.usage();
    double wall = chrono::duration<double>(finished - started).count();
    double cpu = cg_usage.cpu_nanos / 1e9;
    double user = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1e-6;
    double sys = usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1e-6;

    if (term_signal == SIGXCPU && time_kind.empty()) time_kind = "cpu";
    string time_result;
    if (!time_kind.empty())
        time_result = "hard-timelimit";
    else if ((opt.limits.cpu_time > 0 && cpu > opt.limits.cpu_time) || (opt.limits.wall_time > 0 && wall > opt.limits.wall_time))
        time_result = "soft-timelimit";

    vector<string> truncated;
    if (out.truncated()) truncated.push_back("stdout");
    if (err.truncated()) truncated.push_back("stderr");

    string violation;
    if (term_signal == SIGSYS && !opt.sandbox.syscalls.empty()) {
        LOG(WARNING) << "command was killed by the seccomp filter";
        violation = "syscall";
    } else if (firewall) {
        uint64_t rejected = firewall->rejected_packets();
        if (rejected > 0) {
            LOG(WARNING) << rejected << " packets to endpoints outside the egress allowlist were rejected";
            violation = "network";
        }
    }

    meta.put("exitcode", exitcode);
    if (term_signal >= 0) meta.put("signal", term_signal);
    meta.put("wall-time", fmt::format("{:.3f}", wall));
    meta.put("cpu-time", fmt::format("{:.3f}", cpu));
    meta.put("user-time", fmt::format("{:.3f}", user));
    meta.put("sys-time", fmt::format("{:.3f}", sys));
    meta.put("memory-bytes", cg_usage.memory_peak);
    meta.put("memory-result", cg_usage.oom ? "oom" : "");
    meta.put("time-result", time_result);
    meta.put("time-kind", time_kind);
    meta.put("violation", violation);
    meta.put("stdout-bytes", out.received);
    meta.put("stderr-bytes", err.received);
    meta.put("output-truncated", boost::algorithm::join(truncated, ","));
    if (!child_error.empty()) {
        LOG(ERROR) << "unable to start command: " << child_error;
        meta.put("internal-error", child_error);
    }

    LOG(INFO) << fmt::format("run time: wall {:.3f}, cpu {:.3f}, memory {}kB", wall, cpu, cg_usage.memory_peak / 1024);
    return exitcode;
}

int run_guarded(const launch_options &opt) {
    meta_writer meta(opt.meta_file);
    try {
        return supervise(opt, meta);
    } catch (exception &e) {
        LOG(ERROR) << e.what();
        meta.put("internal-error", e.what());
        return EXIT_FAILURE;
    }
}
