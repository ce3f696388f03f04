#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <system_error>

extern char **environ;

namespace tci {
using namespace std;

static int open_redirect(const filesystem::path &path) {
    if (path.empty()) return -1;
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    return fd;
}

pid_t spawn_process(const vector<string> &argv, const spawn_options &options) {
    if (argv.empty())
        throw invalid_argument("spawn_process: empty command");

    // fork 之后的子进程只能调用 async-signal-safe 的函数，因此参数和环境变量都要提前准备好
    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    vector<string> env_strings;
    for (char **e = environ; e && *e; ++e) {
        string entry(*e);
        string key = entry.substr(0, entry.find('='));
        if (!options.env.count(key)) env_strings.push_back(entry);
    }
    for (auto &[key, value] : options.env)
        env_strings.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : env_strings) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    int out_fd = open_redirect(options.stdout_file);
    int err_fd = options.stderr_file == options.stdout_file ? out_fd : open_redirect(options.stderr_file);

    pid_t pid = fork();
    switch (pid) {
        case -1: {  // fork 失败
            int err = errno;
            if (out_fd >= 0) close(out_fd);
            if (err_fd >= 0 && err_fd != out_fd) close(err_fd);
            throw system_error(err, system_category(), "unable to fork");
        }
        case 0:  // 子进程
            signal(SIGINT, SIG_IGN);
            if (options.new_process_group && setsid() == -1) _exit(126);
            if (!options.work_dir.empty() && chdir(options.work_dir.c_str()) != 0) _exit(126);
            if (out_fd >= 0 && dup2(out_fd, STDOUT_FILENO) < 0) _exit(126);
            if (err_fd >= 0 && dup2(err_fd, STDERR_FILENO) < 0) _exit(126);
            if (options.before_exec && !options.before_exec()) _exit(126);
            execvpe(args[0], args.data(), envp.data());
            _exit(127);
        default:  // 父进程
            if (out_fd >= 0) close(out_fd);
            if (err_fd >= 0 && err_fd != out_fd) close(err_fd);
            return pid;
    }
}

process_status wait_process(pid_t pid) {
    process_status result;
    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "waitpid");
    }
    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitcode = 128 + result.signal;
    }
    return result;
}

int exec_program(const vector<string> &argv) {
    spawn_options options;
    options.new_process_group = false;
    process_status status = wait_process(spawn_process(argv, options));
    return status.signal >= 0 ? -1 : status.exitcode;
}

string generate_uuid() {
    // random_generator 不是线程安全的
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

int64_t unix_millis() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace tci
