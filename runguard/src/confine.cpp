#include "confine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <seccomp.h>
#include <sys/resource.h>
#include <unistd.h>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

using namespace std;

static void set_rlimit(int resource, rlim_t soft, rlim_t hard, const char *name) {
    struct rlimit lim;
    lim.rlim_cur = soft;
    lim.rlim_max = hard;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), fmt::format("setrlimit({})", name));
}

void apply_rlimits(const resource_limits &limits) {
    if (limits.cpu_time > 0) {
        // 软限制触发 SIGXCPU，可以据此判断 CPU 时间超限；一秒后的硬限制触发 SIGKILL
        rlim_t seconds = (rlim_t)ceil(limits.cpu_time);
        set_rlimit(RLIMIT_CPU, seconds, seconds + 1, "RLIMIT_CPU");
    }

    // 内存由 cgroup 限制，解释器在 RLIMIT_AS 下常常无法启动
    set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY, "RLIMIT_AS");
    set_rlimit(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY, "RLIMIT_DATA");
    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY, "RLIMIT_STACK");

    if (limits.file_bytes > 0)
        set_rlimit(RLIMIT_FSIZE, limits.file_bytes, limits.file_bytes, "RLIMIT_FSIZE");
    if (limits.no_core_dumps)
        set_rlimit(RLIMIT_CORE, 0, 0, "RLIMIT_CORE");
}

void prepare_environment(const isolation &sandbox) {
    if (!sandbox.preserve_env) {
        const char *path = getenv("PATH");
        string saved = path ? path : "/usr/local/bin:/usr/bin:/bin";
        if (clearenv() != 0)
            throw runtime_error("unable to clear environment");
        setenv("PATH", saved.c_str(), 1);
    }

    for (auto &entry : sandbox.env) {
        auto eq = entry.find('=');
        if (eq == string::npos || eq == 0)
            throw invalid_argument("malformed environment variable " + entry);
        if (setenv(entry.substr(0, eq).c_str(), entry.substr(eq + 1).c_str(), 1) != 0)
            throw system_error(errno, generic_category(), "setenv " + entry.substr(0, eq));
    }
}

void enter_sandbox(const isolation &sandbox) {
    if (!sandbox.chroot_dir.empty()) {
        if (chroot(sandbox.chroot_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chroot to {}", sandbox.chroot_dir));
        if (chdir("/") != 0)
            throw system_error(errno, generic_category(), "unable to chdir to / in chroot");
    }

    if (!sandbox.work_dir.empty() && chdir(sandbox.work_dir.c_str()) != 0)
        throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", sandbox.work_dir));

    // 先切换用户组，切换用户之后就没有权限了
    if (sandbox.group_id >= 0) {
        gid_t gid = sandbox.group_id;
        if (setgroups(1, &gid) != 0)
            throw system_error(errno, generic_category(), "unable to clear supplementary groups");
        if (setgid(gid) != 0)
            throw system_error(errno, generic_category(), "unable to set group id");
    }

    uid_t uid = sandbox.user_id >= 0 ? (uid_t)sandbox.user_id : getuid();
    if (setuid(uid) != 0)
        throw system_error(errno, generic_category(), "unable to set user id");

    if (geteuid() == 0 || getuid() == 0)
        throw runtime_error("refusing to run user code as root");
}

void load_syscall_filter(const vector<string> &syscalls) {
    if (syscalls.empty()) return;

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_KILL_PROCESS);
    if (!ctx) throw runtime_error("unable to initialize seccomp filter");

    for (auto &name : syscalls) {
        int nr = seccomp_syscall_resolve_name(name.c_str());
        if (nr == __NR_SCMP_ERROR) {
            // 当前架构上不存在的系统调用，比如 aarch64 上的 open
            DLOG(INFO) << "syscall " << name << " does not exist on this architecture";
            continue;
        }
        int ret = seccomp_rule_add(ctx, SCMP_ACT_ALLOW, nr, 0);
        if (ret < 0) {
            seccomp_release(ctx);
            throw system_error(-ret, generic_category(), fmt::format("unable to allow syscall {}", name));
        }
    }

    int ret = seccomp_load(ctx);
    seccomp_release(ctx);
    if (ret < 0)
        throw system_error(-ret, generic_category(), "unable to load seccomp filter");
}
