#include "security/security_gate.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <sstream>
#include "common/exceptions.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, scan_rule &rule) {
    j.at("name").get_to(rule.name);
    j.at("pattern").get_to(rule.pattern);
    rule.language = get_value_def<string>(j, "*", "language");
    rule.detail = get_value_def<string>(j, rule.name, "detail");
}

void from_json(const json &j, security_config &config) {
    assign_optional(j, config.rules, "rules");
    assign_optional(j, config.syscalls, "syscalls");
    assign_optional(j, config.network_syscalls, "network_syscalls");
    assign_optional(j, config.max_code_bytes, "max_code_bytes");
}

bool scan_report::rejected() const {
    return !violations.empty();
}

// clang-format off
vector<scan_rule> default_scan_rules() {
    return {
        {"disallowed_import", "python3",
         R"(^\s*(from\s+(os|subprocess|socket|ctypes|pty|multiprocessing|shutil|importlib|resource|signal|fcntl|mmap|posix)(\.|\s)|import\s+([\w.]+\s*,\s*)*(os|subprocess|socket|ctypes|pty|multiprocessing|shutil|importlib|resource|signal|fcntl|mmap|posix)\b))",
         "importing system, process or network modules is not allowed"},
        {"dynamic_import", "python3", R"(__import__\s*\(|\bimportlib\b)", "dynamic imports are not allowed"},
        {"dynamic_eval", "python3", R"((^|[^.\w])(eval|exec)\s*\()", "eval and exec are not allowed"},
        {"introspection_escape", "python3", R"(__(subclasses|globals|builtins|code|mro|bases)__)", "interpreter introspection is not allowed"},
        {"obfuscation", "python3", R"(\b(base64\.b64decode|codecs\.decode|marshal\.loads|zlib\.decompress)\s*\()", "decoding code at runtime looks like obfuscation"},
        {"disallowed_require", "javascript",
         R"(require\s*\(\s*['"`](node:)?(child_process|net|http|https|http2|dgram|dns|cluster|worker_threads|vm|os|inspector|v8)['"`]\s*\))",
         "requiring process or network modules is not allowed"},
        {"dynamic_import", "javascript", R"(\bimport\s*\()", "dynamic imports are not allowed"},
        {"dynamic_eval", "javascript", R"((^|[^.\w])eval\s*\(|\bnew\s+Function\s*\()", "eval and Function constructor are not allowed"},
        {"process_escape", "javascript", R"(\bprocess\s*\.\s*(binding|dlopen|kill|_linkedBinding)\b)", "process internals are not allowed"},
        {"obfuscation", "*", R"((\\x[0-9a-fA-F]{2}){16,})", "long hex escape sequences look like obfuscation"},
        {"exploit_pattern", "*", R"(/proc/(self|\d+)/(mem|maps|environ|root)|/etc/(shadow|sudoers)|/dev/(tcp|udp)/)", "access to sensitive host paths is not allowed"},
    };
}

vector<string> default_syscall_allowlist() {
    return {
        "read", "write", "readv", "writev", "pread64", "pwrite64", "preadv", "pwritev",
        "open", "openat", "close", "close_range", "creat", "lseek",
        "stat", "fstat", "lstat", "newfstatat", "statx", "statfs", "fstatfs",
        "access", "faccessat", "faccessat2", "readlink", "readlinkat",
        "getdents", "getdents64", "getcwd", "chdir", "fchdir",
        "mkdir", "mkdirat", "rmdir", "unlink", "unlinkat", "rename", "renameat", "renameat2",
        "ftruncate", "truncate", "fsync", "fdatasync", "fcntl", "flock", "dup", "dup2", "dup3",
        "pipe", "pipe2", "poll", "ppoll", "select", "pselect6",
        "epoll_create", "epoll_create1", "epoll_ctl", "epoll_wait", "epoll_pwait", "eventfd", "eventfd2",
        "ioctl", "umask", "chmod", "fchmod", "fchmodat", "utimensat",
        "mmap", "munmap", "mprotect", "mremap", "madvise", "brk", "msync", "mincore",
        "rt_sigaction", "rt_sigprocmask", "rt_sigreturn", "rt_sigsuspend", "sigaltstack",
        "clone", "clone3", "fork", "vfork", "execve", "wait4", "waitid", "exit", "exit_group",
        "getpid", "getppid", "gettid", "getpgrp", "getpgid", "getsid", "tgkill",
        "getuid", "geteuid", "getgid", "getegid", "getgroups", "getresuid", "getresgid",
        "uname", "sysinfo", "getrlimit", "setrlimit", "prlimit64", "getrusage", "times",
        "arch_prctl", "prctl", "set_tid_address", "set_robust_list", "get_robust_list", "rseq",
        "futex", "futex_waitv", "sched_yield", "sched_getaffinity", "sched_setaffinity", "sched_getparam",
        "sched_getscheduler", "membarrier", "getcpu",
        "nanosleep", "clock_nanosleep", "clock_gettime", "clock_getres", "gettimeofday", "time",
        "timerfd_create", "timerfd_settime", "timerfd_gettime",
        "getrandom", "memfd_create", "socketpair",
    };
}
// clang-format on

static vector<string> default_network_syscalls() {
    return {"socket", "connect", "sendto", "recvfrom", "sendmsg", "recvmsg", "sendmmsg", "recvmmsg",
            "getsockopt", "setsockopt", "getsockname", "getpeername", "shutdown", "bind"};
}

security_gate::security_gate(const security_config &config) : config(config) {
    if (this->config.rules.empty()) this->config.rules = default_scan_rules();
    if (this->config.syscalls.empty()) this->config.syscalls = default_syscall_allowlist();
    if (this->config.network_syscalls.empty()) this->config.network_syscalls = default_network_syscalls();

    for (auto &rule : this->config.rules) {
        try {
            rules.push_back({rule, regex(rule.pattern, regex::ECMAScript | regex::optimize)});
        } catch (regex_error &e) {
            BOOST_THROW_EXCEPTION(invalid_argument_error("malformed scan rule " + rule.name + ": " + e.what()));
        }
    }
    LOG(INFO) << "Security gate loaded " << rules.size() << " scan rules and "
              << this->config.syscalls.size() << " allowed syscalls";
}

scan_report security_gate::scan(const string &language, const string &code) const {
    scan_report report;
    if (code.size() > config.max_code_bytes) {
        report.violations.push_back({"code_size",
                                     "code is larger than " + to_string(config.max_code_bytes) + " bytes", 0});
        return report;
    }

    istringstream in(code);
    string line;
    int lineno = 0;
    while (getline(in, line)) {
        ++lineno;
        for (auto &compiled : rules) {
            if (compiled.rule.language != "*" && compiled.rule.language != language) continue;
            if (regex_search(line, compiled.regex))
                report.violations.push_back({compiled.rule.name, compiled.rule.detail, lineno});
        }
    }
    return report;
}

static bool is_valid_endpoint(const string &endpoint) {
    auto colon = endpoint.rfind(':');
    if (colon == string::npos || colon == 0 || colon + 1 == endpoint.size()) return false;
    string host = endpoint.substr(0, colon);
    if (host.find_first_of(" /\t") != string::npos) return false;
    try {
        int port = boost::lexical_cast<int>(endpoint.substr(colon + 1));
        return port > 0 && port < 65536;
    } catch (boost::bad_lexical_cast &) {
        return false;
    }
}

runtime_policy security_gate::default_policy() const {
    runtime_policy policy;
    policy.syscall_allowlist = config.syscalls;
    return policy;
}

runtime_policy security_gate::make_policy(const network_request &network) const {
    runtime_policy policy = default_policy();
    if (!network.enabled) return policy;

    if (network.allowlist.empty())
        BOOST_THROW_EXCEPTION(invalid_argument_error("network access requires an explicit host:port allowlist"));
    for (auto &endpoint : network.allowlist)
        if (!is_valid_endpoint(endpoint))
            BOOST_THROW_EXCEPTION(invalid_argument_error("malformed egress allowlist entry " + endpoint));

    policy.network_enabled = true;
    policy.egress_allowlist = network.allowlist;
    policy.syscall_allowlist.insert(policy.syscall_allowlist.end(),
                                    config.network_syscalls.begin(), config.network_syscalls.end());
    return policy;
}

void security_gate::attach(sandbox_instance &sandbox, const runtime_policy &policy) const {
    if (policy.network_enabled && (!sandbox.runtime || !sandbox.runtime->filters_egress()))
        BOOST_THROW_EXCEPTION(provisioning_error(fmt::format("sandbox {} cannot restrict network egress, network access is unavailable", sandbox.id)));
    sandbox.policy = policy;
    DLOG(INFO) << "Attached policy to sandbox " << sandbox.id << " (network "
               << (policy.network_enabled ? boost::algorithm::join(policy.egress_allowlist, ",") : "disabled") << ")";
}

}  // namespace tci
