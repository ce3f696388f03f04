#include "runtime/process_runtime.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <cmath>
#include <cstring>
#include <system_error>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "runguard.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

// runguard 自己会在硬时间限制时杀死用户进程，这里多等待一段时间再杀死 runguard
static const double RUNGUARD_EXTRA_WAIT = 1.0;

// 发送 SIGTERM 之后等待多久再发送 SIGKILL
static const double KILL_DELAY = 2.0;

void from_json(const json &j, process_runtime_config &config) {
    assign_optional(j, config.language, "language");
    config.image = get_value_def<string>(j, "", "image");
    string mode = get_value_def<string>(j, "runguard", "launcher");
    if (mode == "runguard")
        config.mode = launch_mode::RUNGUARD;
    else if (mode == "direct")
        config.mode = launch_mode::DIRECT;
    else
        throw invalid_argument("unknown launcher " + mode);
    assign_optional(j, config.limit_address_space, "limit_address_space");
}

process_runtime::process_runtime(const process_runtime_config &config) : config(config) {
    if (this->config.image.empty())
        this->config.image = EXEC_DIR / "run" / config.language;
}

string process_runtime::language() const {
    return config.language;
}

void process_runtime::prepare(const fs::path &root) {
    if (!fs::exists(config.image / "run"))
        BOOST_THROW_EXCEPTION(provisioning_error(fmt::format("runtime image {} of {} does not exist", config.image, config.language)));

    try {
        fs::create_directories(root);
        fs::copy(config.image, root / "image", fs::copy_options::recursive | fs::copy_options::overwrite_existing);
        fs::permissions(root / "image" / "run",
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add);

        // 用户代码以 RUN_USER 运行，需要能写入工作目录和结果目录
        for (auto dir : {root / "work", root / "output"}) {
            fs::create_directories(dir);
            fs::permissions(dir, fs::perms::all);
        }
    } catch (fs::filesystem_error &e) {
        BOOST_THROW_EXCEPTION(provisioning_error(fmt::format("unable to load runtime image into {}: {}", root, e.what())));
    }
    this->root = root;
}

vector<string> process_runtime::build_command(const runtime_request &request) const {
    vector<string> command;
    to_string_list(command, request.root / "image" / "run", request.root / "program.code", request.root / "output" / "result.json");
    if (config.mode == launch_mode::DIRECT) return command;

    vector<string> argv;
    // clang-format off
    to_string_list(argv, RUNGUARD,
        "--work-dir", request.root / "work",
        "--wall-time", fmt::format("{:.3f}", request.wall_time),
        "--cpu-time", fmt::format("{:.3f}", request.limits.cpu_time),
        "--memory-limit", request.limits.memory_limit,
        "--file-limit", request.limits.file_limit,
        "--nproc", request.limits.proc_limit,
        "--stream-size", request.limits.output_limit,
        "--standard-output-file", request.root / "program.out",
        "--standard-error-file", request.root / "program.err",
        "--out-meta", request.root / "program.meta",
        "--no-core-dumps");
    // clang-format on
    if (!RUN_USER.empty()) to_string_list(argv, "--user", RUN_USER);
    if (!RUN_GROUP.empty()) to_string_list(argv, "--group", RUN_GROUP);
    if (!request.policy.syscall_allowlist.empty())
        to_string_list(argv, "--syscalls", boost::algorithm::join(request.policy.syscall_allowlist, ","));
    if (request.policy.network_enabled)
        to_string_list(argv, "--egress", boost::algorithm::join(request.policy.egress_allowlist, ","),
                       "-V", "TCI_EGRESS_ALLOWLIST=" + boost::algorithm::join(request.policy.egress_allowlist, ","));
    argv.push_back("--");
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}

static bool set_limit(int resource, rlim_t value) {
    struct rlimit lim;
    lim.rlim_cur = value;
    lim.rlim_max = value;
    return setrlimit(resource, &lim) == 0;
}

runtime_output process_runtime::execute(const runtime_request &request) {
    runtime_output output;
    terminate_requested = false;

    for (auto name : {"program.meta", "program.out", "program.err"})
        fs::remove(request.root / name);
    fs::remove(request.root / "output" / "result.json");
    write_file_content(request.root / "program.code", request.code);

    spawn_options options;
    if (config.mode == launch_mode::DIRECT) {
        options.work_dir = request.root / "work";
        options.stdout_file = request.root / "program.out";
        options.stderr_file = request.root / "program.err";

        rlim_t cpu = (rlim_t)ceil(request.limits.cpu_time);
        rlim_t memory = request.limits.memory_limit * 1024;
        rlim_t file = request.limits.file_limit * 1024;
        bool limit_address_space = config.limit_address_space;
        options.before_exec = [cpu, memory, file, limit_address_space]() {
            if (!set_limit(RLIMIT_CPU, cpu)) return false;
            if (!set_limit(RLIMIT_FSIZE, file)) return false;
            if (!set_limit(RLIMIT_CORE, 0)) return false;
            if (limit_address_space && !set_limit(RLIMIT_AS, memory)) return false;
            return true;
        };
    }

    vector<string> argv = build_command(request);
    DLOG(INFO) << "Execution " << request.execution_id << ": " << boost::algorithm::join(argv, " ");

    pid_t pid;
    try {
        pid = spawn_process(argv, options);
    } catch (system_error &e) {
        output.internal_error = e.what();
        return output;
    }

    elapsed_time timer;
    double kill_after = request.wall_time + (config.mode == launch_mode::RUNGUARD ? RUNGUARD_EXTRA_WAIT : 0);
    double signalled_at = -1;
    int status = 0;
    struct rusage usage;
    while (true) {
        pid_t r = wait4(pid, &status, WNOHANG, &usage);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            output.internal_error = fmt::format("wait4 failed: {}", strerror(errno));
            kill(-pid, SIGKILL);
            return output;
        }

        double seconds = timer.duration<chrono::milliseconds>().count() / 1000.0;
        if (signalled_at < 0 && (terminate_requested || seconds > kill_after)) {
            output.timed_out = true;
            signalled_at = seconds;
            if (config.mode == launch_mode::RUNGUARD) {
                // runguard 收到 SIGTERM 后会杀死用户进程组并清理 cgroup
                kill(pid, SIGTERM);
            } else {
                kill(-pid, SIGKILL);
            }
        } else if (signalled_at >= 0 && seconds > signalled_at + KILL_DELAY) {
            LOG(WARNING) << "Execution " << request.execution_id << " did not stop after SIGTERM, sending SIGKILL";
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            signalled_at = seconds;
        }
        this_thread::sleep_for(chrono::milliseconds(5));
    }

    // 清理进程组中残留的进程
    kill(-pid, SIGKILL);

    if (WIFEXITED(status)) {
        output.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.signal = WTERMSIG(status);
        output.exitcode = 128 + output.signal;
    }
    output.usage.wall_time = timer.duration<chrono::milliseconds>().count() / 1000.0;

    if (config.mode == launch_mode::RUNGUARD) {
        collect_runguard_result(request, output);
    } else {
        output.usage.cpu_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1e-6 +
                                usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1e-6;
        output.usage.memory_bytes = (int64_t)usage.ru_maxrss * 1024;
        output.usage.cpu_killed = output.signal == SIGXCPU;
        output.usage.file_size_killed = output.signal == SIGXFSZ;
        if (output.signal == SIGSYS)
            output.violations.push_back({"syscall", "process killed by a disallowed system call", 0});
        if (output.exitcode == 126 || output.exitcode == 127)
            LOG(WARNING) << "Execution " << request.execution_id << " may have failed to start the runtime, exit code " << output.exitcode;
    }

    bool truncated;
    output.stdout_text = read_file_prefix(request.root / "program.out", request.limits.output_limit, truncated);
    output.stdout_truncated |= truncated;
    output.stderr_text = read_file_prefix(request.root / "program.err", request.limits.output_limit, truncated);
    output.stderr_truncated |= truncated;
    if (config.mode == launch_mode::DIRECT) {
        error_code ec;
        auto out_size = fs::file_size(request.root / "program.out", ec);
        output.usage.stdout_bytes = ec ? output.stdout_text.size() : out_size;
        auto err_size = fs::file_size(request.root / "program.err", ec);
        output.usage.stderr_bytes = ec ? output.stderr_text.size() : err_size;
    }

    // 解释器自身捕获的内存不足不会触发 OOM killer，由运行脚本在结果文件中报告异常类型
    if (!collect_harness_result(request, output)) {
        // V8 堆耗尽时直接中止进程，来不及写结果文件
        if ((output.signal == SIGABRT || output.signal == SIGTRAP) &&
            boost::algorithm::contains(output.stderr_text, "JavaScript heap out of memory"))
            output.usage.oom = true;
    }
    return output;
}

void process_runtime::collect_runguard_result(const runtime_request &request, runtime_output &output) const {
    fs::path metafile = request.root / "program.meta";
    if (!fs::exists(metafile)) {
        output.internal_error = fmt::format("runguard exited with code {} without writing metadata", output.exitcode);
        return;
    }

    runguard_result result = read_runguard_result(metafile);
    output.exitcode = result.exitcode;
    output.signal = result.signal;
    output.usage.cpu_time = max(result.cpu_time, 0.0);
    if (result.wall_time >= 0) output.usage.wall_time = result.wall_time;
    output.usage.memory_bytes = max<int64_t>(result.memory, 0);
    output.usage.oom = result.memory_result == "oom";
    output.usage.stdout_bytes = result.stdout_bytes;
    output.usage.stderr_bytes = result.stderr_bytes;
    output.usage.cpu_killed = result.time_kind == "cpu" || result.signal == SIGXCPU;
    output.usage.file_size_killed = result.signal == SIGXFSZ;
    if (result.time_kind == "wall") output.timed_out = true;
    output.stdout_truncated = boost::algorithm::contains(result.output_truncated, "stdout");
    output.stderr_truncated = boost::algorithm::contains(result.output_truncated, "stderr");
    if (result.violation == "network")
        output.violations.push_back({"network", "connection to an endpoint outside the egress allowlist was rejected", 0});
    else if (!result.violation.empty())
        output.violations.push_back({result.violation, "process killed by a disallowed system call", 0});
    if (!result.internal_error.empty())
        output.internal_error = "runguard: " + result.internal_error;
}

bool process_runtime::collect_harness_result(const runtime_request &request, runtime_output &output) const {
    fs::path result_file = request.root / "output" / "result.json";
    if (!fs::exists(result_file)) return false;
    try {
        json j = json::parse(read_file_content(result_file));
        output.has_value = get_value_def<bool>(j, false, "has_value");
        if (output.has_value) output.value = j.at("value");
        if (j.count("bindings") && j.at("bindings").is_object())
            output.bindings = j.at("bindings");
        if (j.count("error_type") && j.at("error_type").is_string())
            output.usage.oom |= j.at("error_type").get<string>() == "MemoryError";
    } catch (json::exception &e) {
        LOG(WARNING) << "Execution " << request.execution_id << " wrote malformed result file: " << e.what();
        return false;
    }
    return true;
}

void process_runtime::terminate() {
    terminate_requested = true;
}

bool process_runtime::filters_egress() const {
    return config.mode == launch_mode::RUNGUARD;
}

bool process_runtime::healthy() const {
    return !root.empty() && fs::exists(root / "image" / "run") && fs::is_directory(root / "work");
}

}  // namespace tci
