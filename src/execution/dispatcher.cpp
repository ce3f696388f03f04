#include "execution/dispatcher.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <chrono>
#include <future>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "monitor/monitor.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

execution_dispatcher::execution_dispatcher(resource_governor &governor, state_store &store, const reward_evaluator &reward)
    : governor(governor), store(store), reward(reward) {}

/**
 * @brief 用户代码以 RUN_USER 运行，写入的会话文件和目录必须对其可写
 */
static void make_accessible(const fs::path &work_dir, const fs::path &file) {
    fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write |
                              fs::perms::group_read | fs::perms::group_write |
                              fs::perms::others_read | fs::perms::others_write);
    for (fs::path dir = file.parent_path(); dir != work_dir && dir.has_relative_path(); dir = dir.parent_path())
        fs::permissions(dir, fs::perms::all);
}

void execution_dispatcher::materialize(const string &session_id, const sandbox_instance &sandbox, const vector<string> &files) {
    fs::path work_dir = sandbox.work_dir();
    clear_directory(work_dir);

    vector<string> paths = files;
    if (paths.empty()) {
        for (auto &info : retry_once([&] { return store.list_files(session_id); }))
            paths.push_back(info.path);
    }

    for (auto &path : paths) {
        string safe_path = assert_safe_path(path);
        auto content = retry_once([&] { return store.get_file(session_id, safe_path); });
        if (!content)
            BOOST_THROW_EXCEPTION(not_found_error(fmt::format("file {} does not exist in session {}", safe_path, session_id)));
        write_file_content(work_dir / safe_path, *content);
        make_accessible(work_dir, work_dir / safe_path);
    }
}

void execution_dispatcher::write_back(const string &session_id, const sandbox_instance &sandbox, const directory_delta &delta) {
    for (auto &path : delta.changed) {
        string content = read_file_content(sandbox.work_dir() / path);
        retry_once([&] { store.put_file(session_id, path, content); });
    }
    for (auto &path : delta.deleted)
        retry_once([&] { return store.delete_file(session_id, path); });
}

void execution_dispatcher::classify(session &s, execution &exec, const runtime_output &output, double wall_time, bool forced) {
    sandbox_instance &sandbox = *s.sandbox;
    resource_verdict verdict = governor.evaluate(exec.limits, output.usage);
    bool killed = output.usage.oom || output.usage.cpu_killed || output.usage.file_size_killed;

    if (!output.violations.empty()) {
        exec.status = execution_status::SECURITY_REJECTED;
        exec.message = "execution was killed by the runtime security policy";
        sandbox.flag("security violation");
        call_monitor([&](monitor &m) { m.security_violation_detected(s.id, exec.id, output.violations); });
    } else if (output.timed_out || forced) {
        exec.status = execution_status::TIMED_OUT;
        exec.message = fmt::format("execution exceeded the deadline of {:.3f} seconds", wall_time);
        // 仅仅超时不影响沙箱复用，同时触发了资源上限才销毁
        if (verdict != resource_verdict::WITHIN_LIMITS && killed)
            sandbox.flag(string("timed out and ") + get_display_message(verdict));
    } else if (verdict != resource_verdict::WITHIN_LIMITS) {
        exec.status = execution_status::RESOURCE_EXCEEDED;
        exec.message = get_display_message(verdict);
        if (killed) sandbox.flag(get_display_message(verdict));
    } else if (!output.internal_error.empty()) {
        exec.status = execution_status::FAILED;
        exec.message = "internal error: " + output.internal_error;
        sandbox.flag(output.internal_error);
        report_error(fmt::format("execution {} in sandbox {}: {}", exec.id, sandbox.id, output.internal_error));
    } else if (output.exitcode != 0) {
        exec.status = execution_status::FAILED;
        if (output.signal > 0)
            exec.message = fmt::format("process was killed by signal {}", output.signal);
    } else {
        exec.status = execution_status::SUCCEEDED;
    }
}

void execution_dispatcher::dispatch(session &s, execution &exec, const vector<string> &files, optional<double> deadline) {
    if (!s.sandbox)
        BOOST_THROW_EXCEPTION(internal_error("session " + s.id + " has no bound sandbox"));
    sandbox_instance &sandbox = *s.sandbox;

    s.transition(session_state::EXECUTING);
    sandbox.health = sandbox_health::BUSY;
    governor.begin(exec.id, s.id, exec.limits);
    defer {
        governor.end(exec.id);
        if (!sandbox.flagged()) {
            sandbox.health = sandbox_health::READY;
            s.transition(session_state::READY);
        }
    };

    materialize(s.id, sandbox, files);
    directory_snapshot before = take_snapshot(sandbox.work_dir());

    runtime_request request;
    request.execution_id = exec.id;
    request.code = exec.code;
    request.root = sandbox.root;
    request.limits = exec.limits;
    request.wall_time = governor.effective_wall_time(exec.limits, deadline);
    request.policy = sandbox.policy;

    exec.status = execution_status::RUNNING;
    exec.started_at = unix_millis();
    call_monitor([&](monitor &m) { m.execution_started(exec); });

    future<runtime_output> pending = async(launch::async, [&] { return sandbox.runtime->execute(request); });

    // 运行时自己也会在时限到达时结束进程，宽限时间之后调度器强制终止
    bool forced = false;
    auto wait = chrono::milliseconds((int64_t)((request.wall_time + governor.grace_period()) * 1000));
    if (pending.wait_for(wait) == future_status::timeout) {
        LOG(WARNING) << "Execution " << exec.id << " did not finish in " << request.wall_time << "s, terminating";
        forced = true;
        sandbox.runtime->terminate();
    }

    runtime_output output;
    try {
        output = pending.get();
    } catch (std::exception &ex) {
        output.internal_error = ex.what();
    }

    exec.finished_at = unix_millis();
    exec.stdout_text = output.stdout_text;
    exec.stderr_text = output.stderr_text;
    exec.stdout_truncated = output.stdout_truncated;
    exec.stderr_truncated = output.stderr_truncated;
    exec.value = output.value;
    exec.has_value = output.has_value;
    exec.bindings = output.bindings;
    exec.exitcode = output.exitcode;
    exec.usage = output.usage;
    exec.violations = output.violations;
    governor.record(exec.id, output.usage);

    classify(s, exec, output, request.wall_time, forced);

    // 发生安全违规的执行不能修改会话文件
    if (exec.status != execution_status::SECURITY_REJECTED) {
        directory_delta delta = diff_snapshot(before, take_snapshot(sandbox.work_dir()));
        write_back(s.id, sandbox, delta);
        exec.changed_files = delta.changed;
        exec.deleted_files = delta.deleted;
    }

    if (!exec.tests.empty()) reward.score(exec);

    DLOG(INFO) << "Execution " << exec.id << " of session " << s.id << " finished: " << get_display_message(exec.status);
    call_monitor([&](monitor &m) { m.execution_finished(exec); });
}

}  // namespace tci
