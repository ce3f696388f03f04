#include "session/session_manager.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "monitor/monitor.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, session_config &config) {
    string policy = get_value_def<string>(j, "queue", "busy_policy");
    if (policy == "queue")
        config.busy = busy_policy::QUEUE;
    else if (policy == "reject")
        config.busy = busy_policy::REJECT;
    else
        throw invalid_argument("unknown busy policy " + policy);
    assign_optional(j, config.idle_timeout, "idle_timeout");
    assign_optional(j, config.reaper_interval, "reaper_interval");
    assign_optional(j, config.execution_retention, "execution_retention");
}

void from_json(const json &j, execution_request &request) {
    j.at("code").get_to(request.code);
    assign_optional(j, request.tests, "tests");
    assign_optional(j, request.files, "files");
    if (exists(j, "deadline")) request.deadline = get_value<double>(j, "deadline");
}

session_manager::session_manager(const session_config &config, sandbox_pool &pool, const security_gate &gate,
                                 resource_governor &governor, state_store &store, execution_dispatcher &dispatcher)
    : config(config), pool(pool), gate(gate), governor(governor), store(store), dispatcher(dispatcher) {}

session_manager::~session_manager() {
    stop_reaper();
}

shared_ptr<session> session_manager::find(const string &session_id) const {
    {
        scoped_lock guard(mut);
        auto it = sessions.find(session_id);
        if (it != sessions.end()) return it->second;
    }
    if (ended(session_id))
        BOOST_THROW_EXCEPTION(session_closed("session " + session_id + " is closed"));
    BOOST_THROW_EXCEPTION(not_found_error("session " + session_id + " does not exist"));
}

bool session_manager::ended(const string &session_id) const {
    auto metadata = retry_once([&] { return store.get(session_id); });
    if (!metadata || !metadata->is_object()) return false;
    string state = get_value_def<string>(*metadata, "", "state");
    return state == get_display_message(session_state::CLOSED) || state == get_display_message(session_state::FAILED);
}

void session_manager::touch(session &s) const {
    s.last_active = unix_millis();
}

void session_manager::persist(const session &s) {
    json metadata = s.metadata();
    retry_once([&] { store.put(s.id, metadata); });
}

string session_manager::create_session(const string &language, const json &resource_profile, const network_request &network) {
    runtime_policy policy = gate.make_policy(network);

    auto s = make_shared<session>();
    s->id = generate_uuid();
    s->language = language;
    s->created_at = unix_millis();
    s->last_active = s->created_at;
    s->profile = governor.admit(resource_profile);
    s->network = network;
    {
        scoped_lock guard(mut);
        sessions[s->id] = s;
    }

    s->transition(session_state::PROVISIONING);
    try {
        s->bind(pool.acquire(language, s->profile, s->id));
        gate.attach(*s->sandbox, policy);
        s->transition(session_state::READY);
        persist(*s);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to provision session " << s->id << ": " << ex.what();
        string sandbox_id = s->unbind();
        if (!sandbox_id.empty()) pool.release(sandbox_id, {});
        if (can_transition(s->state(), session_state::FAILED))
            s->transition(session_state::FAILED);
        // 失败的会话只保留在状态存储里，之后的请求据此回复 session_closed
        try {
            persist(*s);
        } catch (std::exception &persist_ex) {
            LOG(ERROR) << "Unable to persist failed session " << s->id << ": " << persist_ex.what();
        }
        {
            scoped_lock guard(mut);
            sessions.erase(s->id);
        }
        throw;
    }

    LOG(INFO) << "Session " << s->id << " (" << language << ") is ready on sandbox " << s->sandbox_id();
    call_monitor([&](monitor &m) { m.session_created(s->id, language); });
    return s->id;
}

void session_manager::close_session(const string &session_id) {
    shared_ptr<session> s;
    {
        scoped_lock guard(mut);
        auto it = sessions.find(session_id);
        if (it != sessions.end()) s = it->second;
    }
    if (!s) {
        if (ended(session_id)) return;
        BOOST_THROW_EXCEPTION(not_found_error("session " + session_id + " does not exist"));
    }

    {
        unique_lock<mutex> lock(s->queue_mut);
        // 另一个线程正在关闭这个会话时等待其结束，若其失败则由当前线程重试
        s->queue_cond.wait(lock, [&] { return !s->closing_requested || s->close_finished; });
        if (s->close_finished) return;
        s->closing_requested = true;
        s->queue_cond.notify_all();
        // 正在执行的代码一定会在截止时间后结束，这里的等待是有界的
        s->queue_cond.wait(lock, [&] { return !s->running; });
    }

    bool finished = false;
    defer {
        {
            scoped_lock guard(s->queue_mut);
            if (finished)
                s->close_finished = true;
            else
                s->closing_requested = false;
        }
        s->queue_cond.notify_all();
    };

    if (can_transition(s->state(), session_state::CLOSING))
        s->transition(session_state::CLOSING);
    string sandbox_id = s->unbind();
    if (!sandbox_id.empty()) pool.release(sandbox_id, {});

    retry_once([&] { store.delete_all(s->id); });
    if (s->state() == session_state::CLOSING)
        s->transition(session_state::CLOSED);
    persist(*s);
    finished = true;

    {
        scoped_lock guard(mut);
        sessions.erase(s->id);
    }
    LOG(INFO) << "Session " << s->id << " closed";
    session_state final_state = s->state();
    call_monitor([&](monitor &m) { m.session_closed(s->id, final_state); });
}

void session_manager::upload_file(const string &session_id, const string &path, const string &content) {
    auto s = find(session_id);
    string safe_path = assert_safe_path(path);
    touch(*s);
    retry_once([&] { store.put_file(s->id, safe_path, content); });
}

string session_manager::download_file(const string &session_id, const string &path) {
    auto s = find(session_id);
    string safe_path = assert_safe_path(path);
    touch(*s);
    auto content = retry_once([&] { return store.get_file(s->id, safe_path); });
    if (!content)
        BOOST_THROW_EXCEPTION(not_found_error(fmt::format("file {} does not exist in session {}", safe_path, session_id)));
    return *content;
}

vector<file_info> session_manager::list_files(const string &session_id) {
    auto s = find(session_id);
    touch(*s);
    return retry_once([&] { return store.list_files(s->id); });
}

json session_manager::session_info(const string &session_id) {
    auto s = find(session_id);
    return s->metadata();
}

void session_manager::retain(session &s, shared_ptr<const execution> exec) {
    scoped_lock guard(s.queue_mut);
    s.executions.push_back(move(exec));
    while (s.executions.size() > max<size_t>(config.execution_retention, 1))
        s.executions.pop_front();
}

shared_ptr<const execution> session_manager::reject(session &s, shared_ptr<execution> exec, const scan_report &report) {
    exec->status = execution_status::SECURITY_REJECTED;
    exec->violations = report.violations;
    exec->message = "code was rejected by the static security scan";
    exec->finished_at = unix_millis();
    for (auto &test : exec->tests)
        exec->test_results.push_back({test.name, false, 0, "execution was rejected before running"});

    LOG(INFO) << "Execution " << exec->id << " of session " << s.id << " rejected: " << report.violations.front().rule;
    call_monitor([&](monitor &m) {
        m.security_violation_detected(s.id, exec->id, exec->violations);
        m.execution_finished(*exec);
    });
    retain(s, exec);
    return exec;
}

void session_manager::rebind(session &s, const execution &exec) {
    release_outcome outcome;
    outcome.security_violation = exec.status == execution_status::SECURITY_REJECTED;
    outcome.resource_killed = exec.usage.oom || exec.usage.cpu_killed || exec.usage.file_size_killed;
    string previous = s.unbind();
    pool.release(previous, outcome);

    try {
        sandbox_instance *sandbox = pool.acquire(s.language, s.profile, s.id);
        s.bind(sandbox);
        gate.attach(*sandbox, gate.make_policy(s.network));
        s.transition(session_state::READY);
        LOG(INFO) << "Session " << s.id << " moved to sandbox " << sandbox->id;
    } catch (provisioning_error &ex) {
        LOG(ERROR) << "Unable to bind a new sandbox to session " << s.id << endl
                   << boost::diagnostic_information(ex);
        string sandbox_id = s.unbind();
        if (!sandbox_id.empty()) pool.release(sandbox_id, {});
        s.transition(session_state::FAILED);
    }
}

shared_ptr<const execution> session_manager::run_execution(const string &session_id, const execution_request &request) {
    auto s = find(session_id);
    touch(*s);

    auto exec = make_shared<execution>();
    exec->id = generate_uuid();
    exec->session_id = s->id;
    exec->code = request.code;
    exec->tests = request.tests;
    exec->limits = s->profile;
    exec->started_at = unix_millis();

    for (auto &path : request.files) assert_safe_path(path);

    // 静态扫描在排队之前完成，被拒绝的代码不会占用会话和沙箱
    scan_report report = gate.scan(s->language, request.code);
    if (report.rejected()) return reject(*s, exec, report);

    {
        unique_lock<mutex> lock(s->queue_mut);
        if (s->closing_requested)
            BOOST_THROW_EXCEPTION(session_closed("session " + s->id + " is closing"));
        if (config.busy == busy_policy::REJECT && (s->running || !s->waiting.empty()))
            BOOST_THROW_EXCEPTION(session_busy("session " + s->id + " is executing another request"));

        uint64_t ticket = s->next_ticket++;
        s->waiting.push_back(ticket);
        s->queue_cond.wait(lock, [&] {
            return (!s->running && s->waiting.front() == ticket) || s->closing_requested;
        });
        if (s->closing_requested) {
            s->waiting.erase(std::find(s->waiting.begin(), s->waiting.end(), ticket));
            s->queue_cond.notify_all();
            BOOST_THROW_EXCEPTION(session_closed("session " + s->id + " was closed while the request was queued"));
        }
        s->waiting.pop_front();
        s->running = true;
    }
    defer {
        {
            scoped_lock guard(s->queue_mut);
            s->running = false;
        }
        s->queue_cond.notify_all();
        touch(*s);
    };

    if (s->state() != session_state::READY)
        BOOST_THROW_EXCEPTION(session_closed(fmt::format("session {} is {}", s->id, get_display_message(s->state()))));

    try {
        dispatcher.dispatch(*s, *exec, request.files, request.deadline);
    } catch (std::exception &ex) {
        if (s->state() == session_state::EXECUTING) rebind(*s, *exec);
        throw;
    }
    if (s->state() == session_state::EXECUTING) rebind(*s, *exec);

    retain(*s, exec);
    persist(*s);
    return exec;
}

size_t session_manager::evict_idle() {
    if (config.idle_timeout <= 0) return 0;
    int64_t now = unix_millis();
    vector<string> idle;
    {
        scoped_lock guard(mut);
        for (auto &[id, s] : sessions) {
            scoped_lock queue_guard(s->queue_mut);
            bool busy = s->running || !s->waiting.empty() || s->closing_requested;
            if (!busy && now - s->last_active > config.idle_timeout * 1000)
                idle.push_back(id);
        }
    }

    size_t evicted = 0;
    for (auto &id : idle) {
        try {
            LOG(INFO) << "Evicting idle session " << id;
            close_session(id);
            ++evicted;
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to evict session " << id << endl
                       << boost::diagnostic_information(ex);
            report_error(ex.what());
        }
    }
    return evicted;
}

void session_manager::close_all() {
    vector<string> ids;
    {
        scoped_lock guard(mut);
        for (auto &[id, s] : sessions) ids.push_back(id);
    }
    for (auto &id : ids) {
        try {
            close_session(id);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to close session " << id << ": " << ex.what();
        }
    }
}

void session_manager::reaper_loop() {
    unique_lock<mutex> lock(reaper_mut);
    auto interval = chrono::milliseconds((int64_t)(config.reaper_interval * 1000));
    while (!reaper_cond.wait_for(lock, interval, [this] { return reaper_stop; })) {
        lock.unlock();
        evict_idle();
        lock.lock();
    }
}

void session_manager::start_reaper() {
    if (reaper.joinable()) return;
    {
        scoped_lock guard(reaper_mut);
        reaper_stop = false;
    }
    reaper = thread([this] { reaper_loop(); });
}

void session_manager::stop_reaper() {
    {
        scoped_lock guard(reaper_mut);
        reaper_stop = true;
    }
    reaper_cond.notify_all();
    if (reaper.joinable()) reaper.join();
}

size_t session_manager::size() const {
    scoped_lock guard(mut);
    return sessions.size();
}

}  // namespace tci
