#include "monitor/log_monitor.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

static void emit(const char *event, json j) {
    j["event"] = event;
    j["timestamp"] = unix_millis();
    LOG(INFO) << dump_text(j);
}

void log_monitor::session_created(const string &session_id, const string &language) {
    emit("session_created", {{"session_id", session_id}, {"language", language}});
}

void log_monitor::session_closed(const string &session_id, session_state final_state) {
    emit("session_closed", {{"session_id", session_id}, {"state", get_display_message(final_state)}});
}

void log_monitor::execution_started(const execution &exec) {
    emit("execution_started", {{"session_id", exec.session_id}, {"execution_id", exec.id}, {"limits", exec.limits}});
}

void log_monitor::execution_finished(const execution &exec) {
    emit("execution_finished", {{"session_id", exec.session_id},
                                {"execution_id", exec.id},
                                {"status", get_display_message(exec.status)},
                                {"usage", exec.usage},
                                {"reward", exec.reward}});
}

void log_monitor::security_violation_detected(const string &session_id, const string &execution_id, const vector<security_violation> &violations) {
    emit("security_violation", {{"session_id", session_id}, {"execution_id", execution_id}, {"violations", violations}});
}

void log_monitor::sandbox_destroyed(const string &sandbox_id, const string &reason) {
    emit("sandbox_destroyed", {{"sandbox_id", sandbox_id}, {"reason", reason}});
}

void log_monitor::report_error(const string &message) {
    emit("error", {{"message", message}});
}

}  // namespace tci
