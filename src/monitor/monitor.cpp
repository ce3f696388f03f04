#include "monitor/monitor.hpp"
#include <glog/logging.h>
#include <mutex>

namespace tci {
using namespace std;

monitor::~monitor() = default;

void monitor::session_created(const string &, const string &) {}

void monitor::session_closed(const string &, session_state) {}

void monitor::execution_started(const execution &) {}

void monitor::execution_finished(const execution &) {}

void monitor::security_violation_detected(const string &, const string &, const vector<security_violation> &) {}

void monitor::sandbox_destroyed(const string &, const string &) {}

void monitor::report_error(const string &) {}

static mutex monitors_mutex;
static vector<unique_ptr<monitor>> monitors;

void register_monitor(unique_ptr<monitor> &&monitor) {
    lock_guard<mutex> guard(monitors_mutex);
    monitors.push_back(move(monitor));
}

void clear_monitors() {
    lock_guard<mutex> guard(monitors_mutex);
    monitors.clear();
}

void call_monitor(const function<void(monitor &)> &callback) {
    lock_guard<mutex> guard(monitors_mutex);
    for (auto &m : monitors) {
        try {
            callback(*m);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Monitor crashed when reporting monitoring information, " << ex.what();
        }
    }
}

void report_error(const string &message) {
    call_monitor([&](monitor &m) { m.report_error(message); });
}

}  // namespace tci
