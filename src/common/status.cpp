#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace tci {
using namespace std;

// clang-format off
static const unordered_map<execution_status, const char *> execution_status_string = boost::assign::map_list_of
    (execution_status::CREATED, "Created")
    (execution_status::RUNNING, "Running")
    (execution_status::SUCCEEDED, "Succeeded")
    (execution_status::FAILED, "Failed")
    (execution_status::TIMED_OUT, "TimedOut")
    (execution_status::SECURITY_REJECTED, "SecurityRejected")
    (execution_status::RESOURCE_EXCEEDED, "ResourceExceeded");

static const unordered_map<session_state, const char *> session_state_string = boost::assign::map_list_of
    (session_state::CREATED, "Created")
    (session_state::PROVISIONING, "Provisioning")
    (session_state::READY, "Ready")
    (session_state::EXECUTING, "Executing")
    (session_state::CLOSING, "Closing")
    (session_state::CLOSED, "Closed")
    (session_state::FAILED, "Failed");

static const unordered_map<sandbox_health, const char *> sandbox_health_string = boost::assign::map_list_of
    (sandbox_health::WARMING, "Warming")
    (sandbox_health::READY, "Ready")
    (sandbox_health::BUSY, "Busy")
    (sandbox_health::DRAINING, "Draining")
    (sandbox_health::DEAD, "Dead");
// clang-format on

const char *get_display_message(execution_status stat) {
    return execution_status_string.at(stat);
}

const char *get_display_message(session_state state) {
    return session_state_string.at(state);
}

const char *get_display_message(sandbox_health health) {
    return sandbox_health_string.at(health);
}

bool is_terminal(execution_status stat) {
    return stat != execution_status::CREATED && stat != execution_status::RUNNING;
}

bool is_terminal(session_state state) {
    return state == session_state::CLOSED || state == session_state::FAILED;
}

}  // namespace tci
