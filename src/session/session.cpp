#include "session/session.hpp"
#include <fmt/core.h>
#include <boost/assign.hpp>
#include <map>
#include <set>
#include "common/exceptions.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

// clang-format off
static const map<session_state, set<session_state>> TRANSITIONS = boost::assign::map_list_of
    (session_state::CREATED, set<session_state>{session_state::PROVISIONING, session_state::CLOSING})
    (session_state::PROVISIONING, set<session_state>{session_state::READY, session_state::FAILED, session_state::CLOSING})
    (session_state::READY, set<session_state>{session_state::EXECUTING, session_state::CLOSING})
    (session_state::EXECUTING, set<session_state>{session_state::READY, session_state::FAILED, session_state::CLOSING})
    (session_state::CLOSING, set<session_state>{session_state::CLOSED})
    (session_state::CLOSED, set<session_state>{})
    (session_state::FAILED, set<session_state>{});
// clang-format on

bool can_transition(session_state from, session_state to) {
    auto it = TRANSITIONS.find(from);
    return it != TRANSITIONS.end() && it->second.count(to) > 0;
}

session_state session::state() const {
    scoped_lock guard(state_mut);
    return current;
}

void session::transition(session_state to) {
    scoped_lock guard(state_mut);
    if (!can_transition(current, to))
        BOOST_THROW_EXCEPTION(invalid_transition(fmt::format("session {} cannot move from {} to {}", id, get_display_message(current), get_display_message(to))));
    current = to;
}

void session::bind(sandbox_instance *instance) {
    scoped_lock guard(state_mut);
    sandbox = instance;
    bound_sandbox = instance ? instance->id : "";
}

string session::unbind() {
    scoped_lock guard(state_mut);
    sandbox = nullptr;
    string previous;
    previous.swap(bound_sandbox);
    return previous;
}

string session::sandbox_id() const {
    scoped_lock guard(state_mut);
    return bound_sandbox;
}

json session::metadata() const {
    json executions_json = json::array();
    {
        scoped_lock guard(queue_mut);
        for (auto &exec : executions)
            executions_json.push_back(json{{"execution_id", exec->id}, {"status", get_display_message(exec->status)}});
    }
    return {{"session_id", id},
            {"language", language},
            {"state", get_display_message(state())},
            {"created_at", created_at},
            {"last_active", last_active.load()},
            {"resource_profile", profile},
            {"network", network},
            {"sandbox_id", sandbox_id()},
            {"executions", executions_json}};
}

}  // namespace tci
