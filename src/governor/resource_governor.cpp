#include "governor/resource_governor.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, resource_profile &profile) {
    assign_optional(j, profile.cpu_time, "cpu_time");
    assign_optional(j, profile.memory_limit, "memory_limit");
    assign_optional(j, profile.wall_time, "wall_time");
    assign_optional(j, profile.output_limit, "output_limit");
    assign_optional(j, profile.proc_limit, "proc_limit");
    assign_optional(j, profile.file_limit, "file_limit");
}

void to_json(json &j, const resource_profile &profile) {
    j = {{"cpu_time", profile.cpu_time},
         {"memory_limit", profile.memory_limit},
         {"wall_time", profile.wall_time},
         {"output_limit", profile.output_limit},
         {"proc_limit", profile.proc_limit},
         {"file_limit", profile.file_limit}};
}

void to_json(json &j, const resource_usage &usage) {
    j = {{"cpu_time", usage.cpu_time},
         {"wall_time", usage.wall_time},
         {"memory_bytes", usage.memory_bytes},
         {"stdout_bytes", usage.stdout_bytes},
         {"stderr_bytes", usage.stderr_bytes},
         {"oom", usage.oom}};
}

void from_json(const json &j, governor_config &config) {
    if (j.count("defaults")) from_json(j.at("defaults"), config.defaults);
    if (j.count("maximum")) from_json(j.at("maximum"), config.maximum);
    assign_optional(j, config.grace_period, "grace_period");
}

const char *get_display_message(resource_verdict verdict) {
    switch (verdict) {
        case resource_verdict::WITHIN_LIMITS: return "within limits";
        case resource_verdict::CPU_EXCEEDED: return "cpu time limit exceeded";
        case resource_verdict::MEMORY_EXCEEDED: return "memory limit exceeded";
        case resource_verdict::OUTPUT_EXCEEDED: return "output limit exceeded";
    }
    return "unknown";
}

resource_governor::resource_governor(const governor_config &config) : config(config) {}

resource_profile resource_governor::admit(const json &request) const {
    resource_profile profile = config.defaults;
    if (request.is_object()) from_json(request, profile);
    return admit(profile);
}

template <typename T>
static T clamp_limit(T requested, T def_value, T maximum) {
    // 非正数表示没有指定
    if (requested <= 0) requested = def_value;
    return min(requested, maximum);
}

resource_profile resource_governor::admit(const resource_profile &requested) const {
    resource_profile profile;
    profile.cpu_time = clamp_limit(requested.cpu_time, config.defaults.cpu_time, config.maximum.cpu_time);
    profile.memory_limit = clamp_limit(requested.memory_limit, config.defaults.memory_limit, config.maximum.memory_limit);
    profile.wall_time = clamp_limit(requested.wall_time, config.defaults.wall_time, config.maximum.wall_time);
    profile.output_limit = clamp_limit(requested.output_limit, config.defaults.output_limit, config.maximum.output_limit);
    profile.proc_limit = clamp_limit(requested.proc_limit, config.defaults.proc_limit, config.maximum.proc_limit);
    profile.file_limit = clamp_limit(requested.file_limit, config.defaults.file_limit, config.maximum.file_limit);
    return profile;
}

double resource_governor::effective_wall_time(const resource_profile &profile, optional<double> deadline) const {
    if (deadline && *deadline > 0)
        return min(profile.wall_time, *deadline);
    return profile.wall_time;
}

resource_verdict resource_governor::evaluate(const resource_profile &profile, const resource_usage &usage) const {
    if (usage.oom || (profile.memory_limit > 0 && usage.memory_bytes > profile.memory_limit * 1024))
        return resource_verdict::MEMORY_EXCEEDED;
    if (usage.cpu_killed || (profile.cpu_time > 0 && usage.cpu_time > profile.cpu_time))
        return resource_verdict::CPU_EXCEEDED;
    if (usage.file_size_killed ||
        (profile.output_limit > 0 && (usage.stdout_bytes > profile.output_limit || usage.stderr_bytes > profile.output_limit)))
        return resource_verdict::OUTPUT_EXCEEDED;
    return resource_verdict::WITHIN_LIMITS;
}

void resource_governor::begin(const string &execution_id, const string &session_id, const resource_profile &profile) {
    scoped_lock guard(mut);
    if (accounts.count(execution_id))
        BOOST_THROW_EXCEPTION(internal_error("execution " + execution_id + " is already accounted"));
    accounts[execution_id] = {session_id, profile, {}, chrono::steady_clock::now()};
}

void resource_governor::record(const string &execution_id, const resource_usage &usage) {
    scoped_lock guard(mut);
    auto it = accounts.find(execution_id);
    if (it == accounts.end()) {
        LOG(WARNING) << "Recording resource usage of unknown execution " << execution_id;
        return;
    }
    it->second.usage = usage;
}

resource_usage resource_governor::end(const string &execution_id) {
    scoped_lock guard(mut);
    auto it = accounts.find(execution_id);
    if (it == accounts.end()) return {};
    resource_usage usage = it->second.usage;
    if (usage.wall_time <= 0)
        usage.wall_time = chrono::duration<double>(chrono::steady_clock::now() - it->second.started).count();
    accounts.erase(it);
    return usage;
}

size_t resource_governor::active() const {
    scoped_lock guard(mut);
    return accounts.size();
}

size_t resource_governor::active(const string &session_id) const {
    scoped_lock guard(mut);
    return count_if(accounts.begin(), accounts.end(), [&](auto &entry) {
        return entry.second.session_id == session_id;
    });
}

double resource_governor::grace_period() const {
    return config.grace_period;
}

}  // namespace tci
