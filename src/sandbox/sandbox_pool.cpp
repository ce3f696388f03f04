#include "sandbox/sandbox_pool.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <chrono>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "monitor/monitor.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, pool_config &config) {
    assign_optional(j, config.capacity, "capacity");
    string mode = get_value_def<string>(j, "block", "backpressure");
    if (mode == "block")
        config.backpressure = backpressure_mode::BLOCK;
    else if (mode == "fail_fast")
        config.backpressure = backpressure_mode::FAIL_FAST;
    else
        throw invalid_argument("unknown backpressure mode " + mode);
    assign_optional(j, config.acquire_timeout, "acquire_timeout");
    assign_optional(j, config.warm_size, "warm_size");
    assign_optional(j, config.warm_languages, "warm_languages");
    assign_optional(j, config.graveyard_size, "graveyard_size");
    if (config.capacity == 0)
        throw invalid_argument("sandbox pool capacity must be positive");
}

sandbox_pool::sandbox_pool(const pool_config &config, runtime_registry &registry)
    : config(config), registry(registry) {}

sandbox_pool::~sandbox_pool() {
    stop_warmer();

    map<string, unique_ptr<sandbox_instance>> remaining;
    {
        scoped_lock guard(mut);
        remaining.swap(instances);
        leases.clear();
        idle_instances.clear();
        live_count = 0;
    }
    for (auto &[id, instance] : remaining)
        destroy(move(instance), "pool shutdown");
}

bool sandbox_pool::reserve_slot_locked(const string &language, unique_ptr<sandbox_instance> &victim) {
    if (live_count < config.capacity) {
        ++live_count;
        return true;
    }

    // 池已满，淘汰一个其他语言的空闲实例，容量直接转给新实例
    for (auto &[idle_language, queue] : idle_instances) {
        if (idle_language == language || queue.empty()) continue;
        string id = queue.front();
        queue.pop_front();
        auto it = instances.find(id);
        victim = move(it->second);
        instances.erase(it);
        victim->health = sandbox_health::DEAD;
        bury_locked(id);
        return true;
    }
    return false;
}

unique_ptr<sandbox_instance> sandbox_pool::create_instance(const string &language) {
    auto instance = make_unique<sandbox_instance>();
    instance->id = generate_uuid();
    instance->language = language;
    instance->root = SANDBOX_DIR / instance->id;

    try {
        instance->runtime = registry.create(language);
        instance->runtime->prepare(instance->root);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to warm sandbox " << instance->id << " for " << language << ": " << ex.what();
        {
            scoped_lock guard(mut);
            --live_count;
        }
        cond.notify_all();
        error_code ec;
        filesystem::remove_all(instance->root, ec);
        if (dynamic_cast<provisioning_error *>(&ex)) throw;
        BOOST_THROW_EXCEPTION(provisioning_error(string("unable to prepare sandbox: ") + ex.what()));
    }

    instance->health = sandbox_health::READY;
    DLOG(INFO) << "Sandbox " << instance->id << " for " << language << " is ready";
    return instance;
}

sandbox_instance *sandbox_pool::acquire(const string &language, const resource_profile &ceilings, const string &owner) {
    if (!registry.supports(language))
        BOOST_THROW_EXCEPTION(provisioning_error("unsupported language " + language));

    unique_ptr<sandbox_instance> victim;
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds((int64_t)(config.acquire_timeout * 1000));
    {
        unique_lock<mutex> lock(mut);
        bool timed_out = false;
        while (true) {
            auto &queue = idle_instances[language];
            if (!queue.empty()) {
                string id = queue.front();
                queue.pop_front();
                sandbox_instance *instance = instances.at(id).get();
                instance->lease_owner = owner;
                instance->ceilings = ceilings;
                leases[id] = owner;
                return instance;
            }

            if (reserve_slot_locked(language, victim)) break;

            if (config.backpressure == backpressure_mode::FAIL_FAST || timed_out)
                BOOST_THROW_EXCEPTION(pool_exhausted(fmt::format("sandbox pool is full ({} instances)", config.capacity)));

            if (cond.wait_until(lock, deadline) == cv_status::timeout)
                timed_out = true;
        }
    }

    if (victim) destroy(move(victim), "evicted for " + language);

    auto instance = create_instance(language);
    sandbox_instance *result = instance.get();
    instance->lease_owner = owner;
    instance->ceilings = ceilings;

    scoped_lock guard(mut);
    leases[result->id] = owner;
    instances[result->id] = move(instance);
    return result;
}

void sandbox_pool::release(const string &instance_id, const release_outcome &outcome) {
    sandbox_instance *instance;
    {
        scoped_lock guard(mut);
        auto it = instances.find(instance_id);
        if (it == instances.end() || !leases.count(instance_id)) {
            DLOG(INFO) << "Ignored release of sandbox " << instance_id << " which is not leased";
            return;
        }
        leases.erase(instance_id);
        instance = it->second.get();
        instance->lease_owner.clear();
        instance->health = sandbox_health::DRAINING;
    }

    // 此时实例既不在租约表也不在空闲队列中，只有当前线程会访问它
    string reason;
    if (outcome.security_violation)
        reason = "security violation";
    else if (outcome.resource_killed)
        reason = "killed by resource limits";
    else if (instance->flagged())
        reason = instance->flagged_reason();
    else if (!instance->runtime->healthy())
        reason = "health check failed";

    if (reason.empty()) {
        try {
            clear_directory(instance->work_dir());
            instance->policy = runtime_policy();
            instance->ceilings = resource_profile();
        } catch (std::exception &ex) {
            reason = string("reset failed: ") + ex.what();
        }
    }

    unique_ptr<sandbox_instance> doomed;
    {
        scoped_lock guard(mut);
        if (reason.empty()) {
            instance->health = sandbox_health::READY;
            idle_instances[instance->language].push_back(instance_id);
        } else {
            auto it = instances.find(instance_id);
            doomed = move(it->second);
            instances.erase(it);
            doomed->health = sandbox_health::DEAD;
            bury_locked(instance_id);
            --live_count;
        }
    }
    cond.notify_all();

    if (doomed) {
        string language = doomed->language;
        destroy(move(doomed), reason);
        replacements.push(language);
    }
}

void sandbox_pool::destroy(unique_ptr<sandbox_instance> instance, const string &reason) {
    instance->health = sandbox_health::DEAD;
    LOG(INFO) << "Destroying sandbox " << instance->id << ": " << reason;
    if (!DEBUG) {
        error_code ec;
        filesystem::remove_all(instance->root, ec);
        if (ec) LOG(WARNING) << "Unable to remove sandbox directory " << instance->root << ": " << ec.message();
    }
    {
        scoped_lock guard(mut);
        bury_locked(instance->id);
    }
    call_monitor([&](monitor &m) { m.sandbox_destroyed(instance->id, reason); });
}

void sandbox_pool::bury_locked(const string &instance_id) {
    if (!graveyard.insert(instance_id).second) return;
    ++destroyed_count;
    burial_order.push_back(instance_id);
    while (burial_order.size() > max<size_t>(config.graveyard_size, 1)) {
        graveyard.erase(burial_order.front());
        burial_order.pop_front();
    }
}

bool sandbox_pool::warm_one(const string &language) {
    {
        scoped_lock guard(mut);
        if (live_count >= config.capacity) return false;
        ++live_count;
    }

    auto instance = create_instance(language);
    string id = instance->id;
    {
        scoped_lock guard(mut);
        idle_instances[language].push_back(id);
        instances[id] = move(instance);
    }
    cond.notify_all();
    return true;
}

void sandbox_pool::warm_up() {
    for (auto &language : config.warm_languages) {
        while (idle(language) < config.warm_size) {
            try {
                if (!warm_one(language)) break;
            } catch (provisioning_error &ex) {
                LOG(ERROR) << "Unable to warm up sandbox for " << language << endl
                           << boost::diagnostic_information(ex);
                report_error(ex.what());
                break;
            }
        }
    }
}

void sandbox_pool::warmer_loop() {
    while (!stop) {
        string language;
        if (replacements.pop_for(language, chrono::milliseconds(500))) {
            // 只有需要预热的语言才补充实例，其他语言按需创建
            bool wanted = find(config.warm_languages.begin(), config.warm_languages.end(), language) != config.warm_languages.end();
            if (!wanted || idle(language) >= config.warm_size) continue;
            try {
                warm_one(language);
            } catch (provisioning_error &ex) {
                LOG(ERROR) << "Unable to replace sandbox for " << language << ": " << ex.what();
                report_error(ex.what());
            }
        } else {
            warm_up();
        }
    }
}

void sandbox_pool::start_warmer() {
    if (warmer.joinable()) return;
    stop = false;
    warmer = thread([this] { warmer_loop(); });
}

void sandbox_pool::stop_warmer() {
    stop = true;
    if (warmer.joinable()) warmer.join();
}

size_t sandbox_pool::capacity() const {
    return config.capacity;
}

size_t sandbox_pool::live() const {
    scoped_lock guard(mut);
    return live_count;
}

size_t sandbox_pool::leased() const {
    scoped_lock guard(mut);
    return leases.size();
}

size_t sandbox_pool::idle(const string &language) const {
    scoped_lock guard(mut);
    auto it = idle_instances.find(language);
    return it == idle_instances.end() ? 0 : it->second.size();
}

size_t sandbox_pool::destroyed() const {
    scoped_lock guard(mut);
    return destroyed_count;
}

bool sandbox_pool::is_dead(const string &instance_id) const {
    scoped_lock guard(mut);
    return graveyard.count(instance_id) > 0;
}

string sandbox_pool::lease_owner(const string &instance_id) const {
    scoped_lock guard(mut);
    auto it = leases.find(instance_id);
    return it == leases.end() ? "" : it->second;
}

}  // namespace tci
