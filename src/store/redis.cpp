#include "store/redis.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, redis_config &config) {
    assign_optional(j, config.host, "host");
    assign_optional(j, config.port, "port");
    assign_optional(j, config.password, "password");
}

static bool connect_to_server(cpp_redis::client &client, const redis_config &config) {
    LOG(INFO) << "Redis: Setup connection with server " << config.host << ":" << config.port;
    try {
        client.connect(config.host, config.port,
                       [](const string &host, size_t port, cpp_redis::connect_state status) {
                           if (status == cpp_redis::connect_state::dropped)
                               LOG(INFO) << "Redis: client disconnected from " << host << ":" << port;
                       });
    } catch (cpp_redis::redis_error &e) {
        LOG(ERROR) << "Redis: " << e.what();
        return false;
    }
    if (!config.password.empty()) {
        auto future = client.auth(config.password);
        client.sync_commit();
        cpp_redis::reply reply = future.get();
        if (reply.is_error()) {
            LOG(ERROR) << "Redis: Auth failed: " << reply.error();
            return false;
        }
    }
    if (client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << config.host << ":" << config.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << config.host << ":" << config.port;
        return false;
    }
}

vector<cpp_redis::reply> transaction_replies(const vector<cpp_redis::reply> &replies) {
    if (replies.empty() || !replies.back().is_array())
        BOOST_THROW_EXCEPTION(state_store_error("Redis: transaction was aborted", true));
    const vector<cpp_redis::reply> &results = replies.back().as_array();
    for (auto &r : results)
        if (r.is_error())
            BOOST_THROW_EXCEPTION(state_store_error("Redis: transaction failed: " + r.error()));
    return results;
}

redis_conn::redis_conn(const redis_config &config) : config(config) {}

void redis_conn::reconnect(bool force) {
    if (force && client.is_connected()) client.disconnect(true);
    if (!client.is_connected()) connect_to_server(client, config);
    if (!client.is_connected())
        BOOST_THROW_EXCEPTION(state_store_error("unable to connect to redis server", true));
}

vector<cpp_redis::reply> redis_conn::execute(function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> callback) {
    scoped_lock guard(mut);
    // 每次调用只尝试一次，重试由调用方的 retry_once 决定
    reconnect(false);
    vector<future<cpp_redis::reply>> futures;
    callback(client, futures);
    client.sync_commit();
    vector<cpp_redis::reply> replies;
    string message;
    for (auto &future : futures) {
        cpp_redis::reply r = future.get();
        if (!r.ok()) message = r.error();
        replies.push_back(r);
    }
    if (message.empty()) return replies;
    // cpp_redis 的 is_connected 不可靠，失败后断开连接，下一次操作时重新建立
    client.disconnect(true);
    BOOST_THROW_EXCEPTION(state_store_error("Redis: unable to finish execution: " + message, true));
}

}  // namespace tci
