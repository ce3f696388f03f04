#include "store/redis_state_store.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include "common/utils.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

redis_state_store::redis_state_store(const redis_config &config, const string &key_prefix)
    : conn(config), key_prefix(key_prefix) {}

string redis_state_store::session_key(const string &session_id) const {
    return key_prefix + "session:" + session_id;
}

string redis_state_store::files_key(const string &session_id) const {
    return key_prefix + "files:" + session_id;
}

string redis_state_store::mtime_key(const string &session_id) const {
    return key_prefix + "mtime:" + session_id;
}

optional<json> redis_state_store::get(const string &session_id) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.get(session_key(session_id)));
    });
    if (replies[0].is_null()) return nullopt;
    try {
        return json::parse(replies[0].as_string());
    } catch (json::exception &e) {
        BOOST_THROW_EXCEPTION(state_store_error("malformed metadata of session " + session_id + ": " + e.what()));
    }
}

void redis_state_store::put(const string &session_id, const json &metadata) {
    conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.set(session_key(session_id), dump_text(metadata)));
    });
}

void redis_state_store::remove(const string &session_id) {
    conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.del({session_key(session_id)}));
    });
}

optional<string> redis_state_store::get_file(const string &session_id, const string &path) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.hget(files_key(session_id), path));
    });
    if (replies[0].is_null()) return nullopt;
    return replies[0].as_string();
}

void redis_state_store::put_file(const string &session_id, const string &path, const string &content) {
    string mtime = boost::lexical_cast<string>(unix_millis());
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.multi());
        futures.push_back(redis.hset(files_key(session_id), path, content));
        futures.push_back(redis.hset(mtime_key(session_id), path, mtime));
        futures.push_back(redis.exec());
    });
    transaction_replies(replies);
}

bool redis_state_store::delete_file(const string &session_id, const string &path) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.multi());
        futures.push_back(redis.hdel(files_key(session_id), {path}));
        futures.push_back(redis.hdel(mtime_key(session_id), {path}));
        futures.push_back(redis.exec());
    });
    auto results = transaction_replies(replies);
    return !results.empty() && results[0].is_integer() && results[0].as_integer() > 0;
}

vector<file_info> redis_state_store::list_files(const string &session_id) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.hgetall(mtime_key(session_id)));
    });

    vector<file_info> result;
    auto &entries = replies[0].as_array();
    for (size_t i = 0; i + 1 < entries.size(); i += 2) {
        file_info info;
        info.path = entries[i].as_string();
        try {
            info.modified_at = boost::lexical_cast<int64_t>(entries[i + 1].as_string());
        } catch (boost::bad_lexical_cast &) {
            info.modified_at = 0;
        }
        result.push_back(info);
    }
    if (result.empty()) return result;

    auto sizes = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        for (auto &info : result)
            futures.push_back(redis.hstrlen(files_key(session_id), info.path));
    });
    for (size_t i = 0; i < result.size(); ++i)
        result[i].size = sizes[i].as_integer();

    sort(result.begin(), result.end(), [](const file_info &a, const file_info &b) { return a.path < b.path; });
    return result;
}

void redis_state_store::delete_all(const string &session_id) {
    conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.del({files_key(session_id), mtime_key(session_id)}));
    });
}

}  // namespace tci
