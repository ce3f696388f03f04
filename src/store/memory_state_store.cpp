#include "store/memory_state_store.hpp"
#include "common/utils.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

optional<json> memory_state_store::get(const string &session_id) {
    scoped_lock guard(mut);
    auto it = sessions.find(session_id);
    if (it == sessions.end()) return nullopt;
    return it->second;
}

void memory_state_store::put(const string &session_id, const json &metadata) {
    scoped_lock guard(mut);
    sessions[session_id] = metadata;
}

void memory_state_store::remove(const string &session_id) {
    scoped_lock guard(mut);
    sessions.erase(session_id);
}

optional<string> memory_state_store::get_file(const string &session_id, const string &path) {
    scoped_lock guard(mut);
    auto session = files.find(session_id);
    if (session == files.end()) return nullopt;
    auto it = session->second.find(path);
    if (it == session->second.end()) return nullopt;
    return it->second.content;
}

void memory_state_store::put_file(const string &session_id, const string &path, const string &content) {
    scoped_lock guard(mut);
    files[session_id][path] = {content, unix_millis()};
}

bool memory_state_store::delete_file(const string &session_id, const string &path) {
    scoped_lock guard(mut);
    auto session = files.find(session_id);
    if (session == files.end()) return false;
    return session->second.erase(path) > 0;
}

vector<file_info> memory_state_store::list_files(const string &session_id) {
    scoped_lock guard(mut);
    vector<file_info> result;
    auto session = files.find(session_id);
    if (session == files.end()) return result;
    for (auto &[path, file] : session->second)
        result.push_back({path, (int64_t)file.content.size(), file.modified_at});
    return result;
}

void memory_state_store::delete_all(const string &session_id) {
    scoped_lock guard(mut);
    files.erase(session_id);
}

}  // namespace tci
