#include "sandbox/snapshot.hpp"
#include <sys/stat.h>
#include <functional>
#include "common/io_utils.hpp"

namespace tci {
using namespace std;
namespace fs = std::filesystem;

directory_snapshot take_snapshot(const fs::path &dir) {
    directory_snapshot snapshot;
    if (!fs::is_directory(dir)) return snapshot;

    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied);
         it != fs::recursive_directory_iterator(); ++it) {
        auto &entry = *it;
        if (entry.is_symlink()) {
            if (entry.is_directory()) it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file()) continue;

        struct stat attr;
        if (lstat(entry.path().c_str(), &attr) != 0) continue;

        file_stamp stamp;
        stamp.size = attr.st_size;
        stamp.hash = hash<string>()(read_file_content(entry.path()));
        snapshot[fs::relative(entry.path(), dir).string()] = stamp;
    }
    return snapshot;
}

directory_delta diff_snapshot(const directory_snapshot &before, const directory_snapshot &after) {
    directory_delta delta;
    for (auto &[path, stamp] : after) {
        auto it = before.find(path);
        if (it == before.end() || it->second.size != stamp.size || it->second.hash != stamp.hash)
            delta.changed.push_back(path);
    }
    for (auto &[path, stamp] : before)
        if (!after.count(path))
            delta.deleted.push_back(path);
    return delta;
}

}  // namespace tci
