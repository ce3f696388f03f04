#include "runguard.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>

namespace tci {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        auto sep = line.find(':');
        if (sep == string::npos) continue;
        string key = line.substr(0, sep);
        string value = line.substr(sep + 1);
        boost::algorithm::trim(key);
        boost::algorithm::trim(value);
        if (!key.empty()) mp[key] = value;
    }
    return mp;
}

template <typename T>
static void try_to_parse(const map<string, string> &metadata, const char *key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // 保留默认值
    }
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "stdout-bytes", result.stdout_bytes);
    try_to_parse(metadata, "stderr-bytes", result.stderr_bytes);
    if (metadata.count("memory-result")) result.memory_result = metadata.at("memory-result");
    if (metadata.count("time-result")) result.time_result = metadata.at("time-result");
    if (metadata.count("time-kind")) result.time_kind = metadata.at("time-kind");
    if (metadata.count("violation")) result.violation = metadata.at("violation");
    if (metadata.count("output-truncated")) result.output_truncated = metadata.at("output-truncated");
    if (metadata.count("internal-error")) result.internal_error = metadata.at("internal-error");
    return result;
}

}  // namespace tci
