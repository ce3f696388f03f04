#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"

namespace tci {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string read_file_prefix(const fs::path &path, size_t limit, bool &truncated) {
    truncated = false;
    ifstream fin(path.string(), ios::binary);
    if (!fin) return "";
    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    if (str.size() == limit && fin.peek() != ifstream::traits_type::eof())
        truncated = true;
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find('\0') != string::npos)
        throw invalid_argument_error("path is empty or contains NUL");
    fs::path p(subpath);
    if (p.is_absolute() || p.has_root_name())
        throw invalid_argument_error("path must be relative: " + subpath);
    fs::path normal;
    for (auto &part : p) {
        if (part == "..")
            throw invalid_argument_error("path is not safe: " + subpath);
        if (part == "." || part.empty()) continue;
        normal /= part;
    }
    if (normal.empty())
        throw invalid_argument_error("path does not name a file: " + subpath);
    return normal.string();
}

void clear_directory(const fs::path &dir) {
    if (!fs::is_directory(dir)) {
        fs::create_directories(dir);
        return;
    }
    for (auto &entry : fs::directory_iterator(dir))
        fs::remove_all(entry.path());
}

}  // namespace tci
