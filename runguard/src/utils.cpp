#include "utils.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>

using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

vector<string> split_list(const string &s) {
    vector<string> items, result;
    boost::split(items, s, boost::is_any_of(","));
    for (auto &item : items) {
        boost::algorithm::trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}
