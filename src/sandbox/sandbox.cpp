#include "sandbox/sandbox.hpp"
#include <glog/logging.h>

namespace tci {
using namespace std;

language_runtime::~language_runtime() {}

filesystem::path sandbox_instance::work_dir() const {
    return root / "work";
}

void sandbox_instance::flag(const string &reason) {
    if (flag_reason.empty()) {
        LOG(WARNING) << "Sandbox " << id << " flagged for destruction: " << reason;
        flag_reason = reason;
    }
}

bool sandbox_instance::flagged() const {
    return !flag_reason.empty();
}

const string &sandbox_instance::flagged_reason() const {
    return flag_reason;
}

}  // namespace tci
