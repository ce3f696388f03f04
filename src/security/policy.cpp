#include "security/policy.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const runtime_policy &policy) {
    j = {{"network_enabled", policy.network_enabled},
         {"egress_allowlist", policy.egress_allowlist},
         {"syscalls", policy.syscall_allowlist.size()}};
}

void from_json(const json &j, network_request &request) {
    if (j.is_boolean()) {
        request.enabled = j.get<bool>();
        return;
    }
    assign_optional(j, request.enabled, "enabled");
    assign_optional(j, request.allowlist, "allowlist");
}

void to_json(json &j, const network_request &request) {
    j = {{"enabled", request.enabled}, {"allowlist", request.allowlist}};
}

void to_json(json &j, const security_violation &violation) {
    j = {{"rule", violation.rule}, {"detail", violation.detail}, {"line", violation.line}};
}

}  // namespace tci
