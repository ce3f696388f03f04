#pragma once

#include <string>
#include <vector>
#include "common/json_utils.hpp"

namespace tci {

/**
 * @brief 沙箱的运行时安全策略
 * 在每次沙箱被分配给会话时由安全网关重新设置
 */
struct runtime_policy {
    /**
     * @brief 是否允许访问网络
     * 默认禁止，此时 runguard 会将用户代码放进一个新的网络命名空间；
     * 开启时用户代码留在主机的网络命名空间中，但只能连接 egress_allowlist 中的地址
     */
    bool network_enabled = false;

    /**
     * @brief 允许访问的网络地址，格式为 host:port
     * 仅在 network_enabled 时有效，由 runguard 通过 net_cls 和 iptables 规则限制
     */
    std::vector<std::string> egress_allowlist;

    /**
     * @brief 允许调用的系统调用名称
     * 由 runguard 通过 seccomp 限制，为空时不限制系统调用
     */
    std::vector<std::string> syscall_allowlist;
};

void to_json(nlohmann::json &j, const runtime_policy &policy);

/**
 * @brief 会话创建时请求开启网络访问
 */
struct network_request {
    bool enabled = false;

    /**
     * @brief 允许访问的 host:port 列表，开启网络访问时不能为空
     */
    std::vector<std::string> allowlist;
};

void from_json(const nlohmann::json &j, network_request &request);

void to_json(nlohmann::json &j, const network_request &request);

/**
 * @brief 一条安全违规记录
 */
struct security_violation {
    /**
     * @brief 触发的规则名，运行时违规为 "syscall"
     */
    std::string rule;

    std::string detail;

    /**
     * @brief 违规代码所在的行号（从 1 开始），运行时违规为 0
     */
    int line = 0;
};

void to_json(nlohmann::json &j, const security_violation &violation);

}  // namespace tci
