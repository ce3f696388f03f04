#pragma once

#include <sys/types.h>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief 允许用户代码连接的一个地址
 */
struct egress_endpoint {
    /**
     * @brief 数字形式的 IP 地址
     */
    std::string address;

    bool ipv6 = false;

    int port = 0;
};

/**
 * @brief 拆分 "host:port" 或 "[ipv6]:port"
 * @throw std::invalid_argument 格式不正确或端口不在 1-65535 范围内
 */
std::pair<std::string, int> split_endpoint(const std::string &entry);

/**
 * @brief 解析白名单中的主机名，每个主机名的所有地址都被允许
 * @throw std::invalid_argument 格式不正确
 * @throw std::runtime_error 主机名无法解析
 */
std::vector<egress_endpoint> resolve_egress(const std::vector<std::string> &allowlist);

/**
 * @brief 读取 resolv.conf 中的 DNS 服务器，端口为 53
 * 文件不存在时返回空列表
 */
std::vector<egress_endpoint> read_nameservers(const std::string &path = "/etc/resolv.conf");

/**
 * @brief 为 runguard 进程分配的 net_cls classid，不同 runguard 进程的 classid 不同
 */
uint32_t egress_classid(pid_t pid);

/**
 * @brief 统计 iptables -L -v -x 输出中被 REJECT 规则拦截的包数
 */
uint64_t count_rejected(const std::string &listing);

/**
 * @brief 一次执行专用的出站防火墙
 * 在 iptables 和 ip6tables 中各创建一条名为 TCI-<classid> 的链，OUTPUT 链中
 * net_cls classid 匹配的包跳转到这条链：发往白名单地址和 DNS 服务器的包放行，其余的包被 REJECT。
 * 用户代码所在的 cgroup 需要设置同一个 net_cls.classid。
 *
 * 析构时删除规则和链。
 */
struct egress_firewall {
    /**
     * @throw std::runtime_error iptables 调用失败时，已经创建的规则会被删除
     */
    egress_firewall(uint32_t classid, const std::vector<egress_endpoint> &allowed);

    ~egress_firewall();

    egress_firewall(const egress_firewall &) = delete;
    egress_firewall &operator=(const egress_firewall &) = delete;

    /**
     * @brief 被拒绝的出站包数
     */
    uint64_t rejected_packets() const;

    const std::string &chain() const;

private:
    void remove() noexcept;

    std::string chain_name;
    std::string classid_text;

    /**
     * @brief 已经创建了链的命令，iptables 或 ip6tables
     */
    std::vector<std::string> installed;
};
