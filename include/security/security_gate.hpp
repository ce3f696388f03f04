#pragma once

#include <regex>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"
#include "security/policy.hpp"

namespace tci {

/**
 * @brief 静态扫描规则
 * 对代码的每一行进行正则匹配，匹配成功即为违规。
 */
struct scan_rule {
    std::string name;

    /**
     * @brief 适用的语言，"*" 表示所有语言
     */
    std::string language = "*";

    std::string pattern;

    /**
     * @brief 违规时返回给调用方的说明
     */
    std::string detail;
};

void from_json(const nlohmann::json &j, scan_rule &rule);

struct security_config {
    /**
     * @brief 静态扫描规则，为空时使用内置规则
     */
    std::vector<scan_rule> rules;

    /**
     * @brief 默认的系统调用白名单，为空时使用内置白名单
     */
    std::vector<std::string> syscalls;

    /**
     * @brief 开启网络访问后额外允许的系统调用
     */
    std::vector<std::string> network_syscalls;

    /**
     * @brief 代码的最大字节数
     */
    size_t max_code_bytes = 1 << 20;
};

void from_json(const nlohmann::json &j, security_config &config);

/**
 * @brief 静态扫描的结果
 */
struct scan_report {
    std::vector<security_violation> violations;

    bool rejected() const;
};

/**
 * @brief 安全网关
 * 1. 执行前对代码进行静态扫描，发现禁止的模块导入、混淆代码、已知的攻击手法时
 *    直接拒绝，代码不会进入沙箱，不占用任何沙箱资源。静态扫描只是尽力而为，
 *    真正的隔离由沙箱保证。
 * 2. 在沙箱被分配给会话时设置运行时策略：系统调用白名单和网络出口白名单。
 */
struct security_gate {
    explicit security_gate(const security_config &config);

    /**
     * @brief 对代码进行静态扫描
     * @param language 代码的语言，只有该语言和 "*" 的规则会被使用
     * @param code 用户代码
     */
    scan_report scan(const std::string &language, const std::string &code) const;

    /**
     * @brief 根据会话的网络请求构造运行时策略
     * @throw invalid_argument_error 开启网络但白名单为空，或者白名单格式不是 host:port
     */
    runtime_policy make_policy(const network_request &network) const;

    /**
     * @brief 默认策略：禁止网络，使用默认系统调用白名单
     */
    runtime_policy default_policy() const;

    /**
     * @brief 将运行时策略设置到沙箱上
     * 沙箱每次被分配都必须重新调用
     */
    void attach(sandbox_instance &sandbox, const runtime_policy &policy) const;

private:
    struct compiled_rule {
        scan_rule rule;
        std::regex regex;
    };

    security_config config;
    std::vector<compiled_rule> rules;
};

/**
 * @brief 内置的静态扫描规则
 */
std::vector<scan_rule> default_scan_rules();

/**
 * @brief 内置的系统调用白名单，足够运行 Python 3 和 Node.js 的解释器
 */
std::vector<std::string> default_syscall_allowlist();

}  // namespace tci
