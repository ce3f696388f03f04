#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "common/json_utils.hpp"

namespace tci {

/**
 * @brief 一次执行的资源上限
 */
struct resource_profile {
    /**
     * @brief CPU 时间限制，单位为秒
     * 多线程程序的所有线程的 CPU 时间会累加
     */
    double cpu_time = 10;

    /**
     * @brief 内存限制，单位为 KB
     */
    int64_t memory_limit = 262144;

    /**
     * @brief 时钟时间限制，单位为秒
     * 实际生效的时限是本值和执行请求的截止时间中较小的一个
     */
    double wall_time = 30;

    /**
     * @brief stdout 和 stderr 各自的最大字节数，超出部分被截断
     */
    int64_t output_limit = 1 << 20;

    /**
     * @brief 最多同时存在的进程数
     */
    int proc_limit = 32;

    /**
     * @brief 用户代码能写入的单个文件最大大小，单位为 KB
     */
    int64_t file_limit = 65536;
};

/**
 * @brief 从 JSON 中读取资源上限，JSON 中缺失的字段保持原值
 */
void from_json(const nlohmann::json &j, resource_profile &profile);

void to_json(nlohmann::json &j, const resource_profile &profile);

/**
 * @brief 一次执行实际使用的资源
 */
struct resource_usage {
    double cpu_time = 0;
    double wall_time = 0;
    int64_t memory_bytes = 0;
    int64_t stdout_bytes = 0;
    int64_t stderr_bytes = 0;

    /**
     * @brief 是否触发了 cgroup 的 OOM killer
     */
    bool oom = false;

    /**
     * @brief 是否收到了 SIGXCPU（CPU 时间硬限制）
     */
    bool cpu_killed = false;

    /**
     * @brief 是否因写文件超出 RLIMIT_FSIZE 收到 SIGXFSZ
     */
    bool file_size_killed = false;
};

void to_json(nlohmann::json &j, const resource_usage &usage);

/**
 * @brief 资源使用的判定结果
 */
enum class resource_verdict {
    WITHIN_LIMITS,
    CPU_EXCEEDED,
    MEMORY_EXCEEDED,
    OUTPUT_EXCEEDED
};

const char *get_display_message(resource_verdict);

struct governor_config {
    /**
     * @brief 请求中没有给出的字段使用的默认值
     */
    resource_profile defaults;

    /**
     * @brief 主机允许的最大值，请求超出时被截断为该值
     */
    resource_profile maximum = {60, 2097152, 300, 16 << 20, 256, 1 << 20};

    /**
     * @brief 截止时间之后等待执行自然结束的宽限时间，单位为秒
     * 超过宽限时间后执行被强制终止
     */
    double grace_period = 1;
};

void from_json(const nlohmann::json &j, governor_config &config);

/**
 * @brief 资源管控器
 * 由两部分组成：
 * 1. 无状态的策略判定：admit 把请求的资源上限截断到主机允许的范围内，evaluate 根据
 *    实际使用量判定是否超限；
 * 2. 实时记账表：以执行编号为键记录每次执行的资源上限和使用量。每次执行单独记账，
 *    会话之间、同一会话的不同执行之间都不会互相借用额度。
 */
struct resource_governor {
    explicit resource_governor(const governor_config &config);

    /**
     * @brief 根据请求构造资源上限
     * @param request 请求中的资源上限，为 null 时全部使用默认值
     * @return 截断到主机最大值之后的资源上限
     */
    resource_profile admit(const nlohmann::json &request) const;

    /**
     * @brief 将资源上限截断到主机最大值
     */
    resource_profile admit(const resource_profile &requested) const;

    /**
     * @brief 计算实际生效的时钟时间限制
     * @param deadline 执行请求的截止时间（秒），不存在或不为正时仅使用资源上限
     */
    double effective_wall_time(const resource_profile &profile, std::optional<double> deadline) const;

    /**
     * @brief 根据使用量判定是否超出资源上限
     * 时钟时间超限由执行调度器通过截止时间处理，不在这里判定
     */
    resource_verdict evaluate(const resource_profile &profile, const resource_usage &usage) const;

    /**
     * @brief 开始一次执行的记账
     * @throw internal_error 如果执行编号已经在记账中
     */
    void begin(const std::string &execution_id, const std::string &session_id, const resource_profile &profile);

    /**
     * @brief 记录一次执行的资源使用量
     */
    void record(const std::string &execution_id, const resource_usage &usage);

    /**
     * @brief 结束一次执行的记账
     * @return 记录的资源使用量
     */
    resource_usage end(const std::string &execution_id);

    /**
     * @brief 当前正在记账的执行数量
     */
    size_t active() const;

    /**
     * @brief 某个会话当前正在记账的执行数量
     */
    size_t active(const std::string &session_id) const;

    double grace_period() const;

private:
    struct account {
        std::string session_id;
        resource_profile profile;
        resource_usage usage;
        std::chrono::steady_clock::time_point started;
    };

    governor_config config;
    mutable std::mutex mut;
    std::map<std::string, account> accounts;
};

}  // namespace tci
