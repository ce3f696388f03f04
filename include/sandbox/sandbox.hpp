#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include "common/status.hpp"
#include "governor/resource_governor.hpp"
#include "runtime/language_runtime.hpp"
#include "security/policy.hpp"

namespace tci {

/**
 * @brief 一个隔离的执行环境
 * 沙箱实例由沙箱池独占，同一时刻最多租给一个会话。
 */
struct sandbox_instance {
    /**
     * @brief 沙箱实例编号，由沙箱池生成的 UUID
     */
    std::string id;

    std::string language;

    /**
     * @brief 沙箱根目录 SANDBOX_DIR / id
     */
    std::filesystem::path root;

    /**
     * @brief 本次租用的资源上限
     */
    resource_profile ceilings;

    /**
     * @brief 当前的运行时安全策略，由安全网关设置
     */
    runtime_policy policy;

    /**
     * @brief 租用该沙箱的会话编号，为空表示未被租用
     */
    std::string lease_owner;

    std::atomic<sandbox_health> health{sandbox_health::WARMING};

    /**
     * @brief 语言运行时，负责在沙箱内启动进程
     */
    std::unique_ptr<language_runtime> runtime;

    /**
     * @brief 用户代码的工作目录
     */
    std::filesystem::path work_dir() const;

    /**
     * @brief 标记该沙箱在回收时必须销毁
     * 在发生安全违规或资源超限被杀死后调用
     */
    void flag(const std::string &reason);

    bool flagged() const;

    const std::string &flagged_reason() const;

private:
    std::string flag_reason;
};

}  // namespace tci
