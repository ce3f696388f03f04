#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "execution/execution.hpp"
#include "security/policy.hpp"

namespace tci {

/**
 * @brief 执行监控行为
 * 默认实现什么都不做，监控器只需要覆盖关心的事件。
 * 监控器可能被多个线程同时调用。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报一个会话已经创建并绑定了沙箱
     */
    virtual void session_created(const std::string &session_id, const std::string &language);

    /**
     * @brief 监控上报一个会话已经关闭
     * @param final_state 会话的最终状态，Closed 或 Failed
     */
    virtual void session_closed(const std::string &session_id, session_state final_state);

    /**
     * @brief 监控上报一次执行已经进入沙箱
     */
    virtual void execution_started(const execution &exec);

    /**
     * @brief 监控上报一次执行已经进入终止状态
     * 静态扫描拒绝的执行不会有 execution_started 事件
     */
    virtual void execution_finished(const execution &exec);

    /**
     * @brief 监控上报安全违规，包括静态扫描和运行时违规
     */
    virtual void security_violation_detected(const std::string &session_id, const std::string &execution_id, const std::vector<security_violation> &violations);

    /**
     * @brief 监控上报一个沙箱实例被销毁
     * @param reason 销毁原因，比如 "security violation"
     */
    virtual void sandbox_destroyed(const std::string &sandbox_id, const std::string &reason);

    /**
     * @brief 监控上报引擎内部错误
     */
    virtual void report_error(const std::string &message);
};

/**
 * @brief 注册监控器
 */
void register_monitor(std::unique_ptr<monitor> &&monitor);

/**
 * @brief 移除所有的监控器
 */
void clear_monitors();

/**
 * @brief 向所有的监控器上报事件
 * 监控器抛出的异常会被记录到日志中，不会影响调用方
 */
void call_monitor(const std::function<void(monitor &)> &callback);

/**
 * @brief 向所有的监控器报错
 */
void report_error(const std::string &message);

}  // namespace tci
