#pragma once

#include <string>

namespace tci {

/**
 * @brief 表示一次代码执行的状态
 * CREATED 和 RUNNING 以外的状态均为终止状态，到达终止状态后执行记录不再修改。
 */
enum class execution_status {
    /**
     * @brief 执行请求已创建，还未进入沙箱
     * 静态扫描拒绝的请求会从这个状态直接进入 SECURITY_REJECTED
     */
    CREATED = 0,

    /**
     * @brief 代码正在沙箱内运行
     */
    RUNNING = 1,

    /**
     * @brief 代码在时限内正常结束
     */
    SUCCEEDED = 2,

    /**
     * @brief 代码抛出了异常或以非零返回值退出
     * 这是正常的执行结果，stderr 中保存了错误信息
     */
    FAILED = 3,

    /**
     * @brief 代码运行时间超过了截止时间，已被强制终止
     */
    TIMED_OUT = 4,

    /**
     * @brief 代码被安全策略拒绝
     * 可能是静态扫描发现了禁止的模式，也可能是运行时调用了不在白名单内的系统调用。
     * 后者会导致沙箱被隔离销毁。
     */
    SECURITY_REJECTED = 5,

    /**
     * @brief 代码超出了 CPU 时间、内存或输出大小限制
     */
    RESOURCE_EXCEEDED = 6
};

/**
 * @brief 会话生命周期状态
 * Created → Provisioning → Ready ⇄ Executing，任意非终止状态 → Closing → Closed。
 * Provisioning 和 Executing 在无法获得沙箱时进入 Failed。
 */
enum class session_state {
    CREATED = 0,
    PROVISIONING = 1,
    READY = 2,
    EXECUTING = 3,
    CLOSING = 4,
    CLOSED = 5,
    FAILED = 6
};

/**
 * @brief 沙箱实例的健康状态
 * DEAD 是不可逆的，进入 DEAD 的沙箱不会再被分配。
 */
enum class sandbox_health {
    WARMING = 0,
    READY = 1,
    BUSY = 2,
    DRAINING = 3,
    DEAD = 4
};

const char *get_display_message(execution_status);

const char *get_display_message(session_state);

const char *get_display_message(sandbox_health);

/**
 * @brief 判断执行状态是否为终止状态
 */
bool is_terminal(execution_status);

/**
 * @brief 判断会话状态是否为终止状态（Closed 或 Failed）
 */
bool is_terminal(session_state);

}  // namespace tci
