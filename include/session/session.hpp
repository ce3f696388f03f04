#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include "common/status.hpp"
#include "execution/execution.hpp"
#include "governor/resource_governor.hpp"
#include "sandbox/sandbox.hpp"
#include "security/policy.hpp"

namespace tci {

/**
 * @brief 判断会话状态机中是否存在 from → to 的转移
 */
bool can_transition(session_state from, session_state to);

/**
 * @brief 一个会话
 * 会话只由会话管理器修改。一个会话同一时刻最多绑定一个沙箱实例。
 */
struct session {
    std::string id;

    std::string language;

    int64_t created_at = 0;

    /**
     * @brief 最后一次操作的时间，用于空闲淘汰
     */
    std::atomic<int64_t> last_active{0};

    /**
     * @brief 经过资源管控器截断后的资源上限
     */
    resource_profile profile;

    network_request network;

    /**
     * @brief 绑定的沙箱实例，只在持有执行权（轮到自己的票据）时访问
     * 通过 bind 和 unbind 修改，元数据只读取 sandbox_id()
     */
    sandbox_instance *sandbox = nullptr;

    /**
     * @brief 保留的执行记录，最旧的在前，由 queue_mut 保护
     */
    std::deque<std::shared_ptr<const execution>> executions;

    session_state state() const;

    /**
     * @brief 绑定沙箱实例
     */
    void bind(sandbox_instance *instance);

    /**
     * @brief 解除绑定
     * @return 原来绑定的沙箱编号，没有绑定时为空。调用方在解除绑定之后再归还沙箱
     */
    std::string unbind();

    /**
     * @brief 当前绑定的沙箱编号，可以在任何线程调用
     */
    std::string sandbox_id() const;

    /**
     * @brief 状态转移
     * @throw invalid_transition 转移表中不存在该转移时
     */
    void transition(session_state to);

    /**
     * @brief 持久化到状态存储的会话元数据
     * 调用方不能持有 queue_mut
     */
    nlohmann::json metadata() const;

    /**
     * @brief 会话内执行的串行化
     * 每个执行请求领取一个递增的票据并进入等待队列，队头的请求在没有执行进行时
     * 获得执行权，保证先提交先执行。被取消的请求将自己的票据移出队列。
     */
    mutable std::mutex queue_mut;
    std::condition_variable queue_cond;
    std::deque<uint64_t> waiting;
    uint64_t next_ticket = 0;

    /**
     * @brief 是否有执行正在进行
     */
    bool running = false;

    /**
     * @brief 关闭请求已经发出，排队中的执行请求会被取消
     */
    bool closing_requested = false;

    /**
     * @brief 关闭流程已经完成
     */
    bool close_finished = false;

private:
    mutable std::mutex state_mut;
    session_state current = session_state::CREATED;

    /**
     * @brief 绑定的沙箱编号的副本，由 state_mut 保护
     */
    std::string bound_sandbox;
};

}  // namespace tci
