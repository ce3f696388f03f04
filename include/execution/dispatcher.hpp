#pragma once

#include <optional>
#include <string>
#include <vector>
#include "execution/execution.hpp"
#include "governor/resource_governor.hpp"
#include "reward/reward_evaluator.hpp"
#include "sandbox/snapshot.hpp"
#include "session/session.hpp"
#include "store/state_store.hpp"

namespace tci {

/**
 * @brief 执行调度器
 * 将一段代码提交到会话绑定的沙箱中执行，收集输出、返回值和工作目录的变化，
 * 并在截止时间后强制终止执行。调度器只依赖 language_runtime 接口。
 */
struct execution_dispatcher {
    execution_dispatcher(resource_governor &governor, state_store &store, const reward_evaluator &reward);

    /**
     * @brief 执行代码，阻塞到执行进入终止状态为止
     * 会话必须处于 Ready 状态并绑定了沙箱，调用方需要保证同一会话没有其他执行。
     * 执行结束后若沙箱没有被标记销毁，会话回到 Ready；否则会话停留在 Executing，
     * 由调用方更换沙箱。
     * @param s 会话
     * @param exec 处于 Created 状态的执行记录，执行结束后保存执行结果
     * @param files 需要放入工作目录的会话文件，为空时放入会话的所有文件
     * @param deadline 截止时间（秒），不存在时使用资源上限中的时钟时间
     * @throw not_found_error 指定的文件不存在时
     * @throw state_store_error 读写会话文件失败时
     */
    void dispatch(session &s, execution &exec, const std::vector<std::string> &files, std::optional<double> deadline);

private:
    /**
     * @brief 清空工作目录，并从状态存储中写入会话文件
     */
    void materialize(const std::string &session_id, const sandbox_instance &sandbox, const std::vector<std::string> &files);

    /**
     * @brief 将工作目录的变化写回状态存储
     */
    void write_back(const std::string &session_id, const sandbox_instance &sandbox, const directory_delta &delta);

    /**
     * @brief 根据运行时的输出判定执行的终止状态，必要时标记沙箱销毁
     */
    void classify(session &s, execution &exec, const runtime_output &output, double wall_time, bool forced);

    resource_governor &governor;
    state_store &store;
    const reward_evaluator &reward;
};

}  // namespace tci
