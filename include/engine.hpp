#pragma once

#include <memory>
#include <string>
#include <vector>
#include "execution/dispatcher.hpp"
#include "governor/resource_governor.hpp"
#include "reward/reward_evaluator.hpp"
#include "runtime/process_runtime.hpp"
#include "runtime/runtime_registry.hpp"
#include "sandbox/sandbox_pool.hpp"
#include "security/security_gate.hpp"
#include "session/session_manager.hpp"
#include "store/state_store.hpp"

namespace tci {

/**
 * @brief 执行引擎的配置文件
 * {
 *     "pool": { "capacity": 8, "backpressure": "block", "acquire_timeout": 30, "warm_size": 2, "warm_languages": ["python3"] },
 *     "governor": { "defaults": {...}, "maximum": {...}, "grace_period": 1 },
 *     "security": { "rules": [...], "syscalls": [...], "max_code_bytes": 1048576 },
 *     "sessions": { "busy_policy": "queue", "idle_timeout": 600 },
 *     "reward": { "normalization": "raw_sum" },
 *     "store": { "type": "redis", "redis": { "host": "127.0.0.1", "port": 6379 } },
 *     "runtimes": [ { "language": "python3", "launcher": "runguard" } ]
 * }
 * 缺失的部分使用默认值。
 */
struct engine_config {
    pool_config pool;
    governor_config governor;
    security_config security;
    session_config sessions;
    reward_config reward;
    store_config store;
    std::vector<process_runtime_config> runtimes;
};

void from_json(const nlohmann::json &j, engine_config &config);

/**
 * @brief 执行引擎
 * 持有所有组件，并把 JSON 请求翻译为会话管理器的操作。
 * 请求格式为 {"op": "run_execution", "id": ..., ...}，返回 {"id": ..., "result": ...}
 * 或者 {"id": ..., "error": <错误类别>, "message": ...}。
 */
struct engine {
    /**
     * @param config 引擎配置
     * @param store 状态存储，为空时按配置创建
     */
    explicit engine(const engine_config &config, std::unique_ptr<state_store> store = nullptr);

    ~engine();

    /**
     * @brief 启动沙箱预热线程和空闲会话淘汰线程
     */
    void start();

    /**
     * @brief 停止后台线程并关闭所有会话
     */
    void shutdown();

    /**
     * @brief 处理一条请求，不会抛出异常
     */
    nlohmann::json handle(const nlohmann::json &request);

    /**
     * @brief 处理一行 JSON 请求
     */
    std::string handle_line(const std::string &line);

    runtime_registry &runtimes();

    session_manager &sessions();

    sandbox_pool &pool();

private:
    nlohmann::json dispatch(const std::string &op, const nlohmann::json &request);

    engine_config config;
    runtime_registry registry;
    std::unique_ptr<state_store> store;
    resource_governor governor;
    security_gate gate;
    reward_evaluator reward;
    sandbox_pool sandboxes;
    execution_dispatcher dispatcher;
    session_manager manager;
};

/**
 * @brief 按配置向注册表注册基于子进程的语言运行时
 */
void register_process_runtimes(runtime_registry &registry, const std::vector<process_runtime_config> &runtimes);

}  // namespace tci
