#pragma once

#include <cpp_redis/cpp_redis>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <vector>
#include "common/json_utils.hpp"

namespace tci {

struct redis_config {
    /**
     * @brief redis 服务器地址
     */
    std::string host = "127.0.0.1";

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;
};

void from_json(const nlohmann::json &j, redis_config &config);

/**
 * @brief 取出 MULTI ... EXEC 事务中各条命令的结果
 * @param replies execute 的返回值，最后一项是 EXEC 的结果
 * @throw state_store_error 事务被放弃或者其中的命令失败时
 */
std::vector<cpp_redis::reply> transaction_replies(const std::vector<cpp_redis::reply> &replies);

/**
 * @brief 表示一个 Redis 连接
 * cpp_redis::client 不是线程安全的，execute 会串行化所有操作
 */
struct redis_conn {
    explicit redis_conn(const redis_config &config);

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立，只发送一次，不做重试。
     * 任何一个操作失败时断开连接，下一次调用时重新连接。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并将 future 放进列表
     * @return 按顺序返回所有操作的结果
     * @throw state_store_error 无法连接或操作失败时，transient 为真
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback);

private:
    /**
     * @brief 未连接时尝试连接一次
     * @param force 真时先断开已有连接
     * @throw state_store_error 连接失败时
     */
    void reconnect(bool force = false);

    redis_config config;
    cpp_redis::client client;
    std::mutex mut;
};

}  // namespace tci
