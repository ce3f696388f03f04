#pragma once

#include <glog/logging.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "store/redis.hpp"

namespace tci {

/**
 * @brief 会话虚拟文件系统中一个文件的信息
 */
struct file_info {
    std::string path;

    int64_t size = 0;

    /**
     * @brief 最后修改时间的 Unix 时间戳（毫秒）
     */
    int64_t modified_at = 0;
};

void to_json(nlohmann::json &j, const file_info &info);

/**
 * @brief 外部持久化键值存储的客户端接口
 * 保存会话元数据和会话的虚拟文件。同一会话内保证读到自己的写入。
 * 所有操作失败时抛出 state_store_error，暂时性错误的 transient 为真。
 */
struct state_store {
    virtual ~state_store();

    /**
     * @brief 读取会话元数据
     * @return 会话不存在时返回 std::nullopt
     */
    virtual std::optional<nlohmann::json> get(const std::string &session_id) = 0;

    virtual void put(const std::string &session_id, const nlohmann::json &metadata) = 0;

    /**
     * @brief 删除会话元数据
     */
    virtual void remove(const std::string &session_id) = 0;

    /**
     * @brief 读取会话文件
     * @return 文件不存在时返回 std::nullopt
     */
    virtual std::optional<std::string> get_file(const std::string &session_id, const std::string &path) = 0;

    /**
     * @brief 新建或覆盖会话文件
     */
    virtual void put_file(const std::string &session_id, const std::string &path, const std::string &content) = 0;

    /**
     * @return 文件是否存在
     */
    virtual bool delete_file(const std::string &session_id, const std::string &path) = 0;

    /**
     * @brief 列出会话的所有文件，按路径排序
     */
    virtual std::vector<file_info> list_files(const std::string &session_id) = 0;

    /**
     * @brief 删除会话的所有文件，会话元数据保留
     */
    virtual void delete_all(const std::string &session_id) = 0;
};

/**
 * @brief 执行存储操作，遇到暂时性错误时重试一次
 * 非暂时性错误和第二次的错误直接抛出
 */
template <typename F>
auto retry_once(F &&operation) -> decltype(operation()) {
    try {
        return operation();
    } catch (state_store_error &ex) {
        if (!ex.transient) throw;
        LOG(WARNING) << "State store operation failed, retrying once: " << ex.what();
    }
    return operation();
}

struct store_config {
    /**
     * @brief "memory" 或 "redis"
     */
    std::string type = "memory";

    redis_config redis;

    /**
     * @brief Redis 中所有键的前缀
     */
    std::string key_prefix = "tci:";
};

void from_json(const nlohmann::json &j, store_config &config);

/**
 * @brief 根据配置创建状态存储客户端
 * @throw std::invalid_argument 存储类型不存在时
 */
std::unique_ptr<state_store> make_state_store(const store_config &config);

}  // namespace tci
