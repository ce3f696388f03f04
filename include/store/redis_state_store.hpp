#pragma once

#include "store/redis.hpp"
#include "store/state_store.hpp"

namespace tci {

/**
 * @brief 基于 Redis 的状态存储
 * 键的格式：
 * 1. <prefix>session:<id>：会话元数据的 JSON 字符串
 * 2. <prefix>files:<id>：哈希表，路径 → 文件内容
 * 3. <prefix>mtime:<id>：哈希表，路径 → 最后修改时间（毫秒）
 */
struct redis_state_store : public state_store {
    redis_state_store(const redis_config &config, const std::string &key_prefix);

    std::optional<nlohmann::json> get(const std::string &session_id) override;

    void put(const std::string &session_id, const nlohmann::json &metadata) override;

    void remove(const std::string &session_id) override;

    std::optional<std::string> get_file(const std::string &session_id, const std::string &path) override;

    void put_file(const std::string &session_id, const std::string &path, const std::string &content) override;

    bool delete_file(const std::string &session_id, const std::string &path) override;

    std::vector<file_info> list_files(const std::string &session_id) override;

    void delete_all(const std::string &session_id) override;

private:
    std::string session_key(const std::string &session_id) const;
    std::string files_key(const std::string &session_id) const;
    std::string mtime_key(const std::string &session_id) const;

    redis_conn conn;
    std::string key_prefix;
};

}  // namespace tci
