#pragma once

#include <map>
#include <mutex>
#include "store/state_store.hpp"

namespace tci {

/**
 * @brief 进程内的状态存储，用于单进程部署和测试
 */
struct memory_state_store : public state_store {
    std::optional<nlohmann::json> get(const std::string &session_id) override;

    void put(const std::string &session_id, const nlohmann::json &metadata) override;

    void remove(const std::string &session_id) override;

    std::optional<std::string> get_file(const std::string &session_id, const std::string &path) override;

    void put_file(const std::string &session_id, const std::string &path, const std::string &content) override;

    bool delete_file(const std::string &session_id, const std::string &path) override;

    std::vector<file_info> list_files(const std::string &session_id) override;

    void delete_all(const std::string &session_id) override;

private:
    struct stored_file {
        std::string content;
        int64_t modified_at;
    };

    std::mutex mut;
    std::map<std::string, nlohmann::json> sessions;
    std::map<std::string, std::map<std::string, stored_file>> files;
};

}  // namespace tci
