#pragma once

#include "monitor/monitor.hpp"

namespace tci {

/**
 * @brief 将事件以单行 JSON 的格式写入 glog 日志
 * 日志收集系统可以按 "event" 字段过滤
 */
struct log_monitor : public monitor {
    void session_created(const std::string &session_id, const std::string &language) override;

    void session_closed(const std::string &session_id, session_state final_state) override;

    void execution_started(const execution &exec) override;

    void execution_finished(const execution &exec) override;

    void security_violation_detected(const std::string &session_id, const std::string &execution_id, const std::vector<security_violation> &violations) override;

    void sandbox_destroyed(const std::string &sandbox_id, const std::string &reason) override;

    void report_error(const std::string &message) override;
};

}  // namespace tci
