#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include "runtime/language_runtime.hpp"

namespace tci {

/**
 * @brief 启动用户进程的方式
 */
enum class launch_mode {
    /**
     * @brief 通过 runguard 启动，使用 cgroup、命名空间、seccomp 隔离，需要 root 权限
     */
    RUNGUARD,

    /**
     * @brief 直接 fork 用户进程，只用 rlimit 和进程组限制
     * 不需要特权，仅用于开发和测试环境
     */
    DIRECT
};

struct process_runtime_config {
    std::string language;

    /**
     * @brief 语言运行时镜像的路径，默认为 EXEC_DIR / "run" / language
     */
    std::filesystem::path image;

    launch_mode mode = launch_mode::RUNGUARD;

    /**
     * @brief DIRECT 模式下是否用 RLIMIT_AS 限制内存
     * V8 之类预留大量虚拟内存的运行时需要关闭
     */
    bool limit_address_space = true;
};

void from_json(const nlohmann::json &j, process_runtime_config &config);

/**
 * @brief 基于子进程的语言运行时
 * 镜像目录中的 run 脚本是入口，调用方式为：
 *     run <代码文件> <结果文件>
 * 工作目录为沙箱的 work 目录。run 脚本执行代码，并将最后的表达式值和全局变量
 * 以 {"value", "has_value", "bindings", "error"} 的格式写入结果文件。
 */
struct process_runtime : public language_runtime {
    explicit process_runtime(const process_runtime_config &config);

    std::string language() const override;

    void prepare(const std::filesystem::path &root) override;

    runtime_output execute(const runtime_request &request) override;

    void terminate() override;

    bool healthy() const override;

    /**
     * @brief 只有 runguard 能限制网络连接，直接启动时返回 false
     */
    bool filters_egress() const override;

private:
    std::vector<std::string> build_command(const runtime_request &request) const;

    void collect_runguard_result(const runtime_request &request, runtime_output &output) const;

    /**
     * @brief 读取运行脚本写下的结果文件
     * @return 结果文件是否存在且格式正确
     */
    bool collect_harness_result(const runtime_request &request, runtime_output &output) const;

    process_runtime_config config;
    std::filesystem::path root;

    /**
     * @brief terminate() 只设置标记，只有 execute 所在线程会向子进程发送信号
     */
    std::atomic<bool> terminate_requested{false};
};

}  // namespace tci
