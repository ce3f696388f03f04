#pragma once

#include <filesystem>
#include <string>

namespace tci {

/**
 * @brief runguard 写入 meta 文件的运行信息
 * meta 文件每行为 "key: value" 的格式
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief 实际内存使用（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 为 "oom" 表示触发了 OOM killer
     */
    std::string memory_result;

    /**
     * @brief 为 "soft-timelimit" 或 "hard-timelimit" 表示超时
     */
    std::string time_result;

    /**
     * @brief 触发硬时间限制的类型，"wall" 或 "cpu"，为空表示没有触发
     */
    std::string time_kind;

    /**
     * @brief 安全违规的类型，比如 "syscall"，为空表示没有违规
     */
    std::string violation;

    int64_t stdout_bytes = 0;

    int64_t stderr_bytes = 0;

    /**
     * @brief 被截断的输出流，比如 "stdout,stderr"
     */
    std::string output_truncated;

    std::string internal_error;
};

runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace tci
