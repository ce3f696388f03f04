#pragma once

#include <sys/types.h>
#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

/**
 * @brief libcgroup 调用失败
 */
struct cgroup_error : public std::exception {
    cgroup_error(const std::string &op, int err);

    const char *what() const noexcept override;

    /**
     * @brief err 不为 0 时抛出 cgroup_error
     */
    static void check(const std::string &op, int err);

private:
    std::string message;
};

/**
 * @brief 一次执行结束后从 cgroup 中读出的资源使用
 */
struct cgroup_usage {
    /**
     * @brief 内存（含交换区）的峰值，单位为字节
     */
    int64_t memory_peak = 0;

    /**
     * @brief 所有进程的 CPU 时间之和，单位为纳秒
     */
    int64_t cpu_nanos = 0;

    /**
     * @brief OOM killer 是否杀死过 cgroup 中的进程
     */
    bool oom = false;
};

/**
 * @brief 一次执行专用的 cgroup (v1)
 * 使用的 controller：
 * 1. memory - 限制内存，RAM 与 RAM+交换区的上限相同，用户代码无法借助交换区超限
 * 2. cpuacct - 统计所有进程的 CPU 时间，包括用户代码 fork 出来的子进程
 * 3. pids - 限制同时存在的进程数，防止 fork 炸弹
 * 4. net_cls - 给用户代码的网络包打上 classid，供 iptables 的 cgroup 匹配使用
 *
 * 析构时删除 cgroup，残留的进程会被移入上一层 cgroup，因此析构前应先调用 kill_all。
 */
struct execution_cgroup {
    /**
     * @param name cgroup 的路径，比如 /tci/run_1234
     * @param memory_limit 内存上限，单位为字节，小于 0 表示不限制
     * @param max_processes 最大进程数，0 表示不限制
     * @param net_classid net_cls.classid，0 表示不使用 net_cls
     */
    execution_cgroup(const std::string &name, int64_t memory_limit, size_t max_processes, uint32_t net_classid = 0);

    ~execution_cgroup();

    execution_cgroup(const execution_cgroup &) = delete;
    execution_cgroup &operator=(const execution_cgroup &) = delete;

    /**
     * @brief 将当前进程移入本 cgroup
     * 在 fork 出来的子进程中 exec 之前调用
     */
    void attach_self();

    /**
     * @brief 杀死 cgroup 中的所有进程
     * @return 被发送了 SIGKILL 的进程数
     */
    size_t kill_all();

    /**
     * @brief 从内核读取资源使用
     */
    cgroup_usage usage() const;

    const std::string &name() const;

    /**
     * @brief 初始化 libcgroup，进程中只需调用一次
     */
    static void init();

private:
    std::string cgroup_name;
    struct cgroup *cg = nullptr;
    bool created = false;
};
