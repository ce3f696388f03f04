#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief 用户代码的资源上限，小于等于 0 的值表示不限制
 */
struct resource_limits {
    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief CPU 时间，单位为秒
     */
    double cpu_time = 0;

    int64_t memory_bytes = -1;

    /**
     * @brief 单个文件的最大大小
     */
    int64_t file_bytes = -1;

    /**
     * @brief stdout、stderr 各自最多保留的字节数，超出的部分被丢弃
     */
    int64_t stream_bytes = -1;

    size_t max_processes = 0;

    bool no_core_dumps = false;
};

/**
 * @brief 用户代码的隔离设置
 */
struct isolation {
    std::string chroot_dir;

    /**
     * @brief 用户代码的工作目录，chroot 时为 chroot 之后的路径
     */
    std::string work_dir;

    int user_id = -1;
    int group_id = -1;

    /**
     * @brief 允许连接的 host:port 列表
     * 为空时用户代码运行在只有未启用的 lo 接口的网络命名空间中，
     * 否则保留主机的网络命名空间，由 egress_firewall 拒绝发往其他地址的包
     */
    std::vector<std::string> egress;

    /**
     * @brief seccomp 白名单中的系统调用名，为空时不限制系统调用
     */
    std::vector<std::string> syscalls;

    /**
     * @brief 是否保留 runguard 的环境变量，否则只保留 PATH
     */
    bool preserve_env = false;

    /**
     * @brief 额外的环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;
};

struct launch_options {
    resource_limits limits;
    isolation sandbox;

    std::string stdout_file;
    std::string stderr_file;

    /**
     * @brief 运行结果（meta 文件）的路径，为空时不写入
     */
    std::string meta_file;

    std::vector<std::string> command;
};
