#pragma once

#include "launch_options.hpp"

/**
 * 以下函数都在 fork 出来的子进程中、exec 之前调用，失败时抛出 std::system_error
 */

/**
 * @brief 设置 CPU 时间、文件大小、core dump 的 rlimit
 * 内存和进程数由 cgroup 限制，这里解除对应的 rlimit 以免干扰 cgroup 的统计
 */
void apply_rlimits(const resource_limits &limits);

/**
 * @brief 准备用户代码的环境变量
 */
void prepare_environment(const isolation &sandbox);

/**
 * @brief 进入 chroot 和工作目录，并切换到运行用户
 * @throw std::runtime_error 最终仍以 root 身份运行时
 */
void enter_sandbox(const isolation &sandbox);

/**
 * @brief 加载 seccomp 白名单
 * 白名单以外的系统调用直接以 SIGSYS 杀死整个进程，必须在 exec 之前最后调用。
 */
void load_syscall_filter(const std::vector<std::string> &syscalls);
