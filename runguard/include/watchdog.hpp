#pragma once

#include "launch_options.hpp"

/**
 * @brief 在沙箱中运行 opt.command，并监控它直到结束
 * 1. 为本次执行创建 cgroup，限制内存和进程数，统计 CPU 时间
 *    给出 egress 白名单时，用 net_cls classid 标记用户代码的包，并安装只放行白名单的 iptables 规则
 * 2. 分离 IPC、挂载、UTS 命名空间，没有 egress 白名单时还分离网络命名空间
 * 3. fork 出子进程
 *    1. 成为新的会话组长，以便通过 kill(-pid) 杀死整个进程组
 *    2. 移入 cgroup，设置 rlimit 和环境变量
 *    3. stdout/stderr 连接到管道，stdin 连接到 /dev/null
 *    4. chroot、进入工作目录、切换到运行用户
 *    5. 最后加载 seccomp 白名单并 exec
 *    任何一步失败时通过 close-on-exec 的管道把错误告诉 watchdog
 * 4. watchdog 通过 poll 同时等待子进程输出、SIGCHLD/SIGTERM（signalfd）和时钟时间超时（timerfd）
 *    1. 输出超过 stream_bytes 的部分被丢弃，但仍然计数
 *    2. 超时或收到 SIGTERM 时先发送 SIGTERM，0.1 秒后发送 SIGKILL
 * 5. 子进程结束后杀死 cgroup 内残留的所有进程，读取 CPU 时间、内存峰值、是否 OOM，
 *    以及防火墙拒绝过的包数，有被拒绝的包时 violation 为 network
 * 6. 将结果写入 meta 文件
 * @return 用户程序的退出码，被信号杀死时为 128 + 信号编号
 */
int run_guarded(const launch_options &opt);
