#pragma once

#include <fmt/core.h>
#include <sys/types.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace tci {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    to_string_cont<std::decay_t<const Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 启动子进程时的设置
 */
struct spawn_options {
    /**
     * @brief 子进程的工作目录，为空时继承父进程
     */
    std::filesystem::path work_dir;

    /**
     * @brief 额外的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 子进程 stdout/stderr 重定向的文件，为空时继承父进程
     */
    std::filesystem::path stdout_file, stderr_file;

    /**
     * @brief 是否通过 setsid 让子进程成为新进程组的组长
     * 这样可以通过 kill(-pid) 杀死整个进程树
     */
    bool new_process_group = true;

    /**
     * @brief 在子进程 exec 之前调用，比如设置 rlimit
     * 只能调用 async-signal-safe 的函数，失败时返回 false
     */
    std::function<bool()> before_exec;
};

/**
 * @brief 启动外部程序，不等待其结束
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @return 子进程的 pid
 * @throw std::system_error fork 失败时
 */
pid_t spawn_process(const std::vector<std::string> &argv, const spawn_options &options);

/**
 * @brief 子进程的结束状态
 */
struct process_status {
    int exitcode = -1;

    /**
     * @brief 若子进程因信号结束，为信号编号，否则为 -1
     */
    int signal = -1;
};

/**
 * @brief 阻塞等待子进程结束
 */
process_status wait_process(pid_t pid);

/**
 * @brief 执行外部命令并等待其结束
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
int exec_program(const std::vector<std::string> &argv);

/**
 * @brief 调用外部程序
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     std::filesystem::path shell("/bin/sh");
 *     std::filesystem::path script("/tmp/shell.sh");
 *     int exitcode = call_process(shell, script);
 * @endcode
 */
template <typename... Args>
int call_process(const Args &... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return exec_program(list);
}

/**
 * @brief 生成随机的 UUID 字符串，用于会话、执行和沙箱的编号
 */
std::string generate_uuid();

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

/**
 * @brief 当前时间的 Unix 时间戳（毫秒）
 */
int64_t unix_millis();

}  // namespace tci
