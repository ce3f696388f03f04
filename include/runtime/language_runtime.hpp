#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "governor/resource_governor.hpp"
#include "security/policy.hpp"

namespace tci {

/**
 * @brief 提交给语言运行时的一次执行
 */
struct runtime_request {
    std::string execution_id;

    std::string code;

    /**
     * @brief 沙箱根目录，用户代码的工作目录为 root / "work"
     */
    std::filesystem::path root;

    resource_profile limits;

    /**
     * @brief 实际生效的时钟时间限制，单位为秒
     */
    double wall_time = 0;

    runtime_policy policy;
};

/**
 * @brief 语言运行时的执行结果
 */
struct runtime_output {
    std::string stdout_text, stderr_text;
    bool stdout_truncated = false, stderr_truncated = false;

    /**
     * @brief 用户代码最后的表达式值或者 result 变量的值
     */
    nlohmann::json value;
    bool has_value = false;

    /**
     * @brief 用户代码结束时可以序列化为 JSON 的全局变量
     */
    nlohmann::json bindings = nlohmann::json::object();

    int exitcode = -1;

    /**
     * @brief 若用户进程因信号结束，为信号编号，否则为 -1
     */
    int signal = -1;

    resource_usage usage;

    /**
     * @brief 是否因为时钟时间超限或 terminate() 被强制终止
     */
    bool timed_out = false;

    /**
     * @brief 运行时安全违规，比如调用了白名单外的系统调用
     */
    std::vector<security_violation> violations;

    /**
     * @brief 运行时自身的错误（比如 runguard 出错），为空表示没有错误
     */
    std::string internal_error;
};

/**
 * @brief 语言运行时的能力接口
 * 执行调度器只依赖这个接口，不关心具体的语言和隔离方式。
 * 一个运行时对象属于一个沙箱实例，同一时刻只会执行一段代码。
 */
struct language_runtime {
    virtual ~language_runtime();

    /**
     * @brief 运行时支持的语言名，比如 "python3"
     */
    virtual std::string language() const = 0;

    /**
     * @brief 预热：将语言运行时镜像加载进沙箱根目录
     * @throw provisioning_error 镜像不存在或加载失败时
     */
    virtual void prepare(const std::filesystem::path &root) = 0;

    /**
     * @brief 在沙箱内执行代码，阻塞直到代码结束或者被终止
     * 用户代码抛出异常不是错误，通过 exitcode 和 stderr 返回
     */
    virtual runtime_output execute(const runtime_request &request) = 0;

    /**
     * @brief 强制终止正在运行的代码，可以从其他线程调用
     * 调用后 execute 会尽快返回，且 timed_out 为真
     */
    virtual void terminate() = 0;

    /**
     * @brief 健康检查，不健康的沙箱在回收时会被销毁
     */
    virtual bool healthy() const = 0;

    /**
     * @brief 是否能将用户代码的网络连接限制在出口白名单内
     * 不能限制的运行时不允许开启网络访问
     */
    virtual bool filters_egress() const = 0;
};

}  // namespace tci
