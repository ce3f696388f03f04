#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <boost/throw_exception.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace tci {

/**
 * @brief 执行引擎所有异常的基类
 * 构造时会记录调用栈，输出时通过 boost::diagnostic_information 打印
 * 抛出位置与调用栈。
 */
struct tci_exception : std::exception {
    tci_exception();
    explicit tci_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const tci_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 异常的类别名，用于返回给调用方，比如 "not_found"
     */
    virtual const char *kind() const noexcept;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 一般是外部脚本或 runguard 本身的问题
 */
struct internal_error : public tci_exception {
    using tci_exception::tci_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 无法为会话准备沙箱
 * 比如语言不支持、运行时镜像加载失败
 */
struct provisioning_error : public tci_exception {
    using tci_exception::tci_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 沙箱池已满，在等待时限内没有空闲容量
 * 调用方可以稍后重试
 */
struct pool_exhausted : public provisioning_error {
    using provisioning_error::provisioning_error;
    const char *kind() const noexcept override;
};

/**
 * @brief 会话正在执行代码，且忙碌策略为直接拒绝
 */
struct session_busy : public tci_exception {
    using tci_exception::tci_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 会话或文件不存在
 */
struct not_found_error : public tci_exception {
    using tci_exception::tci_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 会话已经关闭，排队中的执行请求被取消
 */
struct session_closed : public not_found_error {
    using not_found_error::not_found_error;
    const char *kind() const noexcept override;
};

/**
 * @brief 会话状态机中不存在的状态转移
 */
struct invalid_transition : public tci_exception {
    using tci_exception::tci_exception;
    const char *kind() const noexcept override;
};

/**
 * @brief 状态存储出错
 * transient 为真时表示可以重试的暂时性错误（比如连接断开）
 */
struct state_store_error : public tci_exception {
    explicit state_store_error(const std::string &message, bool transient = false);
    const char *kind() const noexcept override;

    bool transient;
};

/**
 * @brief 请求参数不合法，比如路径包含 ".."
 */
struct invalid_argument_error : public tci_exception {
    using tci_exception::tci_exception;
    const char *kind() const noexcept override;
};

}  // namespace tci
