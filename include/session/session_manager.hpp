#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "execution/dispatcher.hpp"
#include "governor/resource_governor.hpp"
#include "sandbox/sandbox_pool.hpp"
#include "security/security_gate.hpp"
#include "session/session.hpp"
#include "store/state_store.hpp"

namespace tci {

/**
 * @brief 会话正在执行时收到新的执行请求的处理方式
 */
enum class busy_policy {
    /**
     * @brief 按提交顺序排队等待
     */
    QUEUE,

    /**
     * @brief 直接抛出 session_busy
     */
    REJECT
};

struct session_config {
    busy_policy busy = busy_policy::QUEUE;

    /**
     * @brief 会话空闲多久之后被淘汰，单位为秒，不为正时不淘汰
     */
    double idle_timeout = 600;

    /**
     * @brief 后台淘汰线程的扫描间隔，单位为秒
     */
    double reaper_interval = 30;

    /**
     * @brief 每个会话最多保留的执行记录数
     */
    size_t execution_retention = 32;
};

void from_json(const nlohmann::json &j, session_config &config);

/**
 * @brief 执行请求
 */
struct execution_request {
    std::string code;

    std::vector<test_case> tests;

    /**
     * @brief 需要放入工作目录的会话文件，为空时放入所有文件
     */
    std::vector<std::string> files;

    /**
     * @brief 截止时间，单位为秒
     */
    std::optional<double> deadline;
};

void from_json(const nlohmann::json &j, execution_request &request);

/**
 * @brief 会话管理器
 * 负责会话的生命周期：创建时向沙箱池租用沙箱，执行时串行化同一会话的执行请求，
 * 关闭或空闲淘汰时归还沙箱并删除会话文件。会话元数据通过状态存储持久化。
 */
struct session_manager {
    session_manager(const session_config &config, sandbox_pool &pool, const security_gate &gate,
                    resource_governor &governor, state_store &store, execution_dispatcher &dispatcher);

    ~session_manager();

    /**
     * @brief 创建会话并绑定沙箱
     * @param language 语言名
     * @param resource_profile 请求的资源上限，缺失的字段使用默认值
     * @param network 网络访问请求，默认禁止网络
     * @return 会话编号
     * @throw pool_exhausted 沙箱池已满
     * @throw provisioning_error 无法准备沙箱
     * @throw invalid_argument_error 网络白名单不合法
     */
    std::string create_session(const std::string &language, const nlohmann::json &resource_profile, const network_request &network = {});

    /**
     * @brief 关闭会话，可以重复调用
     * 如果会话正在执行代码，等待执行结束后再关闭，排队中的执行请求被取消。
     * 已经关闭或者创建失败的会话直接返回。
     * @throw not_found_error 会话不存在
     */
    void close_session(const std::string &session_id);

    /**
     * @brief 上传文件到会话的虚拟文件系统，已有的文件被覆盖
     * @throw not_found_error 会话不存在
     * @throw invalid_argument_error 路径不安全
     */
    void upload_file(const std::string &session_id, const std::string &path, const std::string &content);

    /**
     * @brief 下载会话的文件
     * @throw not_found_error 会话或文件不存在
     */
    std::string download_file(const std::string &session_id, const std::string &path);

    std::vector<file_info> list_files(const std::string &session_id);

    /**
     * @brief 在会话中执行代码，阻塞到执行结束
     * 静态扫描不通过的代码直接返回 SecurityRejected 的执行记录，不占用沙箱。
     * @throw not_found_error 会话不存在
     * @throw session_closed 会话已关闭或者在排队时被关闭
     * @throw session_busy 会话正在执行且忙碌策略为 REJECT
     */
    std::shared_ptr<const execution> run_execution(const std::string &session_id, const execution_request &request);

    /**
     * @brief 会话的元数据
     */
    nlohmann::json session_info(const std::string &session_id);

    /**
     * @brief 关闭所有空闲超时的会话
     * @return 关闭的会话数
     */
    size_t evict_idle();

    /**
     * @brief 关闭所有会话，用于引擎退出
     */
    void close_all();

    void start_reaper();

    void stop_reaper();

    /**
     * @brief 当前未关闭的会话数
     */
    size_t size() const;

private:
    /**
     * @throw session_closed 会话已关闭或者创建失败
     * @throw not_found_error 会话不存在
     */
    std::shared_ptr<session> find(const std::string &session_id) const;

    /**
     * @brief 状态存储中是否记录了会话已经关闭或失败
     * 已结束的会话不在内存中保留，重复关闭和之后的请求依据这一记录回复
     */
    bool ended(const std::string &session_id) const;

    void touch(session &s) const;

    void persist(const session &s);

    /**
     * @brief 执行后沙箱被标记销毁时，归还沙箱并重新绑定一个新沙箱
     * 无法绑定时会话进入 Failed
     */
    void rebind(session &s, const execution &exec);

    std::shared_ptr<const execution> reject(session &s, std::shared_ptr<execution> exec, const scan_report &report);

    void retain(session &s, std::shared_ptr<const execution> exec);

    void reaper_loop();

    session_config config;
    sandbox_pool &pool;
    const security_gate &gate;
    resource_governor &governor;
    state_store &store;
    execution_dispatcher &dispatcher;

    mutable std::mutex mut;
    std::map<std::string, std::shared_ptr<session>> sessions;

    std::thread reaper;
    std::mutex reaper_mut;
    std::condition_variable reaper_cond;
    bool reaper_stop = false;
};

}  // namespace tci
