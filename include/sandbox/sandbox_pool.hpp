#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "runtime/runtime_registry.hpp"
#include "sandbox/sandbox.hpp"

namespace tci {

/**
 * @brief 沙箱池满时 acquire 的行为
 */
enum class backpressure_mode {
    /**
     * @brief 阻塞等待其他会话释放沙箱，超过 acquire_timeout 后抛出 pool_exhausted
     */
    BLOCK,

    /**
     * @brief 立即抛出 pool_exhausted
     */
    FAIL_FAST
};

struct pool_config {
    /**
     * @brief 同时存在的沙箱实例的上限，包括正在预热的实例
     */
    size_t capacity = 8;

    backpressure_mode backpressure = backpressure_mode::BLOCK;

    /**
     * @brief BLOCK 模式下的最长等待时间，单位为秒
     */
    double acquire_timeout = 30;

    /**
     * @brief 每种预热语言保持的空闲实例数
     */
    size_t warm_size = 0;

    std::vector<std::string> warm_languages;

    /**
     * @brief is_dead 能够认出的最近销毁的实例数
     */
    size_t graveyard_size = 1024;
};

void from_json(const nlohmann::json &j, pool_config &config);

/**
 * @brief 沙箱归还时的执行结果
 */
struct release_outcome {
    /**
     * @brief 是否发生过安全违规
     */
    bool security_violation = false;

    /**
     * @brief 是否因资源超限被杀死（OOM、SIGXCPU、SIGXFSZ）
     */
    bool resource_killed = false;
};

/**
 * @brief 沙箱池
 * 容量是硬上限：live 计数包括已租出、空闲和正在预热的实例，任何时候都不会超过
 * capacity。租约表记录每个实例被哪个会话租用。
 *
 * 沙箱实例的生命周期：
 * Warming → Ready（空闲或已租出）→ Busy（执行中）→ Draining（归还清理中）→ Ready
 * 发生安全违规、资源超限被杀死或者健康检查失败的实例直接进入 Dead 并被删除，
 * Dead 的实例编号被记录下来，永远不会再被分配。
 */
struct sandbox_pool {
    sandbox_pool(const pool_config &config, runtime_registry &registry);

    /**
     * @brief 停止预热线程并销毁所有实例
     */
    ~sandbox_pool();

    /**
     * @brief 租用一个已经预热好的沙箱实例
     * 优先使用同语言的空闲实例；没有空闲实例且未满时创建新实例；池满时淘汰其他语言
     * 的空闲实例；都不行时按 backpressure 等待或失败。
     * @param language 语言名
     * @param ceilings 实例本次租用的资源上限
     * @param owner 租用的会话编号
     * @return 实例指针，在 release 之前一直有效
     * @throw pool_exhausted 池满时
     * @throw provisioning_error 语言不支持或运行时预热失败时
     */
    sandbox_instance *acquire(const std::string &language, const resource_profile &ceilings, const std::string &owner);

    /**
     * @brief 归还沙箱实例
     * 重复归还、归还不存在的实例不做任何事
     */
    void release(const std::string &instance_id, const release_outcome &outcome);

    /**
     * @brief 同步地为每种预热语言补足空闲实例
     */
    void warm_up();

    /**
     * @brief 启动后台预热线程，负责补足空闲实例和替换被销毁的实例
     */
    void start_warmer();

    void stop_warmer();

    size_t capacity() const;

    /**
     * @brief 当前存在的实例数，包括正在预热的实例
     */
    size_t live() const;

    size_t leased() const;

    size_t idle(const std::string &language) const;

    /**
     * @brief 已经销毁的实例数
     */
    size_t destroyed() const;

    /**
     * @brief 实例是否已经被销毁
     * 只记得最近 graveyard_size 个被销毁的实例
     */
    bool is_dead(const std::string &instance_id) const;

    /**
     * @brief 实例当前的租用者，没有被租用或者不存在时返回空串
     */
    std::string lease_owner(const std::string &instance_id) const;

private:
    /**
     * @brief 在持有锁时尝试为 language 占用一个容量，必要时淘汰其他语言的空闲实例
     * @param victim 被淘汰的实例，需要在释放锁之后销毁
     */
    bool reserve_slot_locked(const std::string &language, std::unique_ptr<sandbox_instance> &victim);

    /**
     * @brief 在已经占用的容量上创建并预热一个实例，失败时归还容量
     */
    std::unique_ptr<sandbox_instance> create_instance(const std::string &language);

    /**
     * @brief 创建一个空闲实例，池满时返回 false
     */
    bool warm_one(const std::string &language);

    void destroy(std::unique_ptr<sandbox_instance> instance, const std::string &reason);

    /**
     * @brief 在持有锁时记录被销毁的实例，超出 graveyard_size 时忘记最旧的记录
     */
    void bury_locked(const std::string &instance_id);

    void warmer_loop();

    pool_config config;
    runtime_registry &registry;

    mutable std::mutex mut;
    std::condition_variable cond;
    std::map<std::string, std::unique_ptr<sandbox_instance>> instances;

    /**
     * @brief 租约表：实例编号 → 会话编号
     */
    std::map<std::string, std::string> leases;

    std::map<std::string, std::deque<std::string>> idle_instances;
    std::set<std::string> graveyard;
    std::deque<std::string> burial_order;
    size_t destroyed_count = 0;
    size_t live_count = 0;

    /**
     * @brief 等待替换的实例语言
     */
    concurrent_queue<std::string> replacements;
    std::thread warmer;
    std::atomic<bool> stop{false};
};

}  // namespace tci
