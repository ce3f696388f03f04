#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "runtime/language_runtime.hpp"

namespace tci {

/**
 * @brief 语言运行时注册表
 * 每种语言注册一个工厂函数，沙箱池在创建沙箱实例时调用工厂函数创建运行时。
 */
struct runtime_registry {
    typedef std::function<std::unique_ptr<language_runtime>()> factory;

    /**
     * @brief 注册语言运行时，同名语言会被覆盖
     */
    void register_runtime(const std::string &language, factory runtime_factory);

    bool supports(const std::string &language) const;

    /**
     * @brief 创建一个语言运行时
     * @throw provisioning_error 语言不支持时
     */
    std::unique_ptr<language_runtime> create(const std::string &language) const;

    std::vector<std::string> languages() const;

private:
    mutable std::mutex mut;
    std::map<std::string, factory> factories;
};

}  // namespace tci
