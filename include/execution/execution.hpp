#pragma once

#include <string>
#include <vector>
#include "common/json_utils.hpp"
#include "common/status.hpp"
#include "governor/resource_governor.hpp"
#include "security/policy.hpp"

namespace tci {

/**
 * @brief 执行请求中声明的一个测试
 */
struct test_case {
    std::string name;

    /**
     * @brief 测试条件，是一个以执行结果的变量为上下文的布尔表达式
     * 比如 "result == 4"、"len(stdout) > 0 and status == 'Succeeded'"
     */
    std::string condition;

    /**
     * @brief 测试通过时贡献的奖励
     */
    double weight = 1.0;
};

/**
 * @brief 读取测试，权重可以写为 "weight" 或 "reward"
 */
void from_json(const nlohmann::json &j, test_case &test);

void to_json(nlohmann::json &j, const test_case &test);

struct test_result {
    std::string name;

    bool passed = false;

    /**
     * @brief 实际贡献的奖励，通过时为测试的权重，否则为 0
     */
    double reward = 0;

    /**
     * @brief 诊断信息，比如条件的解析错误
     */
    std::string message;
};

void to_json(nlohmann::json &j, const test_result &result);

/**
 * @brief 一次代码执行的记录
 * 执行进入终止状态后记录不再修改，并一直保留到会话关闭或者被保留策略淘汰。
 */
struct execution {
    std::string id;

    std::string session_id;

    std::string code;

    std::vector<test_case> tests;

    execution_status status = execution_status::CREATED;

    /**
     * @brief 开始和结束的 Unix 时间戳（毫秒）
     */
    int64_t started_at = 0, finished_at = 0;

    std::string stdout_text, stderr_text;
    bool stdout_truncated = false, stderr_truncated = false;

    /**
     * @brief 最后的表达式值，没有返回值时为 null
     */
    nlohmann::json value;
    bool has_value = false;

    /**
     * @brief 执行结束时可以序列化的全局变量
     */
    nlohmann::json bindings = nlohmann::json::object();

    int exitcode = -1;

    resource_profile limits;

    resource_usage usage;

    std::vector<security_violation> violations;

    /**
     * @brief 本次执行新建、修改或删除的会话文件
     */
    std::vector<std::string> changed_files, deleted_files;

    std::vector<test_result> test_results;

    double reward = 0;

    /**
     * @brief 给调用方的附加说明，比如超时或者资源超限的原因
     */
    std::string message;
};

/**
 * @brief 执行结果，返回给调用方的格式
 */
void to_json(nlohmann::json &j, const execution &exec);

}  // namespace tci
