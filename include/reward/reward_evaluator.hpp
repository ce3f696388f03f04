#pragma once

#include <vector>
#include "execution/execution.hpp"
#include "reward/expression.hpp"

namespace tci {

/**
 * @brief 奖励的汇总方式
 */
enum class reward_normalization {
    /**
     * @brief 通过测试的权重之和
     */
    RAW_SUM,

    /**
     * @brief 通过测试的权重之和除以总权重，总权重为 0 时奖励为 0
     */
    NORMALIZED
};

struct reward_config {
    reward_normalization normalization = reward_normalization::RAW_SUM;

    expression_limits limits;
};

void from_json(const nlohmann::json &j, reward_config &config);

/**
 * @brief 奖励计算器
 * 对执行结果逐个计算测试条件，并将通过的测试的权重汇总为奖励。
 * 同样的执行结果和测试总是得到同样的奖励。
 */
struct reward_evaluator {
    explicit reward_evaluator(const reward_config &config);

    /**
     * @brief 构造条件表达式的变量表
     * 包含执行结束时的全局变量，以及保留的 result、stdout、stderr、status、exitcode，
     * 保留变量会覆盖同名的全局变量。
     */
    nlohmann::json make_context(const execution &exec) const;

    /**
     * @brief 计算执行的所有测试
     * @return 与 exec.tests 顺序相同的测试结果
     */
    std::vector<test_result> evaluate(const execution &exec) const;

    /**
     * @brief 计算单个测试，条件解析或求值失败时测试不通过并给出原因
     */
    test_result evaluate(const test_case &test, const nlohmann::json &context) const;

    /**
     * @brief 汇总奖励
     */
    double aggregate(const std::vector<test_case> &tests, const std::vector<test_result> &results) const;

    /**
     * @brief 计算测试结果和奖励，并写入执行记录
     */
    void score(execution &exec) const;

private:
    reward_config config;
};

}  // namespace tci
