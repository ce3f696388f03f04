#include "reward/reward_evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>

namespace tci {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, reward_config &config) {
    string normalization = get_value_def<string>(j, "raw_sum", "normalization");
    if (normalization == "raw_sum")
        config.normalization = reward_normalization::RAW_SUM;
    else if (normalization == "normalized")
        config.normalization = reward_normalization::NORMALIZED;
    else
        throw invalid_argument("unknown reward normalization " + normalization);
    assign_optional(j, config.limits.max_length, "max_condition_length");
    assign_optional(j, config.limits.max_steps, "max_steps");
    assign_optional(j, config.limits.max_depth, "max_depth");
}

reward_evaluator::reward_evaluator(const reward_config &config) : config(config) {}

json reward_evaluator::make_context(const execution &exec) const {
    json context = exec.bindings.is_object() ? exec.bindings : json::object();
    context["result"] = exec.has_value ? exec.value : json(nullptr);
    context["stdout"] = to_utf8_text(exec.stdout_text);
    context["stderr"] = to_utf8_text(exec.stderr_text);
    context["status"] = get_display_message(exec.status);
    context["exitcode"] = exec.exitcode;
    return context;
}

test_result reward_evaluator::evaluate(const test_case &test, const json &context) const {
    test_result result;
    result.name = test.name;
    try {
        json value = evaluate_expression(test.condition, context, config.limits);
        result.passed = is_truthy(value);
        if (!result.passed)
            result.message = fmt::format("condition evaluated to {}", dump_text(value));
    } catch (expression_error &e) {
        result.passed = false;
        result.message = e.what();
    }
    result.reward = result.passed ? test.weight : 0;
    return result;
}

vector<test_result> reward_evaluator::evaluate(const execution &exec) const {
    json context = make_context(exec);
    vector<test_result> results;
    for (auto &test : exec.tests)
        results.push_back(evaluate(test, context));
    return results;
}

double reward_evaluator::aggregate(const vector<test_case> &tests, const vector<test_result> &results) const {
    double passed = 0, total = 0;
    for (auto &test : tests) total += test.weight;
    for (auto &result : results) passed += result.reward;
    if (config.normalization == reward_normalization::NORMALIZED)
        return total == 0 ? 0 : passed / total;
    return passed;
}

void reward_evaluator::score(execution &exec) const {
    exec.test_results = evaluate(exec);
    exec.reward = aggregate(exec.tests, exec.test_results);
    DLOG(INFO) << "Execution " << exec.id << " scored " << exec.reward;
}

}  // namespace tci
