#include "gtest/gtest.h"
#include "reward/reward_evaluator.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace tci;
using namespace nlohmann;

class RewardEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        exec.id = "e-1";
        exec.status = execution_status::SUCCEEDED;
        exec.exitcode = 0;
        exec.value = 4;
        exec.has_value = true;
        exec.stdout_text = "4\n";
        exec.bindings = {{"answer", 42}, {"result", "shadowed"}};
    }

    static test_case make_test(const string &name, const string &condition, double weight = 1.0) {
        test_case test;
        test.name = name;
        test.condition = condition;
        test.weight = weight;
        return test;
    }

    execution exec;
};

TEST_F(RewardEvaluatorTest, ContextContainsReservedNames) {
    reward_evaluator evaluator({});
    json context = evaluator.make_context(exec);
    EXPECT_JSON_EQ(context["result"], json(4));
    EXPECT_JSON_EQ(context["answer"], json(42));
    EXPECT_JSON_EQ(context["stdout"], json("4\n"));
    EXPECT_JSON_EQ(context["status"], json("Succeeded"));
    EXPECT_JSON_EQ(context["exitcode"], json(0));

    exec.has_value = false;
    EXPECT_JSON_EQ(evaluator.make_context(exec)["result"], json(nullptr));
}

TEST_F(RewardEvaluatorTest, RawSumOfPassedWeights) {
    exec.tests = {make_test("value", "result == 4", 2),
                  make_test("binding", "answer == 41", 3),
                  make_test("output", "stdout.strip() == '4'", 0.5)};
    reward_evaluator evaluator({});
    evaluator.score(exec);

    ASSERT_EQ(exec.test_results.size(), 3u);
    EXPECT_TRUE(exec.test_results[0].passed);
    EXPECT_DOUBLE_EQ(exec.test_results[0].reward, 2);
    EXPECT_FALSE(exec.test_results[1].passed);
    EXPECT_DOUBLE_EQ(exec.test_results[1].reward, 0);
    EXPECT_EQ(exec.test_results[1].message, "condition evaluated to false");
    EXPECT_TRUE(exec.test_results[2].passed);
    EXPECT_DOUBLE_EQ(exec.reward, 2.5);
}

TEST_F(RewardEvaluatorTest, NormalizedReward) {
    reward_config config;
    config.normalization = reward_normalization::NORMALIZED;
    reward_evaluator evaluator(config);

    exec.tests = {make_test("a", "True", 1), make_test("b", "False", 3)};
    evaluator.score(exec);
    EXPECT_DOUBLE_EQ(exec.reward, 0.25);

    exec.tests = {make_test("zero", "True", 0)};
    evaluator.score(exec);
    EXPECT_DOUBLE_EQ(exec.reward, 0);
}

TEST_F(RewardEvaluatorTest, BrokenConditionFailsOnlyThatTest) {
    exec.tests = {make_test("syntax", "result ==", 1),
                  make_test("missing", "undefined_name > 0", 1),
                  make_test("ok", "exitcode == 0", 1)};
    reward_evaluator evaluator({});
    evaluator.score(exec);

    EXPECT_FALSE(exec.test_results[0].passed);
    EXPECT_FALSE(exec.test_results[0].message.empty());
    EXPECT_FALSE(exec.test_results[1].passed);
    EXPECT_NE(exec.test_results[1].message.find("undefined_name"), string::npos);
    EXPECT_TRUE(exec.test_results[2].passed);
    EXPECT_DOUBLE_EQ(exec.reward, 1);
}

TEST_F(RewardEvaluatorTest, SameInputSameReward) {
    exec.tests = {make_test("a", "result * 2 == 8", 1.5), make_test("b", "len(stdout) == 2", 1)};
    reward_evaluator evaluator({});
    evaluator.score(exec);
    double first = exec.reward;
    evaluator.score(exec);
    EXPECT_DOUBLE_EQ(exec.reward, first);
    EXPECT_DOUBLE_EQ(first, 2.5);
}

TEST_F(RewardEvaluatorTest, ReadsTestsAndConfiguration) {
    auto test = json{{"name", "t"}, {"condition", "True"}, {"reward", 0.5}}.get<test_case>();
    EXPECT_DOUBLE_EQ(test.weight, 0.5);
    auto weighted = json{{"condition", "True"}, {"weight", 2}}.get<test_case>();
    EXPECT_DOUBLE_EQ(weighted.weight, 2);
    EXPECT_EQ(weighted.name, "");

    auto config = json{{"normalization", "normalized"}, {"max_steps", 10}}.get<reward_config>();
    EXPECT_EQ(config.normalization, reward_normalization::NORMALIZED);
    EXPECT_EQ(config.limits.max_steps, 10u);
    EXPECT_THROW(json({{"normalization", "median"}}).get<reward_config>(), std::invalid_argument);
}
