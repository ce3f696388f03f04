#include "gtest/gtest.h"
#include "reward/expression.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace tci;
using namespace nlohmann;

class ExpressionTest : public ::testing::Test {
protected:
    json eval(const string &source) {
        return evaluate_expression(source, context, limits);
    }

    json context = {{"result", 4},
                     {"stdout", "hello world\n"},
                     {"stderr", ""},
                     {"status", "Succeeded"},
                     {"exitcode", 0},
                     {"items", {3, 1, 2}},
                     {"scores", {{"a", 0.5}, {"b", 1.5}}},
                     {"nothing", nullptr}};
    expression_limits limits;
};

TEST_F(ExpressionTest, Literals) {
    EXPECT_JSON_EQ(eval("42"), json(42));
    EXPECT_JSON_EQ(eval("2.5"), json(2.5));
    EXPECT_JSON_EQ(eval("'single'"), json("single"));
    EXPECT_JSON_EQ(eval("\"a\\tb\""), json("a\tb"));
    EXPECT_JSON_EQ(eval("True"), json(true));
    EXPECT_JSON_EQ(eval("false"), json(false));
    EXPECT_JSON_EQ(eval("None"), json(nullptr));
    EXPECT_JSON_EQ(eval("[1, 'x', null,]"), json({1, "x", nullptr}));
}

TEST_F(ExpressionTest, Arithmetic) {
    EXPECT_JSON_EQ(eval("1 + 2 * 3"), json(7));
    EXPECT_JSON_EQ(eval("(1 + 2) * 3"), json(9));
    EXPECT_JSON_EQ(eval("7 / 2"), json(3.5));
    EXPECT_JSON_EQ(eval("7 // 2"), json(3));
    EXPECT_JSON_EQ(eval("-7 // 2"), json(-4));
    EXPECT_JSON_EQ(eval("-7 % 3"), json(2));
    EXPECT_JSON_EQ(eval("'ab' * 2"), json("abab"));
    EXPECT_JSON_EQ(eval("'a' + 'b'"), json("ab"));
    EXPECT_JSON_EQ(eval("[1] + [2]"), json({1, 2}));
    EXPECT_JSON_EQ(eval("result + 0.5"), json(4.5));
}

TEST_F(ExpressionTest, Comparisons) {
    EXPECT_JSON_EQ(eval("result == 4"), json(true));
    EXPECT_JSON_EQ(eval("result == 4.0"), json(true));
    EXPECT_JSON_EQ(eval("0 < result < 10"), json(true));
    EXPECT_JSON_EQ(eval("0 < result < 3"), json(false));
    EXPECT_JSON_EQ(eval("status != 'Failed'"), json(true));
    EXPECT_JSON_EQ(eval("'world' in stdout"), json(true));
    EXPECT_JSON_EQ(eval("5 not in items"), json(true));
    EXPECT_JSON_EQ(eval("'a' in scores"), json(true));
    EXPECT_JSON_EQ(eval("nothing is None"), json(true));
    EXPECT_JSON_EQ(eval("result is not None"), json(true));
    EXPECT_JSON_EQ(eval("[1, 2] < [1, 3]"), json(true));
}

TEST_F(ExpressionTest, LogicShortCircuits) {
    EXPECT_JSON_EQ(eval("result == 4 and exitcode == 0"), json(true));
    EXPECT_JSON_EQ(eval("result == 5 || exitcode == 0"), json(true));
    EXPECT_JSON_EQ(eval("not stderr"), json(true));
    EXPECT_JSON_EQ(eval("!result"), json(false));
    // 右侧的变量不存在，但不会被求值
    EXPECT_JSON_EQ(eval("False and undefined_name"), json(false));
    EXPECT_JSON_EQ(eval("result or undefined_name"), json(4));
}

TEST_F(ExpressionTest, IndexingAndAttributes) {
    EXPECT_JSON_EQ(eval("items[0]"), json(3));
    EXPECT_JSON_EQ(eval("items[-1]"), json(2));
    EXPECT_JSON_EQ(eval("stdout[0]"), json("h"));
    EXPECT_JSON_EQ(eval("scores['b']"), json(1.5));
    EXPECT_JSON_EQ(eval("scores.a"), json(0.5));
    EXPECT_THROW(eval("items[3]"), expression_error);
    EXPECT_THROW(eval("scores['c']"), expression_error);
}

TEST_F(ExpressionTest, Builtins) {
    EXPECT_JSON_EQ(eval("len(items)"), json(3));
    EXPECT_JSON_EQ(eval("len(stdout.strip())"), json(11));
    EXPECT_JSON_EQ(eval("sum(items)"), json(6));
    EXPECT_JSON_EQ(eval("min(items)"), json(1));
    EXPECT_JSON_EQ(eval("max(4, 9, 2)"), json(9));
    EXPECT_JSON_EQ(eval("sorted(items)"), json({1, 2, 3}));
    EXPECT_JSON_EQ(eval("abs(-3)"), json(3));
    EXPECT_JSON_EQ(eval("round(2.5)"), json(2));
    EXPECT_JSON_EQ(eval("round(3.14159, 2)"), json(3.14));
    EXPECT_JSON_EQ(eval("int(' 12 ')"), json(12));
    EXPECT_JSON_EQ(eval("int(3.9)"), json(3));
    EXPECT_JSON_EQ(eval("float('1.5')"), json(1.5));
    EXPECT_JSON_EQ(eval("str(result)"), json("4"));
    EXPECT_JSON_EQ(eval("str(True)"), json("True"));
    EXPECT_JSON_EQ(eval("bool([])"), json(false));
    EXPECT_JSON_EQ(eval("any([0, '', 1])"), json(true));
    EXPECT_JSON_EQ(eval("all([])"), json(true));
}

TEST_F(ExpressionTest, Methods) {
    EXPECT_JSON_EQ(eval("stdout.strip() == 'hello world'"), json(true));
    EXPECT_JSON_EQ(eval("stdout.upper().startswith('HELLO')"), json(true));
    EXPECT_JSON_EQ(eval("stdout.split()"), json({"hello", "world"}));
    EXPECT_JSON_EQ(eval("'a,b,,c'.split(',')"), json({"a", "b", "", "c"}));
    EXPECT_JSON_EQ(eval("'aaa'.replace('a', 'b')"), json("bbb"));
    EXPECT_JSON_EQ(eval("'banana'.count('an')"), json(2));
    EXPECT_JSON_EQ(eval("scores.get('z', 0)"), json(0));
    EXPECT_JSON_EQ(eval("sorted(scores.keys())"), json({"a", "b"}));
    EXPECT_JSON_EQ(eval("items.index(2)"), json(2));
}

TEST_F(ExpressionTest, Errors) {
    EXPECT_THROW(eval("undefined_name"), expression_error);
    EXPECT_THROW(eval("1 +"), expression_error);
    EXPECT_THROW(eval("(1"), expression_error);
    EXPECT_THROW(eval("'unterminated"), expression_error);
    EXPECT_THROW(eval("1 / 0"), expression_error);
    EXPECT_THROW(eval("1 // 0"), expression_error);
    EXPECT_THROW(eval("'a' + 1"), expression_error);
    EXPECT_THROW(eval("'a' < 1"), expression_error);
    EXPECT_THROW(eval("open('/etc/passwd')"), expression_error);
    EXPECT_THROW(eval("stdout.__class__()"), expression_error);
    EXPECT_THROW(eval("items[0](1)"), expression_error);
    EXPECT_THROW(eval("result = 5"), expression_error);
    EXPECT_THROW(eval("lambda: 1"), expression_error);
    EXPECT_THROW(evaluate_expression("1", json::array(), limits), expression_error);
}

TEST_F(ExpressionTest, Limits) {
    limits.max_length = 16;
    EXPECT_THROW(eval("1 + 1 + 1 + 1 + 1 + 1"), expression_error);

    limits = expression_limits();
    limits.max_depth = 8;
    EXPECT_THROW(eval("((((((((((1))))))))))"), expression_error);

    limits = expression_limits();
    limits.max_steps = 10;
    EXPECT_THROW(eval("1 + 1 + 1 + 1 + 1 + 1 + 1 + 1"), expression_error);

    limits = expression_limits();
    EXPECT_THROW(eval("'x' * 100000000000"), expression_error);
}

TEST_F(ExpressionTest, IntegerOverflowBecomesFloat) {
    EXPECT_JSON_EQ(eval("9223372036854775807 + 1 > 0"), json(true));
    EXPECT_JSON_EQ(eval("-9223372036854775807 - 2 < 0"), json(true));
    EXPECT_JSON_EQ(eval("-(-9223372036854775807 - 1) > 0"), json(true));
    EXPECT_JSON_EQ(eval("abs(-9223372036854775807 - 1) > 0"), json(true));
    EXPECT_JSON_EQ(eval("(-9223372036854775807 - 1) // -1 > 0"), json(true));
    EXPECT_DOUBLE_EQ(eval("9223372036854775807 * 2").get<double>(), 18446744073709551616.0);
    EXPECT_JSON_EQ(eval("sum([9223372036854775807, 9223372036854775807]) > 0"), json(true));

    context["big"] = json(uint64_t(18446744073709551615ULL));
    EXPECT_JSON_EQ(eval("big > 0"), json(true));
    EXPECT_JSON_EQ(eval("9223372036854775807 * 3 == 27670116110564327421"), json(true));
}

TEST_F(ExpressionTest, ConstructedValuesConsumeBudget) {
    EXPECT_JSON_EQ(eval("len([0] * 1000)"), json(1000));
    EXPECT_JSON_EQ(eval("len([[0] * 10] * 10)"), json(10));

    EXPECT_THROW(eval("len([[0] * 1000000] * 1000000) == 1"), expression_error);
    EXPECT_THROW(eval("len([[0] * 1000] * 1000) == 1000"), expression_error);
    EXPECT_THROW(eval("len([0] * 60000 + [0] * 60000)"), expression_error);
    EXPECT_THROW(eval("len([[0] * 30000, [0] * 30000, [0] * 30000, [0] * 30000])"), expression_error);
}

TEST_F(ExpressionTest, Truthiness) {
    EXPECT_FALSE(is_truthy(nullptr));
    EXPECT_FALSE(is_truthy(0));
    EXPECT_FALSE(is_truthy(0.0));
    EXPECT_FALSE(is_truthy(""));
    EXPECT_FALSE(is_truthy(json::array()));
    EXPECT_FALSE(is_truthy(json::object()));
    EXPECT_TRUE(is_truthy(json({{"a", 1}})));
    EXPECT_TRUE(is_truthy("0"));
    EXPECT_TRUE(is_truthy(-1));
}
