#pragma once

#include <stdexcept>
#include <string>
#include "common/json_utils.hpp"

namespace tci {

/**
 * @brief 条件表达式解析或求值失败
 */
struct expression_error : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * @brief 条件表达式求值的资源上限
 */
struct expression_limits {
    /**
     * @brief 表达式的最大字符数
     */
    size_t max_length = 4096;

    /**
     * @brief 求值时最多访问的语法树节点数
     */
    size_t max_steps = 100000;

    /**
     * @brief 语法树的最大嵌套深度
     */
    size_t max_depth = 64;
};

/**
 * @brief 对 Python 风格的条件表达式求值
 * 表达式没有副作用，只能读取 context 中的变量，不能赋值或调用任意函数。
 * 支持的语法：
 * 1. 字面量：整数、浮点数、字符串、True/False/None（也可以写作 true/false/null）、列表；
 * 2. 变量、下标 a[0]、a["key"]、属性 a.key；
 * 3. 算术运算 + - * / // %，比较运算 == != < <= > >=（可以连写，如 0 < x < 10），
 *    in、not in、is、is not，逻辑运算 and or not（也可以写作 && || !）；
 * 4. 内置函数 len abs min max sum str int float round bool sorted any all；
 * 5. 字符串方法 strip lstrip rstrip lower upper startswith endswith split replace count，
 *    字典方法 get keys values，列表方法 count index。
 * @param source 表达式
 * @param context 变量表，必须是 JSON 对象
 * @return 表达式的值
 * @throw expression_error 表达式不合法、变量不存在、类型错误或者超出资源上限时
 */
nlohmann::json evaluate_expression(const std::string &source, const nlohmann::json &context, const expression_limits &limits);

/**
 * @brief 按 Python 的规则判断值的真假
 * null、false、0、空字符串、空列表和空字典为假
 */
bool is_truthy(const nlohmann::json &value);

}  // namespace tci
