#include "reward/expression.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <vector>

namespace tci {
using namespace std;
using namespace nlohmann;

// 字符串重复等运算结果的最大长度
static const size_t MAX_VALUE_SIZE = 1 << 20;

enum class token_type { NUMBER, STRING, NAME, OP, END };

struct token {
    token_type type;
    string text;
    json value;
    size_t pos;
};

// 双字符运算符必须排在单字符运算符之前
static const vector<string> OPERATORS = {
    "//", "==", "!=", "<=", ">=", "&&", "||",
    "(", ")", "[", "]", ",", ".", "+", "-", "*", "/", "%", "<", ">", "!"};

static const vector<string> KEYWORDS = {"and", "or", "not", "in", "is", "if", "else", "lambda"};

static bool is_digit(char c) {
    return isdigit((unsigned char)c);
}

static vector<token> tokenize(const string &src) {
    vector<token> tokens;
    size_t i = 0;
    while (i < src.size()) {
        char c = src[i];
        if (isspace((unsigned char)c)) {
            ++i;
            continue;
        }

        if (is_digit(c) || (c == '.' && i + 1 < src.size() && is_digit(src[i + 1]))) {
            size_t start = i;
            bool is_float = false;
            while (i < src.size() && is_digit(src[i])) ++i;
            if (i < src.size() && src[i] == '.') {
                is_float = true;
                ++i;
                while (i < src.size() && is_digit(src[i])) ++i;
            }
            if (i < src.size() && (src[i] == 'e' || src[i] == 'E')) {
                size_t j = i + 1;
                if (j < src.size() && (src[j] == '+' || src[j] == '-')) ++j;
                if (j < src.size() && is_digit(src[j])) {
                    is_float = true;
                    i = j;
                    while (i < src.size() && is_digit(src[i])) ++i;
                }
            }
            string text = src.substr(start, i - start);
            token t{token_type::NUMBER, text, nullptr, start};
            try {
                int64_t integer;
                if (!is_float && boost::conversion::try_lexical_convert(text, integer))
                    t.value = integer;
                else
                    t.value = boost::lexical_cast<double>(text);
            } catch (boost::bad_lexical_cast &) {
                throw expression_error("invalid number literal " + text);
            }
            tokens.push_back(t);
            continue;
        }

        if (c == '\'' || c == '"') {
            size_t start = i++;
            string value;
            while (true) {
                if (i >= src.size()) throw expression_error(fmt::format("unterminated string literal at position {}", start));
                char d = src[i++];
                if (d == c) break;
                if (d != '\\') {
                    value += d;
                    continue;
                }
                if (i >= src.size()) throw expression_error(fmt::format("unterminated string literal at position {}", start));
                char e = src[i++];
                switch (e) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    case '0': value += '\0'; break;
                    default: value += e; break;
                }
            }
            tokens.push_back({token_type::STRING, src.substr(start, i - start), value, start});
            continue;
        }

        if (isalpha((unsigned char)c) || c == '_') {
            size_t start = i;
            while (i < src.size() && (isalnum((unsigned char)src[i]) || src[i] == '_')) ++i;
            tokens.push_back({token_type::NAME, src.substr(start, i - start), nullptr, start});
            continue;
        }

        bool matched = false;
        for (auto &op : OPERATORS) {
            if (src.compare(i, op.size(), op) == 0) {
                tokens.push_back({token_type::OP, op, nullptr, i});
                i += op.size();
                matched = true;
                break;
            }
        }
        if (!matched) throw expression_error(fmt::format("unexpected character '{}' at position {}", c, i));
    }
    tokens.push_back({token_type::END, "", nullptr, src.size()});
    return tokens;
}

enum class node_type {
    LITERAL,
    NAME,
    LIST,
    NEGATE,
    NOT,
    AND,
    OR,
    BINARY,
    COMPARE,
    INDEX,
    ATTRIBUTE,
    CALL,
    METHOD
};

struct node {
    node_type type;

    // LITERAL 的值
    json value;

    // 变量名、属性名、函数名或者二元运算符
    string name;

    // COMPARE 的运算符，比 children 少一个
    vector<string> ops;

    vector<unique_ptr<node>> children;
};

typedef unique_ptr<node> node_ptr;

static node_ptr make_node(node_type type) {
    auto n = make_unique<node>();
    n->type = type;
    return n;
}

struct depth_guard {
    depth_guard(size_t &depth, size_t max_depth) : depth(depth) {
        if (depth >= max_depth) throw expression_error("expression is nested too deeply");
        ++depth;
    }

    ~depth_guard() { --depth; }

private:
    size_t &depth;
};

/**
 * @brief 递归下降的表达式解析器
 * 优先级从低到高：or、and、not、比较、加减、乘除、一元负号、下标和调用
 */
struct expression_parser {
    expression_parser(const vector<token> &tokens, const expression_limits &limits)
        : tokens(tokens), limits(limits) {}

    node_ptr parse() {
        auto n = parse_or();
        if (peek().type != token_type::END)
            throw expression_error(fmt::format("unexpected '{}' at position {}", peek().text, peek().pos));
        return n;
    }

private:
    const token &peek(size_t offset = 0) const {
        return tokens[min(pos + offset, tokens.size() - 1)];
    }

    bool peek_op(const char *op) const {
        return peek().type == token_type::OP && peek().text == op;
    }

    bool peek_keyword(const char *keyword, size_t offset = 0) const {
        return peek(offset).type == token_type::NAME && peek(offset).text == keyword;
    }

    bool accept_op(const char *op) {
        if (!peek_op(op)) return false;
        ++pos;
        return true;
    }

    bool accept_keyword(const char *keyword) {
        if (!peek_keyword(keyword)) return false;
        ++pos;
        return true;
    }

    void expect_op(const char *op) {
        if (!accept_op(op))
            throw expression_error(fmt::format("expected '{}' at position {}", op, peek().pos));
    }

    node_ptr binary(node_type type, const string &name, node_ptr left, node_ptr right) {
        auto n = make_node(type);
        n->name = name;
        n->children.push_back(move(left));
        n->children.push_back(move(right));
        return n;
    }

    node_ptr parse_or() {
        depth_guard guard(depth, limits.max_depth);
        auto left = parse_and();
        while (accept_keyword("or") || accept_op("||"))
            left = binary(node_type::OR, "or", move(left), parse_and());
        return left;
    }

    node_ptr parse_and() {
        auto left = parse_not();
        while (accept_keyword("and") || accept_op("&&"))
            left = binary(node_type::AND, "and", move(left), parse_not());
        return left;
    }

    node_ptr parse_not() {
        if (accept_keyword("not") || accept_op("!")) {
            depth_guard guard(depth, limits.max_depth);
            auto n = make_node(node_type::NOT);
            n->children.push_back(parse_not());
            return n;
        }
        return parse_comparison();
    }

    node_ptr parse_comparison() {
        auto n = make_node(node_type::COMPARE);
        n->children.push_back(parse_additive());
        while (true) {
            string op;
            if (peek().type == token_type::OP &&
                (peek().text == "==" || peek().text == "!=" || peek().text == "<" ||
                 peek().text == "<=" || peek().text == ">" || peek().text == ">=")) {
                op = peek().text;
                ++pos;
            } else if (accept_keyword("in")) {
                op = "in";
            } else if (peek_keyword("not") && peek_keyword("in", 1)) {
                pos += 2;
                op = "not in";
            } else if (accept_keyword("is")) {
                op = accept_keyword("not") ? "!=" : "==";
            } else {
                break;
            }
            n->ops.push_back(op);
            n->children.push_back(parse_additive());
        }
        if (n->ops.empty()) return move(n->children[0]);
        return n;
    }

    node_ptr parse_additive() {
        auto left = parse_term();
        while (peek_op("+") || peek_op("-")) {
            string op = tokens[pos++].text;
            left = binary(node_type::BINARY, op, move(left), parse_term());
        }
        return left;
    }

    node_ptr parse_term() {
        auto left = parse_unary();
        while (peek_op("*") || peek_op("/") || peek_op("//") || peek_op("%")) {
            string op = tokens[pos++].text;
            left = binary(node_type::BINARY, op, move(left), parse_unary());
        }
        return left;
    }

    node_ptr parse_unary() {
        if (accept_op("-")) {
            depth_guard guard(depth, limits.max_depth);
            auto n = make_node(node_type::NEGATE);
            n->children.push_back(parse_unary());
            return n;
        }
        if (accept_op("+")) {
            depth_guard guard(depth, limits.max_depth);
            return parse_unary();
        }
        return parse_postfix();
    }

    void parse_arguments(node &call) {
        if (accept_op(")")) return;
        do {
            call.children.push_back(parse_or());
        } while (accept_op(","));
        expect_op(")");
    }

    node_ptr parse_postfix() {
        auto n = parse_primary();
        while (true) {
            if (accept_op("[")) {
                auto index = make_node(node_type::INDEX);
                index->children.push_back(move(n));
                index->children.push_back(parse_or());
                expect_op("]");
                n = move(index);
            } else if (accept_op(".")) {
                if (peek().type != token_type::NAME)
                    throw expression_error(fmt::format("expected attribute name at position {}", peek().pos));
                string attribute = tokens[pos++].text;
                if (accept_op("(")) {
                    auto method = make_node(node_type::METHOD);
                    method->name = attribute;
                    method->children.push_back(move(n));
                    parse_arguments(*method);
                    n = move(method);
                } else {
                    auto attr = make_node(node_type::ATTRIBUTE);
                    attr->name = attribute;
                    attr->children.push_back(move(n));
                    n = move(attr);
                }
            } else if (peek_op("(")) {
                if (n->type != node_type::NAME)
                    throw expression_error(fmt::format("only built-in functions can be called, at position {}", peek().pos));
                ++pos;
                auto call = make_node(node_type::CALL);
                call->name = n->name;
                parse_arguments(*call);
                n = move(call);
            } else {
                return n;
            }
        }
    }

    node_ptr parse_primary() {
        const token &t = peek();
        switch (t.type) {
            case token_type::NUMBER:
            case token_type::STRING: {
                auto n = make_node(node_type::LITERAL);
                n->value = t.value;
                ++pos;
                return n;
            }
            case token_type::NAME: {
                auto n = make_node(node_type::LITERAL);
                if (t.text == "True" || t.text == "true")
                    n->value = true;
                else if (t.text == "False" || t.text == "false")
                    n->value = false;
                else if (t.text == "None" || t.text == "null")
                    n->value = nullptr;
                else if (find(KEYWORDS.begin(), KEYWORDS.end(), t.text) != KEYWORDS.end())
                    throw expression_error(fmt::format("unexpected keyword '{}' at position {}", t.text, t.pos));
                else {
                    n->type = node_type::NAME;
                    n->name = t.text;
                }
                ++pos;
                return n;
            }
            case token_type::OP:
                if (accept_op("(")) {
                    auto n = parse_or();
                    expect_op(")");
                    return n;
                } else if (accept_op("[")) {
                    auto n = make_node(node_type::LIST);
                    if (accept_op("]")) return n;
                    do {
                        if (peek_op("]")) break;  // 允许末尾的逗号
                        n->children.push_back(parse_or());
                    } while (accept_op(","));
                    expect_op("]");
                    return n;
                }
                throw expression_error(fmt::format("unexpected '{}' at position {}", t.text, t.pos));
            case token_type::END:
            default:
                throw expression_error("unexpected end of expression");
        }
    }

    const vector<token> &tokens;
    const expression_limits &limits;
    size_t pos = 0;
    size_t depth = 0;
};

static string type_name(const json &v) {
    switch (v.type()) {
        case json::value_t::null: return "NoneType";
        case json::value_t::boolean: return "bool";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned: return "int";
        case json::value_t::number_float: return "float";
        case json::value_t::string: return "str";
        case json::value_t::array: return "list";
        case json::value_t::object: return "dict";
        default: return "object";
    }
}

bool is_truthy(const json &v) {
    switch (v.type()) {
        case json::value_t::null: return false;
        case json::value_t::boolean: return v.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned: return v.get<int64_t>() != 0;
        case json::value_t::number_float: return v.get<double>() != 0;
        case json::value_t::string: return !v.get_ref<const string &>().empty();
        case json::value_t::array:
        case json::value_t::object: return !v.empty();
        default: return true;
    }
}

static bool is_numeric(const json &v) {
    return v.is_number() || v.is_boolean();
}

// 超出 int64 范围的无符号整数按浮点数处理
static bool is_integral(const json &v) {
    if (v.is_number_unsigned()) return v.get<uint64_t>() <= (uint64_t)INT64_MAX;
    return v.is_number_integer() || v.is_boolean();
}

static int64_t as_int(const json &v) {
    if (v.is_boolean()) return v.get<bool>() ? 1 : 0;
    return v.get<int64_t>();
}

static double as_double(const json &v) {
    if (v.is_boolean()) return v.get<bool>() ? 1 : 0;
    return v.get<double>();
}

static string to_str(const json &v) {
    if (v.is_string()) return v.get<string>();
    if (v.is_boolean()) return v.get<bool>() ? "True" : "False";
    if (v.is_null()) return "None";
    return dump_text(v);
}

static bool values_equal(const json &a, const json &b) {
    if (is_numeric(a) && is_numeric(b)) {
        if (is_integral(a) && is_integral(b)) return as_int(a) == as_int(b);
        return as_double(a) == as_double(b);
    }
    if (a.is_array() && b.is_array()) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i)
            if (!values_equal(a[i], b[i])) return false;
        return true;
    }
    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !values_equal(it.value(), *other)) return false;
        }
        return true;
    }
    return a == b;
}

/**
 * @return a 小于、等于、大于 b 时分别返回负数、0、正数
 */
static int compare_values(const json &a, const json &b, const string &op) {
    if (is_numeric(a) && is_numeric(b)) {
        if (is_integral(a) && is_integral(b)) {
            int64_t x = as_int(a), y = as_int(b);
            return x < y ? -1 : x > y ? 1 : 0;
        }
        double x = as_double(a), y = as_double(b);
        return x < y ? -1 : x > y ? 1 : 0;
    }
    if (a.is_string() && b.is_string())
        return a.get_ref<const string &>().compare(b.get_ref<const string &>());
    if (a.is_array() && b.is_array()) {
        for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
            int r = compare_values(a[i], b[i], op);
            if (r != 0) return r;
        }
        return a.size() < b.size() ? -1 : a.size() > b.size() ? 1 : 0;
    }
    throw expression_error(fmt::format("'{}' not supported between instances of '{}' and '{}'", op, type_name(a), type_name(b)));
}

static bool contains(const json &container, const json &item) {
    if (container.is_string()) {
        if (!item.is_string())
            throw expression_error(fmt::format("'in <string>' requires string as left operand, not {}", type_name(item)));
        return container.get_ref<const string &>().find(item.get_ref<const string &>()) != string::npos;
    }
    if (container.is_array()) {
        for (auto &element : container)
            if (values_equal(element, item)) return true;
        return false;
    }
    if (container.is_object()) {
        if (!item.is_string()) return false;
        return container.count(item.get<string>()) > 0;
    }
    throw expression_error(fmt::format("argument of type '{}' is not iterable", type_name(container)));
}

/**
 * @brief 统计值包含的 JSON 节点数，超过 cap 后不再继续统计
 */
static size_t count_nodes(const json &v, size_t cap) {
    size_t total = 1;
    if (v.is_array() || v.is_object()) {
        for (auto &element : v) {
            if (total > cap) break;
            total += count_nodes(element, cap - total);
        }
    }
    return total;
}

/**
 * @param max_nodes 结果最多包含的节点数
 */
static json repeat(const json &sequence, int64_t times, size_t max_nodes) {
    times = max<int64_t>(times, 0);
    if (sequence.is_string()) {
        size_t unit = sequence.get_ref<const string &>().size();
        if (unit > 0 && (size_t)times > MAX_VALUE_SIZE / unit)
            throw expression_error("repetition result is too large");
    } else {
        // 嵌套列表的每个元素都会被复制，按元素的节点数计算结果大小
        size_t unit = count_nodes(sequence, max_nodes + 1) - 1;
        if (unit > 0 && (size_t)times > max_nodes / unit)
            throw expression_error("repetition result is too large");
    }
    if (sequence.is_string()) {
        string result;
        for (int64_t i = 0; i < times; ++i) result += sequence.get_ref<const string &>();
        return result;
    }
    json result = json::array();
    for (int64_t i = 0; i < times; ++i)
        for (auto &element : sequence) result.push_back(element);
    return result;
}

/**
 * @brief 整数加减乘，溢出时结果退化为浮点数
 * Python 的整数没有范围限制，溢出的结果不能回绕
 */
static json integer_arithmetic(const string &op, int64_t x, int64_t y) {
    int64_t r;
    bool overflow;
    if (op == "+")
        overflow = __builtin_add_overflow(x, y, &r);
    else if (op == "-")
        overflow = __builtin_sub_overflow(x, y, &r);
    else
        overflow = __builtin_mul_overflow(x, y, &r);
    if (!overflow) return r;
    double a = (double)x, b = (double)y;
    if (op == "+") return a + b;
    if (op == "-") return a - b;
    return a * b;
}

/**
 * @brief 浮点数转换为整数，超出 int64 范围时保留浮点数
 */
static json float_to_integer(double d) {
    if (!isfinite(d)) throw expression_error("cannot convert float infinity or NaN to integer");
    if (d >= -9223372036854775808.0 && d < 9223372036854775808.0) return (int64_t)d;
    return d;
}

/**
 * @param max_nodes 列表运算的结果最多包含的节点数
 */
static json arithmetic(const string &op, const json &a, const json &b, size_t max_nodes) {
    if (op == "+") {
        if (a.is_string() && b.is_string()) {
            if (a.get_ref<const string &>().size() + b.get_ref<const string &>().size() > MAX_VALUE_SIZE)
                throw expression_error("concatenation result is too large");
            return a.get<string>() + b.get<string>();
        }
        if (a.is_array() && b.is_array()) {
            if (count_nodes(a, max_nodes + 1) + count_nodes(b, max_nodes + 1) > max_nodes + 1)
                throw expression_error("concatenation result is too large");
            json result = a;
            for (auto &element : b) result.push_back(element);
            return result;
        }
    }
    if (op == "*") {
        if ((a.is_string() || a.is_array()) && is_integral(b)) return repeat(a, as_int(b), max_nodes);
        if ((b.is_string() || b.is_array()) && is_integral(a)) return repeat(b, as_int(a), max_nodes);
    }
    if (!is_numeric(a) || !is_numeric(b))
        throw expression_error(fmt::format("unsupported operand type(s) for {}: '{}' and '{}'", op, type_name(a), type_name(b)));

    bool integral = is_integral(a) && is_integral(b);
    if (op == "+" || op == "-" || op == "*") {
        if (integral) return integer_arithmetic(op, as_int(a), as_int(b));
        double x = as_double(a), y = as_double(b);
        return op == "+" ? x + y : op == "-" ? x - y : x * y;
    }
    if (op == "/") {
        if (as_double(b) == 0) throw expression_error("division by zero");
        return as_double(a) / as_double(b);
    }

    // "//" 和 "%" 与 Python 一样向负无穷取整，余数的符号与除数相同
    if (integral) {
        int64_t x = as_int(a), y = as_int(b);
        if (y == 0) throw expression_error("integer division or modulo by zero");
        if (x == INT64_MIN && y == -1) return op == "//" ? json(-(double)x) : json(0);
        int64_t q = x / y, r = x % y;
        if (r != 0 && ((r < 0) != (y < 0))) --q, r += y;
        return op == "//" ? q : r;
    } else {
        double x = as_double(a), y = as_double(b);
        if (y == 0) throw expression_error("float division or modulo by zero");
        if (op == "//") return floor(x / y);
        double r = fmod(x, y);
        if (r != 0 && ((r < 0) != (y < 0))) r += y;
        return r;
    }
}

static void expect_arguments(const string &name, const vector<json> &args, size_t min_count, size_t max_count) {
    if (args.size() < min_count || args.size() > max_count) {
        if (min_count == max_count)
            throw expression_error(fmt::format("{}() takes {} argument(s) ({} given)", name, min_count, args.size()));
        throw expression_error(fmt::format("{}() takes {} to {} arguments ({} given)", name, min_count, max_count, args.size()));
    }
}

static const json &expect_list(const string &name, const json &v) {
    if (!v.is_array()) throw expression_error(fmt::format("{}() argument must be a list, not '{}'", name, type_name(v)));
    return v;
}

static json call_builtin(const string &name, const vector<json> &args, size_t max_nodes) {
    if (name == "len") {
        expect_arguments(name, args, 1, 1);
        const json &v = args[0];
        if (v.is_string()) return v.get_ref<const string &>().size();
        if (v.is_array() || v.is_object()) return v.size();
        throw expression_error(fmt::format("object of type '{}' has no len()", type_name(v)));
    } else if (name == "abs") {
        expect_arguments(name, args, 1, 1);
        if (is_integral(args[0])) {
            int64_t x = as_int(args[0]);
            if (x == INT64_MIN) return -(double)x;
            return x < 0 ? -x : x;
        }
        if (is_numeric(args[0])) return fabs(as_double(args[0]));
        throw expression_error(fmt::format("bad operand type for abs(): '{}'", type_name(args[0])));
    } else if (name == "min" || name == "max") {
        if (args.empty()) throw expression_error(name + "() expected at least 1 argument");
        json items = args.size() == 1 ? expect_list(name, args[0]) : json(args);
        if (items.empty()) throw expression_error(name + "() arg is an empty sequence");
        json best = items[0];
        for (size_t i = 1; i < items.size(); ++i) {
            int r = compare_values(items[i], best, "<");
            if ((name == "min" && r < 0) || (name == "max" && r > 0)) best = items[i];
        }
        return best;
    } else if (name == "sum") {
        expect_arguments(name, args, 1, 2);
        json total = args.size() > 1 ? args[1] : json(0);
        for (auto &element : expect_list(name, args[0])) total = arithmetic("+", total, element, max_nodes);
        return total;
    } else if (name == "str") {
        expect_arguments(name, args, 0, 1);
        return args.empty() ? "" : to_str(args[0]);
    } else if (name == "int") {
        expect_arguments(name, args, 0, 1);
        if (args.empty()) return 0;
        const json &v = args[0];
        if (is_integral(v)) return as_int(v);
        if (v.is_number()) return float_to_integer(trunc(as_double(v)));
        if (v.is_string()) {
            try {
                return boost::lexical_cast<int64_t>(boost::algorithm::trim_copy(v.get<string>()));
            } catch (boost::bad_lexical_cast &) {
                throw expression_error(fmt::format("invalid literal for int(): '{}'", v.get<string>()));
            }
        }
        throw expression_error(fmt::format("int() argument must be a string or a number, not '{}'", type_name(v)));
    } else if (name == "float") {
        expect_arguments(name, args, 0, 1);
        if (args.empty()) return 0.0;
        const json &v = args[0];
        if (is_numeric(v)) return as_double(v);
        if (v.is_string()) {
            try {
                return boost::lexical_cast<double>(boost::algorithm::trim_copy(v.get<string>()));
            } catch (boost::bad_lexical_cast &) {
                throw expression_error(fmt::format("could not convert string to float: '{}'", v.get<string>()));
            }
        }
        throw expression_error(fmt::format("float() argument must be a string or a number, not '{}'", type_name(v)));
    } else if (name == "round") {
        expect_arguments(name, args, 1, 2);
        if (!is_numeric(args[0])) throw expression_error(fmt::format("type {} doesn't define __round__", type_name(args[0])));
        if (is_integral(args[0]) && args.size() == 1) return as_int(args[0]);
        double x = as_double(args[0]);
        if (args.size() == 1) return float_to_integer(nearbyint(x));
        if (!is_integral(args[1])) throw expression_error("round() ndigits must be an integer");
        double scale = pow(10.0, (double)as_int(args[1]));
        return nearbyint(x * scale) / scale;
    } else if (name == "bool") {
        expect_arguments(name, args, 0, 1);
        return !args.empty() && is_truthy(args[0]);
    } else if (name == "sorted") {
        expect_arguments(name, args, 1, 1);
        vector<json> items;
        for (auto &element : expect_list(name, args[0])) items.push_back(element);
        stable_sort(items.begin(), items.end(), [](const json &a, const json &b) { return compare_values(a, b, "<") < 0; });
        return items;
    } else if (name == "any" || name == "all") {
        expect_arguments(name, args, 1, 1);
        for (auto &element : expect_list(name, args[0])) {
            bool truth = is_truthy(element);
            if (name == "any" && truth) return true;
            if (name == "all" && !truth) return false;
        }
        return name == "all";
    }
    throw expression_error(fmt::format("name '{}' is not a built-in function", name));
}

static const string &expect_string_argument(const string &method, const json &v) {
    if (!v.is_string()) throw expression_error(fmt::format("{}() argument must be str, not '{}'", method, type_name(v)));
    return v.get_ref<const string &>();
}

static json call_string_method(const string &s, const string &name, const vector<json> &args) {
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        expect_arguments(name, args, 0, 0);
        if (name == "strip") return boost::algorithm::trim_copy(s);
        if (name == "lstrip") return boost::algorithm::trim_left_copy(s);
        return boost::algorithm::trim_right_copy(s);
    } else if (name == "lower") {
        expect_arguments(name, args, 0, 0);
        return boost::algorithm::to_lower_copy(s);
    } else if (name == "upper") {
        expect_arguments(name, args, 0, 0);
        return boost::algorithm::to_upper_copy(s);
    } else if (name == "startswith") {
        expect_arguments(name, args, 1, 1);
        return boost::algorithm::starts_with(s, expect_string_argument(name, args[0]));
    } else if (name == "endswith") {
        expect_arguments(name, args, 1, 1);
        return boost::algorithm::ends_with(s, expect_string_argument(name, args[0]));
    } else if (name == "split") {
        expect_arguments(name, args, 0, 1);
        vector<string> parts;
        if (args.empty() || args[0].is_null()) {
            string trimmed = boost::algorithm::trim_copy(s);
            if (!trimmed.empty())
                boost::algorithm::split(parts, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
        } else {
            const string &sep = expect_string_argument(name, args[0]);
            if (sep.empty()) throw expression_error("empty separator");
            size_t start = 0, found;
            while ((found = s.find(sep, start)) != string::npos) {
                parts.push_back(s.substr(start, found - start));
                start = found + sep.size();
            }
            parts.push_back(s.substr(start));
        }
        return parts;
    } else if (name == "replace") {
        expect_arguments(name, args, 2, 2);
        return boost::algorithm::replace_all_copy(s, expect_string_argument(name, args[0]), expect_string_argument(name, args[1]));
    } else if (name == "count") {
        expect_arguments(name, args, 1, 1);
        const string &needle = expect_string_argument(name, args[0]);
        if (needle.empty()) return s.size() + 1;
        size_t count = 0;
        for (size_t p = s.find(needle); p != string::npos; p = s.find(needle, p + needle.size())) ++count;
        return count;
    }
    throw expression_error(fmt::format("'str' object has no attribute '{}'", name));
}

static json call_method(const json &target, const string &name, const vector<json> &args) {
    if (target.is_string()) return call_string_method(target.get_ref<const string &>(), name, args);

    if (target.is_object()) {
        if (name == "get") {
            expect_arguments(name, args, 1, 2);
            if (args[0].is_string()) {
                auto it = target.find(args[0].get<string>());
                if (it != target.end()) return *it;
            }
            return args.size() > 1 ? args[1] : json(nullptr);
        } else if (name == "keys" || name == "values") {
            expect_arguments(name, args, 0, 0);
            json result = json::array();
            for (auto it = target.begin(); it != target.end(); ++it)
                result.push_back(name == "keys" ? json(it.key()) : it.value());
            return result;
        }
    }

    if (target.is_array()) {
        if (name == "count") {
            expect_arguments(name, args, 1, 1);
            size_t count = 0;
            for (auto &element : target)
                if (values_equal(element, args[0])) ++count;
            return count;
        } else if (name == "index") {
            expect_arguments(name, args, 1, 1);
            for (size_t i = 0; i < target.size(); ++i)
                if (values_equal(target[i], args[0])) return i;
            throw expression_error("value is not in list");
        }
    }

    throw expression_error(fmt::format("'{}' object has no attribute '{}'", type_name(target), name));
}

static json subscript(const json &target, const json &key) {
    if (target.is_array() || target.is_string()) {
        if (!is_integral(key))
            throw expression_error(fmt::format("{} indices must be integers, not '{}'", type_name(target), type_name(key)));
        int64_t size = target.is_string() ? target.get_ref<const string &>().size() : target.size();
        int64_t index = as_int(key);
        if (index < 0) index += size;
        if (index < 0 || index >= size)
            throw expression_error(fmt::format("{} index out of range", type_name(target)));
        if (target.is_string()) return string(1, target.get_ref<const string &>()[index]);
        return target.at((size_t)index);
    }
    if (target.is_object()) {
        if (!key.is_string()) throw expression_error(fmt::format("key {} not found", dump_text(key)));
        auto it = target.find(key.get<string>());
        if (it == target.end()) throw expression_error(fmt::format("key '{}' not found", key.get<string>()));
        return *it;
    }
    throw expression_error(fmt::format("'{}' object is not subscriptable", type_name(target)));
}

/**
 * @brief 对语法树求值，每访问一个节点消耗一步
 */
struct expression_evaluator {
    expression_evaluator(const json &context, const expression_limits &limits)
        : context(context), limits(limits) {}

    json eval(const node &n) {
        if (++steps > limits.max_steps) throw expression_error("expression exceeded the evaluation step budget");

        switch (n.type) {
            case node_type::LITERAL:
                return n.value;
            case node_type::NAME: {
                auto it = context.find(n.name);
                if (it == context.end()) throw expression_error(fmt::format("name '{}' is not defined", n.name));
                return *it;
            }
            case node_type::LIST: {
                json result = json::array();
                for (auto &child : n.children) result.push_back(eval(*child));
                return charge(move(result));
            }
            case node_type::NEGATE: {
                json v = eval(*n.children[0]);
                if (is_integral(v)) {
                    int64_t x = as_int(v);
                    if (x == INT64_MIN) return -(double)x;
                    return -x;
                }
                if (is_numeric(v)) return -as_double(v);
                throw expression_error(fmt::format("bad operand type for unary -: '{}'", type_name(v)));
            }
            case node_type::NOT:
                return !is_truthy(eval(*n.children[0]));
            case node_type::AND: {
                json left = eval(*n.children[0]);
                if (!is_truthy(left)) return left;
                return eval(*n.children[1]);
            }
            case node_type::OR: {
                json left = eval(*n.children[0]);
                if (is_truthy(left)) return left;
                return eval(*n.children[1]);
            }
            case node_type::BINARY: {
                json left = eval(*n.children[0]);
                json right = eval(*n.children[1]);
                return charge(arithmetic(n.name, left, right, remaining()));
            }
            case node_type::COMPARE: {
                json left = eval(*n.children[0]);
                for (size_t i = 0; i < n.ops.size(); ++i) {
                    json right = eval(*n.children[i + 1]);
                    if (!compare(n.ops[i], left, right)) return false;
                    left = move(right);
                }
                return true;
            }
            case node_type::INDEX:
                return subscript(eval(*n.children[0]), eval(*n.children[1]));
            case node_type::ATTRIBUTE: {
                json target = eval(*n.children[0]);
                if (target.is_object()) {
                    auto it = target.find(n.name);
                    if (it != target.end()) return *it;
                }
                throw expression_error(fmt::format("'{}' object has no attribute '{}'", type_name(target), n.name));
            }
            case node_type::CALL: {
                auto args = eval_arguments(n, 0);
                return charge(call_builtin(n.name, args, remaining()));
            }
            case node_type::METHOD: {
                json target = eval(*n.children[0]);
                return charge(call_method(target, n.name, eval_arguments(n, 1)));
            }
        }
        throw expression_error("unknown expression node");
    }

private:
    size_t remaining() const {
        return steps < limits.max_steps ? limits.max_steps - steps : 0;
    }

    /**
     * @brief 新构造的值按节点数消耗步数，避免条件表达式构造出巨大的列表
     */
    json charge(json value) {
        steps += count_nodes(value, remaining() + 1) - 1;
        if (steps > limits.max_steps) throw expression_error("expression exceeded the evaluation step budget");
        return value;
    }

    vector<json> eval_arguments(const node &n, size_t first) {
        vector<json> args;
        for (size_t i = first; i < n.children.size(); ++i) args.push_back(eval(*n.children[i]));
        return args;
    }

    static bool compare(const string &op, const json &a, const json &b) {
        if (op == "==") return values_equal(a, b);
        if (op == "!=") return !values_equal(a, b);
        if (op == "in") return contains(b, a);
        if (op == "not in") return !contains(b, a);
        int r = compare_values(a, b, op);
        if (op == "<") return r < 0;
        if (op == "<=") return r <= 0;
        if (op == ">") return r > 0;
        return r >= 0;
    }

    const json &context;
    const expression_limits &limits;
    size_t steps = 0;
};

json evaluate_expression(const string &source, const json &context, const expression_limits &limits) {
    if (source.size() > limits.max_length)
        throw expression_error(fmt::format("expression is longer than {} characters", limits.max_length));
    if (!context.is_object())
        throw expression_error("expression context must be an object");

    auto tokens = tokenize(source);
    expression_parser parser(tokens, limits);
    node_ptr root = parser.parse();
    expression_evaluator evaluator(context, limits);
    return evaluator.eval(*root);
}

}  // namespace tci
