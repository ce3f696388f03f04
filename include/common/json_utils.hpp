#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

/**
 * @brief 按 keys 逐层访问 j，任何一层不存在时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, const Keys &... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, const Keys &... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

/**
 * @brief 序列化 j，字符串中不合法的 UTF-8 字节替换为 U+FFFD，不会抛出异常
 * 用户程序的输出是任意字节，直接 dump 会抛出 type_error
 */
inline std::string dump_text(const json &j, int indent = -1) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

/**
 * @brief 将任意字节转换为合法的 UTF-8 文本，不合法的字节序列替换为 U+FFFD
 */
inline std::string to_utf8_text(const std::string &bytes) {
    return json::parse(dump_text(json(bytes))).get<std::string>();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, const Keys &... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + dump_text(j, 2);
    return std::invalid_argument(msg);
}

template <typename T, typename... Keys>
T get_value(const json &j, const Keys &... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref) throw build_invalid_argument(j, keys...);
    try {
        return ref->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, const Keys &... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (json::exception &e) {
        return def_value;
    }
}

/**
 * @brief 若 keys 指向的值存在，赋值给 value，否则 value 保持不变
 * @throw std::invalid_argument 值存在但类型不匹配时
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, const Keys &... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return;
    try {
        value = ref->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
