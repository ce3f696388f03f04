#pragma once

#include <string>

namespace tci {

/**
 * @brief 将任意字节编码为 base64 字符串，带 '=' 填充
 */
std::string base64_encode(const std::string &bytes);

/**
 * @brief 解码 base64 字符串，忽略空白字符
 * @throw invalid_argument_error 包含非 base64 字符或者长度不合法
 */
std::string base64_decode(const std::string &text);

}  // namespace tci
