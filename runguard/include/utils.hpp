#pragma once

#include <string>
#include <vector>

/**
 * @brief 字符串是否全部由数字组成
 */
bool is_number(const std::string &s);

/**
 * @brief 把逗号分隔的列表拆开，忽略空项
 */
std::vector<std::string> split_list(const std::string &s);
