#pragma once

#include <filesystem>
#include <string>

namespace tci {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容（按字节读取，没有指定编码）
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 * @return 文件的内容
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 读取文件的前 limit 个字节
 * @param truncated 若文件比 limit 长，设为真
 */
std::string read_file_prefix(const std::filesystem::path &path, size_t limit, bool &truncated);

/**
 * @brief 将内容写入文件，必要时创建上层目录
 * @throw std::system_error 写入失败时
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击。会话文件会被写入沙箱的工作
 * 目录中，如果拿到的文件名是绝对路径或者包含 ".." 的部分，那么最后有可能
 * 覆盖沙箱外的文件。
 * @param subpath 被检查的文件名
 * @return 规范化后的相对路径
 * @throw invalid_argument_error subpath 不安全时
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 清空目录下的所有内容，保留目录本身
 */
void clear_directory(const std::filesystem::path &dir);

}  // namespace tci
