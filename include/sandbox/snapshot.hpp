#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tci {

/**
 * @brief 工作目录中一个文件的指纹
 */
struct file_stamp {
    uintmax_t size = 0;
    size_t hash = 0;
};

/**
 * @brief 工作目录的快照，键为相对路径
 */
typedef std::map<std::string, file_stamp> directory_snapshot;

/**
 * @brief 工作目录在一次执行前后的变化
 */
struct directory_delta {
    /**
     * @brief 新建或修改的文件
     */
    std::vector<std::string> changed;

    std::vector<std::string> deleted;
};

/**
 * @brief 记录目录下所有普通文件的指纹
 * 符号链接和特殊文件会被忽略，以免用户代码通过符号链接把沙箱外的文件带出来。
 */
directory_snapshot take_snapshot(const std::filesystem::path &dir);

directory_delta diff_snapshot(const directory_snapshot &before, const directory_snapshot &after);

}  // namespace tci
