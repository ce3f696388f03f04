#pragma once

#include <filesystem>
#include <string>

namespace tci {

/**
 * @brief 存放语言运行时镜像的路径，为项目根目录下的 exec 文件夹
 * @defaultValue 假设程序运行在项目根目录下的 bin 文件夹，因此 exec 文件夹在 ../exec
 *
 * EXEC_DIR
 * └── run // 各语言的运行时镜像，沙箱预热时复制到沙箱根目录
 *     ├── python3
 *     │   ├── run // 入口脚本，参数为代码文件和结果文件的路径
 *     │   └── harness.py // 执行代码并导出最后的表达式值和变量
 *     └── javascript
 *         ├── run
 *         └── harness.js
 */
extern std::filesystem::path EXEC_DIR;

/**
 * @brief 沙箱实例的根目录
 * 每个沙箱实例在这里拥有一个以实例编号命名的文件夹，沙箱销毁时文件夹被删除。
 * 若将这个文件夹放进内存盘，可以加速用户代码的 IO 性能。
 *
 * SANDBOX_DIR
 * ├── 2b7c...e1 // 沙箱实例编号
 * │   ├── image // 语言运行时镜像
 * │   ├── work // 用户代码的工作目录，存放会话的虚拟文件
 * │   ├── output // 运行时写入结果的目录
 * │   │   └── result.json // 最后的表达式值和变量
 * │   ├── program.code // 本次执行的代码
 * │   ├── program.meta // runguard 的运行信息
 * │   ├── program.out // 用户代码的 stdout 输出
 * │   └── program.err // 用户代码的 stderr 输出
 * └── ...
 */
extern std::filesystem::path SANDBOX_DIR;

/**
 * @brief runguard 可执行文件的路径
 */
extern std::filesystem::path RUNGUARD;

/**
 * @brief 运行用户代码的用户名和用户组，为空时由 runguard 决定
 */
extern std::string RUN_USER;

extern std::string RUN_GROUP;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，执行引擎将不再检查程序是否在特权模式下执行，
 * 并且不会删除销毁的沙箱目录，以便手动检查产生的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace tci
