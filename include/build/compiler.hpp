#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "process/result.hpp"

namespace executor {

/**
 * @brief 编译器的调用方式
 * command 中的 {output} 会被替换为输出文件名，{inputs} 会被展开为所有源文件。
 */
struct compiler_profile {
    /**
     * @brief 编译器的名字，用于配置文件和日志
     */
    std::string name;

    std::vector<std::string> command;

    /**
     * @brief 没有指定源文件时，工作路径中具有这些扩展名的文件会被编译
     */
    std::vector<std::string> extensions;
};

extern const compiler_profile GCC;
extern const compiler_profile GPP;

/**
 * @brief 根据名字查找编译器
 * @param name "gcc" 或 "g++"
 * @throw std::invalid_argument 不支持的编译器
 */
const compiler_profile &find_compiler(const std::string &name);

/**
 * @brief 找到工作路径中所有可以被该编译器编译的源文件，按文件名排序
 */
std::vector<std::string> collect_sources(const compiler_profile &profile, const std::filesystem::path &dir);

/**
 * @brief 生成编译命令
 * @param inputs 源文件，为空时使用 collect_sources 的结果
 * @param output 输出文件，为空时为 a.out
 */
std::vector<std::string> compiler_command(const compiler_profile &profile, const std::filesystem::path &dir,
                                          const std::vector<std::string> &inputs, const std::string &output);

/**
 * @brief 在工作路径中编译程序
 */
result call_compiler(const compiler_profile &profile, const std::filesystem::path &dir,
                     const std::vector<std::string> &inputs, const std::string &output, int timeout);

/**
 * @brief 在工作路径中执行 make
 */
result call_make(const std::filesystem::path &dir, int timeout);

}  // namespace executor
