#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace executor {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将程序输出转换为合法的 UTF-8 文本
 * 学生程序可能输出任意字节，而这些输出最终要交给 Python 验证脚本和服务器，
 * 非法的字节序列会被替换为 U+FFFD。
 */
std::string decode_output(const std::string &bytes);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 服务器下发的文件名会被用来拼接工作目录下的路径，如果文件名包含 "../"
 * 或者是绝对路径，就可能覆盖工作目录外的文件。
 * @param subpath 被检查的文件名
 * @throw std::runtime_error subpath 不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 列出文件夹内的所有文件名（不递归）
 */
std::vector<std::string> list_directory(const std::filesystem::path &dir);

/**
 * @brief 判断文件是否是 ELF 可执行文件
 */
bool is_elf_binary(const std::filesystem::path &path);

}  // namespace executor
