#pragma once

#include <string>
#include <vector>

namespace executor {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 将命令行拼接成便于阅读的字符串，只用于日志和给助教的信息
 */
std::string join_command(const std::vector<std::string> &argv);

}  // namespace executor
