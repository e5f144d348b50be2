#pragma once

#include <sys/types.h>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include "config.hpp"
#include "validator/validator.hpp"

namespace executor::test {

/**
 * @brief 用 C++ 函数代替 validator.py 的验证逻辑
 */
struct lambda_validator_loader : public validator_loader {
    explicit lambda_validator_loader(std::function<void(job &)> action);

    std::unique_ptr<validator> load(const std::filesystem::path &dir) override;

    /**
     * @brief load 被调用的次数
     */
    int loads = 0;

private:
    std::function<void(job &)> action;
};

/**
 * @brief 加载时就失败的验证逻辑
 */
struct broken_validator_loader : public validator_loader {
    std::unique_ptr<validator> load(const std::filesystem::path &dir) override;
};

/**
 * @brief 测试用的临时工作路径，析构时删除
 */
struct working_directory {
    std::filesystem::path path;

    working_directory();
    ~working_directory();

    /**
     * @brief 在工作路径中创建文件
     */
    void write(const std::string &name, const std::string &content, bool executable = false) const;
};

/**
 * @brief 进程是否仍在运行，僵尸进程视为已经结束
 */
bool process_alive(pid_t pid);

/**
 * @brief 最多等待 5 秒直到进程结束
 * @return 进程是否已经结束
 */
bool wait_process_gone(pid_t pid);

/**
 * @brief 测试使用的执行机配置
 */
executor_config test_config(int timeout = 5);

}  // namespace executor::test
