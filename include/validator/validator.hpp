#pragma once

#include <filesystem>
#include <memory>

namespace executor {

struct job;

/**
 * @brief 一次加载得到的验证逻辑
 * 验证逻辑通过 job 的接口编译、运行学生程序，并在失败时抛出异常。
 */
struct validator {
    virtual ~validator();

    /**
     * @brief 对任务执行验证
     * @throw job_failure 学生程序或工具的失败
     * @throw validator_error 验证逻辑本身的错误
     */
    virtual void validate(job &j) = 0;
};

/**
 * @brief 加载工作路径中的验证逻辑
 * 每次调用 load 都必须重新加载，不能复用之前加载的结果，
 * 因为同一个路径中的验证脚本可能已经被替换。
 */
struct validator_loader {
    virtual ~validator_loader();

    /**
     * @brief 加载验证逻辑
     * @param dir 任务的工作路径
     * @throw validator_error 验证逻辑不存在或者无法加载
     */
    virtual std::unique_ptr<validator> load(const std::filesystem::path &dir) = 0;
};

}  // namespace executor
