#pragma once

#include <Python.h>
#include <boost/python.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "validator/validator.hpp"

namespace executor {

/**
 * @brief 初始化内嵌的 Python 解释器，并注册 executor 模块
 * 必须在 Py_Initialize 之前调用的步骤也在这里完成。
 * 返回时当前线程持有 GIL。
 */
void initialize_python(const char *program_name);

/**
 * @brief 验证脚本抛出的 executor.JobFailure 异常类型
 */
PyObject *job_failure_type();

/**
 * @brief 为工作路径中的验证脚本生成一个从未使用过的模块名
 * 同一个路径每次加载都会得到新的版本号，因此不会复用上一次加载的模块。
 */
std::string next_module_name(const std::filesystem::path &dir);

/**
 * @brief 加载自 validator.py 的验证逻辑
 * 析构时从 sys.modules 中移除工作路径下的所有模块。
 */
struct python_validator : validator {
    python_validator(const std::filesystem::path &dir, const std::string &module_name, boost::python::object module);
    ~python_validator() override;

    /**
     * @brief 调用验证脚本中的 validate(job)
     */
    void validate(job &j) override;

private:
    std::filesystem::path dir;
    std::string module_name;
    // 析构时需要在持有 GIL 的情况下释放
    std::optional<boost::python::object> module;
};

/**
 * @brief 从工作路径中的 validator.py 加载验证逻辑
 */
struct python_validator_loader : validator_loader {
    /**
     * @throw validator_error validator.py 不存在或者执行失败
     * @throw job_failure 验证脚本在加载时就抛出了 JobFailure
     */
    std::unique_ptr<validator> load(const std::filesystem::path &dir) override;
};

}  // namespace executor
