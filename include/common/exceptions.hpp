#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include "failure.hpp"

namespace executor {

struct executor_exception : std::exception {
    executor_exception();
    explicit executor_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const executor_exception &ex);

    template <typename T>
    executor_exception operator<<(const T &t) const {
        return executor_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行机自身的内部错误
 * 比如验证脚本不存在、工作目录无法读取
 */
struct internal_error : public executor_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public executor_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 验证脚本抛出了执行机无法识别的异常
 * message 为脚本异常的文本（比如 Python 的 str(exception)）
 */
struct validator_error : public executor_exception {
    explicit validator_error(const std::string &message);
};

/**
 * @brief 携带已经分类好的失败信息的异常
 * 在失败发生的地方构造 failure，经由验证脚本传递到 job::run_validate，
 * 顶层不需要再根据异常类型判断失败原因。
 */
struct job_failure : public executor_exception {
    explicit job_failure(const failure &info);

    const failure &info() const noexcept;

private:
    failure failure_info;
};

}  // namespace executor
