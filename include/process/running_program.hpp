#pragma once

#include <memory>
#include <optional>
#include <string>
#include "process/interactive_process.hpp"

namespace executor {

/**
 * @brief 验证脚本使用的交互程序
 * 所有等待操作要么返回匹配结果，要么抛出携带 failure 的 job_failure。
 * 超时参数以秒为单位，-1 表示使用任务的超时时间。
 */
struct running_program {
    /**
     * @param process 已经启动的程序
     * @param default_timeout 超时参数为 -1 时使用的时间（秒）
     */
    running_program(std::unique_ptr<interactive_process> process, int default_timeout);

    /**
     * @brief 等待程序输出匹配正则表达式的内容
     * @param pattern ECMAScript 正则表达式
     * @return 匹配到的文本
     * @throw job_failure 超时、程序提前结束
     */
    std::string expect(const std::string &pattern, int timeout = -1);

    /**
     * @brief 等待程序输出指定的文本
     */
    std::string expect_exact(const std::string &text, int timeout = -1);

    /**
     * @brief 向程序的标准输入写入文本
     * @throw job_failure 程序已经不再读取输入
     */
    void send(const std::string &text);

    /**
     * @brief 写入文本和换行符
     */
    void sendline(const std::string &text);

    /**
     * @brief 等待程序结束
     * @return 程序的返回值，被信号终止时为 nullopt
     * @throw job_failure 超时
     */
    std::optional<int> expect_end(int timeout = -1);

    /**
     * @brief 等待程序结束并检查返回值
     * @throw job_failure 超时或者返回值不是 expected
     */
    void expect_exit_status(int expected, int timeout = -1);

    /**
     * @brief 终止程序所在的进程组
     */
    void kill();

    std::optional<int> exit_status() const;

    /**
     * @brief 上一次匹配之前的输出
     */
    const std::string &before() const;

    /**
     * @brief 上一次匹配到的文本
     */
    const std::string &matched() const;

    /**
     * @brief 程序启动以来的全部输出
     */
    std::string output() const;

private:
    std::string wait_for(const output_matcher &matcher, int timeout, const std::string &description);

    int effective_timeout(int timeout) const;

    std::unique_ptr<interactive_process> process;
    int default_timeout;
    std::string last_before, last_matched;
};

}  // namespace executor
