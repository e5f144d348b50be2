#pragma once

#include <optional>
#include <string>

namespace executor {

struct result;

/**
 * @brief 失败的种类
 */
enum class failure_kind {
    /**
     * @brief 验证全部通过，不是失败
     */
    NONE,

    /**
     * @brief 等待的输出在超时时间内没有出现
     */
    TIMEOUT,

    /**
     * @brief 等待的输出出现前程序已经结束
     */
    TERMINATED,

    /**
     * @brief 程序结束了，但返回值不是验证脚本期望的返回值
     */
    EXIT_STATUS,

    /**
     * @brief 与交互程序通信时出现的其他问题，比如无法启动程序、写入管道失败
     */
    PROCESS_ERROR,

    /**
     * @brief configure、make、编译器或者批处理程序执行失败
     */
    TOOL_FAILURE,

    /**
     * @brief 验证脚本或者执行机本身的错误
     */
    INTERNAL_ERROR
};

const char *get_display_message(failure_kind kind);

/**
 * @brief 一次任务最终上报给服务器的结果
 * student_message 给提交的学生看，tutor_message 给助教看，
 * 后者会包含更多技术细节。
 */
struct failure {
    failure_kind kind = failure_kind::NONE;

    std::string student_message;

    std::string tutor_message;

    /**
     * @brief 上报的错误码，0 表示通过，E_UNSPECIFIC 表示未分类的失败
     */
    int error_code = 0;

    /**
     * @brief 失败发生时已经捕获到的程序输出
     */
    std::string output;
};

/**
 * @brief 验证通过
 * @param student_message 给学生的信息
 * @param tutor_message 给助教的信息
 */
failure pass_outcome(const std::string &student_message, const std::string &tutor_message);

/**
 * @brief 等待程序输出时超时
 * @param timeout 超过的时间限制（秒）
 * @param output 超时前程序的全部输出
 */
failure timeout_failure(int timeout, const std::string &output);

/**
 * @brief 在期望的输出出现之前，程序已经结束
 * @param exit_status 程序的返回值，如果程序被信号杀死则没有
 * @param output 程序的全部输出
 */
failure termination_failure(const std::optional<int> &exit_status, const std::string &output);

/**
 * @brief 程序的返回值和期望不一致
 */
failure exit_status_failure(const std::optional<int> &exit_status, int expected, const std::string &output);

/**
 * @brief 与交互程序通信时的其他问题
 * @param cause 底层错误的描述
 */
failure process_failure(const std::string &cause, const std::string &output);

/**
 * @brief 工具（编译器、make 等）执行失败，信息由调用方预先格式化
 */
failure tool_failure(const std::string &student_message, const std::string &tutor_message,
                     const std::string &output, int error_code);

/**
 * @brief 根据工具的执行结果构造失败信息
 * @param tool 工具的名字，比如 "Compilation"、"make"
 * @param command 执行的命令行，只给助教看
 * @param res 工具的执行结果
 * @param error_code 如果没有更具体的错误码，使用 E_UNSPECIFIC
 */
failure tool_failure(const std::string &tool, const std::string &command, const result &res, int error_code);

/**
 * @brief 无法预料的错误
 * @param what 错误的描述
 */
failure internal_failure(const std::string &what);

}  // namespace executor
