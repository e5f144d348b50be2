#pragma once

#include <optional>
#include <string>

namespace executor {

/**
 * @brief 一次工具调用（编译器、make、批处理程序）的结果
 */
struct result {
    /**
     * @brief 程序是否在时间限制内正常结束且返回 0
     */
    bool ok = false;

    /**
     * @brief 程序的标准输出和标准错误输出（合并为一个流）
     * 已经转换为合法的 UTF-8 文本
     */
    std::string output;

    /**
     * @brief 程序的返回值
     * 如果程序无法启动、被信号杀死或者超时被终止，则没有返回值
     */
    std::optional<int> exit_status;

    /**
     * @brief 程序是否因为超时被终止
     */
    bool timed_out = false;

    bool is_ok() const;
};

}  // namespace executor
