#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace executor {

/**
 * @brief 匹配到的输出区间 [begin, end)，下标相对于尚未消费的输出
 */
struct match_region {
    size_t begin;
    size_t end;
};

/**
 * @brief 在尚未消费的输出中查找期望的内容
 * @return 找到时返回匹配区间
 */
typedef std::function<std::optional<match_region>(const std::string &buffer)> output_matcher;

/**
 * @brief 一次等待的结果
 */
struct wait_outcome {
    enum class status {
        MATCHED,    // 输出中出现了期望的内容
        ENDED,      // 期望的内容出现前程序已经结束或者关闭了输出
        TIMED_OUT   // 超时
    } state;

    /**
     * @brief 匹配内容之前的输出；没有匹配时为所有尚未消费的输出
     */
    std::string before;

    /**
     * @brief 匹配到的内容
     */
    std::string matched;
};

/**
 * @brief 可交互的程序
 * 程序的执行方式（本机进程、容器、远程执行）可以替换，验证逻辑只依赖这个接口。
 * 输出是持续读取的：每次等待会把新的输出追加到缓冲区，匹配成功时消费掉
 * 匹配结束位置之前的输出。
 */
struct interactive_process {
    virtual ~interactive_process();

    /**
     * @brief 写入程序的标准输入
     * @throw std::system_error 程序已经关闭了标准输入
     */
    virtual void write(const std::string &text) = 0;

    /**
     * @brief 读取输出直到 matcher 匹配成功、程序结束或者超时
     */
    virtual wait_outcome read_until(const output_matcher &matcher, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 等待程序结束
     * @return state 为 ENDED 或 TIMED_OUT
     */
    virtual wait_outcome wait_for_exit(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 强制终止程序
     */
    virtual void kill() = 0;

    /**
     * @brief 程序是否已经结束
     */
    virtual bool finished() const = 0;

    /**
     * @brief 程序结束后的返回值，被信号终止时没有返回值
     */
    virtual std::optional<int> exit_status() const = 0;

    /**
     * @brief 程序启动以来的全部输出
     */
    virtual std::string transcript() const = 0;
};

/**
 * @brief 在本机以子进程的方式运行的交互程序
 * 构造时启动程序，析构时终止程序所在的进程组。程序的标准输入输出连接到伪终端，
 * 与学生在终端中运行程序时的缓冲方式相同。
 */
class local_process : public interactive_process {
public:
    /**
     * @brief 启动程序
     * @param argv 程序路径和参数
     * @param working_dir 程序的工作路径
     * @throw std::system_error 程序无法启动
     */
    local_process(const std::vector<std::string> &argv, const std::filesystem::path &working_dir);
    ~local_process() override;

    local_process(const local_process &) = delete;
    local_process &operator=(const local_process &) = delete;

    void write(const std::string &text) override;
    wait_outcome read_until(const output_matcher &matcher, std::chrono::milliseconds timeout) override;
    wait_outcome wait_for_exit(std::chrono::milliseconds timeout) override;
    void kill() override;
    bool finished() const override;
    std::optional<int> exit_status() const override;
    std::string transcript() const override;

    pid_t pid() const;

private:
    /**
     * @brief 等待新的输出，最多等待到 deadline
     * @return 是否读到了新的输出或者 EOF
     */
    bool fill(std::chrono::steady_clock::time_point deadline);

    /**
     * @brief 读出已经结束的程序留在缓冲区中的输出
     */
    void drain(std::chrono::steady_clock::time_point deadline);

    /**
     * @brief 回收子进程
     * @param deadline 最多等待到的时间点，为 nullopt 时不等待
     * @return 子进程是否已经结束
     */
    bool reap(std::optional<std::chrono::steady_clock::time_point> deadline);

    void close_input();

    pid_t child_pid = -1;
    int input_fd = -1;
    int output_fd = -1;
    bool eof = false;
    bool exited = false;
    std::optional<int> status;

    // 尚未被匹配消费的输出，保存原始字节，避免截断多字节字符
    std::string buffer;
    // 全部输出的原始字节
    std::string output;
};

}  // namespace executor
