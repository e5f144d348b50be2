#pragma once

#include <sys/types.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "process/result.hpp"

/**
 * 批处理执行引擎
 * 所有由执行机启动的子进程都放在各自独立的进程组中（进程组 id 为子进程 pid），
 * 这样终止程序时可以通过 kill(-pgid, SIGKILL) 连同它 fork 出来的进程一起终止。
 *
 * 执行完成后仍然有进程存活的进程组会被登记为"长时间运行的进程"，在下一个
 * 要求独占执行的程序启动前由 kill_longrunning 统一终止。
 */
namespace executor {

/**
 * @brief 已经启动的子进程
 */
struct child_process {
    pid_t pid = -1;

    /**
     * @brief 连接子进程标准输入的管道写端或伪终端主设备
     */
    int input_fd = -1;

    /**
     * @brief 连接子进程标准输出和标准错误输出的管道读端或伪终端主设备
     * 伪终端的从设备全部关闭后，读取主设备会返回 EIO 而不是 EOF。
     */
    int output_fd = -1;
};

/**
 * @brief 在 working_dir 中启动程序
 * 子进程的标准输出和标准错误输出合并到同一个管道中。
 * @param argv 程序路径 (argv[0]) 和参数，argv[0] 不包含 / 时从 PATH 中查找
 * @param working_dir 子进程的工作路径
 * @param terminal 为真时子进程的标准输入输出连接到一个关闭了回显的伪终端，
 * C 标准库在终端上按行缓冲输出，交互程序的提示信息才能及时读到
 * @throw std::system_error 无法创建管道或伪终端、fork 失败或者 exec 失败
 */
child_process spawn_child(const std::vector<std::string> &argv, const std::filesystem::path &working_dir, bool terminal = false);

/**
 * @brief 将 waitpid 得到的状态转换为返回值
 * @return 正常退出时的返回值，被信号终止时没有返回值
 */
std::optional<int> exit_status_of(int wait_status);

/**
 * @brief 向整个进程组发送 SIGKILL
 * 进程组已经不存在时什么也不做
 */
void terminate_process_group(pid_t pgid);

/**
 * @brief 登记一个可能长时间运行的进程组
 */
void register_longrunning(pid_t pgid);

/**
 * @brief 取消登记，进程组已经由调用方终止时使用
 */
void unregister_longrunning(pid_t pgid);

/**
 * @brief 终止所有登记过的进程组
 * 独占执行的程序在启动前调用这个函数，保证同一台执行机上同时只有一个独占程序。
 * @return 终止的进程组数量
 */
size_t kill_longrunning();

/**
 * @brief 执行程序直到结束
 * 程序的标准输入为空。
 * @param argv 程序路径和参数
 * @param working_dir 程序的工作路径
 * @param timeout 时间限制（秒），超时后程序所在进程组会被终止
 * @return 执行结果，程序无法启动时 ok 为假，output 为错误原因
 */
result execute_program(const std::vector<std::string> &argv, const std::filesystem::path &working_dir, int timeout);

}  // namespace executor
