#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "build/compiler.hpp"
#include "config.hpp"
#include "failure.hpp"
#include "process/result.hpp"
#include "process/running_program.hpp"
#include "server/reporter.hpp"
#include "validator/validator.hpp"

namespace executor {

/**
 * @brief 执行机从服务器领取的一个验证任务
 * 验证逻辑通过这个类的接口编译、运行学生程序并上报结果。
 * 每个任务最多上报一次结果：run_validate 会捕获验证过程中的所有异常并上报，
 * 验证逻辑没有主动上报结果时，视为全部测试通过。
 */
struct job {
    /**
     * @brief 任务的工作路径，包含学生提交的文件和 validator.py
     */
    std::filesystem::path working_dir;

    /**
     * @brief 学生提交文件的下载地址
     */
    std::string submission_url;

    /**
     * @brief 验证脚本的下载地址
     */
    std::string validator_url;

    /**
     * @brief 服务器要求的超时时间（秒），必须为正数
     */
    int timeout;

    std::string submission_id;

    std::string file_id;

    /**
     * @brief 服务器要求的动作，上报结果时原样返回
     */
    std::string action;

    std::string submitter_name;
    std::string submitter_student_id;
    std::string author_names;
    std::string submitter_studyprogram;
    std::string course;
    std::string assignment;

    /**
     * @brief 是否已经上报过结果
     */
    bool result_sent = false;

    /**
     * @brief 最近一次生成的上报内容，离线模式下可以通过它查看结果
     */
    std::optional<server::result_report> last_report;

    /**
     * @param config 执行机配置
     * @param reporter 上报结果的方式
     * @param loader 加载验证逻辑的方式
     * @param online 为 false 时只生成上报内容，不发送给服务器
     */
    job(const executor_config &config, server::result_reporter &reporter, validator_loader &loader, bool online = true);

    /**
     * @brief 加载并执行工作路径中的验证逻辑，然后上报结果
     * 验证过程中的所有异常都会被分类并上报，不会抛出。
     * @throw network_error 结果无法发送给服务器
     */
    void run_validate();

    /**
     * @brief 上报结果
     * 同一个任务的第二次上报会被忽略。
     */
    void send_result(const std::string &student_message, const std::string &tutor_message, int error_code);

    void send_pass_result(const std::string &student_message = "All tests passed. Awesome!",
                          const std::string &tutor_message = "All tests passed.");

    void send_fail_result(const std::string &student_message, const std::string &tutor_message);

    /**
     * @brief 执行工作路径中的 ./configure
     * @param mandatory 为 false 时失败只记录日志
     * @throw job_failure configure 不存在、超时或返回值不为 0
     */
    void run_configure(bool mandatory = true);

    /**
     * @brief 在工作路径中执行 make
     * @throw job_failure make 执行失败且 mandatory 为 true
     */
    void run_make(bool mandatory = true);

    /**
     * @brief 编译学生程序
     * @param inputs 源文件，为空时编译工作路径中所有该编译器支持的源文件
     * @param output 可执行文件名，为空时为 a.out
     * @throw job_failure 编译失败
     */
    void run_compiler(const compiler_profile &compiler, const std::vector<std::string> &inputs = {},
                      const std::string &output = "");

    /**
     * @brief 依次执行可选的 configure、可选的 make 和必须成功的编译
     */
    void run_build(const compiler_profile &compiler, const std::vector<std::string> &inputs = {},
                   const std::string &output = "");

    /**
     * @brief 配置文件中指定的默认编译器
     */
    const compiler_profile &default_compiler() const;

    /**
     * @brief 启动可交互的程序
     * @param name 程序名，工作路径中存在同名文件时执行该文件
     * @param timeout 等待的默认超时时间（秒），-1 表示任务的超时时间
     * @param exclusive 为 true 时先终止之前遗留的所有程序
     * @throw job_failure 程序无法启动
     */
    std::shared_ptr<running_program> spawn_program(const std::string &name, const std::vector<std::string> &arguments = {},
                                                   int timeout = -1, bool exclusive = false);

    /**
     * @brief 运行程序直到结束
     * @return 程序的执行结果
     * @throw job_failure 程序执行失败
     */
    result run_program(const std::string &name, const std::vector<std::string> &arguments = {},
                       int timeout = -1, bool exclusive = false);

    /**
     * @brief 检查工作路径中是否存在所有指定的文件
     */
    bool ensure_files(const std::vector<std::string> &filenames) const;

    /**
     * @brief 找出工作路径中文件名匹配 file_pattern 并且包含所有关键字的文件
     * @param file_pattern 通配符，比如 *.c
     * @return 按文件名排序的文件列表
     */
    std::vector<std::string> find_keywords(const std::vector<std::string> &keywords, const std::string &file_pattern) const;

    /**
     * @brief 删除工作路径中学生提交的可执行文件
     * @return 被删除的文件名
     */
    std::vector<std::string> delete_binaries();

    /**
     * @brief 验证脚本的路径
     */
    std::filesystem::path validator_script_name() const;

    bool is_online() const;

private:
    /**
     * @brief 将程序名解析为命令行
     */
    std::vector<std::string> command_line(const std::string &name, const std::vector<std::string> &arguments) const;

    void report_failure(const failure &info);

    const executor_config config;
    server::result_reporter &reporter;
    validator_loader &loader;
    bool online;
};

std::ostream &operator<<(std::ostream &os, const job &j);

}  // namespace executor
