#pragma once

#include <filesystem>
#include <string>
#include "config.hpp"
#include "server/http.hpp"

namespace executor {
struct job;
}

namespace executor::server {

/**
 * @brief 从服务器领取验证任务
 */
struct job_fetcher {
    explicit job_fetcher(const executor_config &config);

    /**
     * @brief 领取一个任务，下载并解压学生提交的文件和验证脚本
     * @param j 领取到的任务信息会写入 j，工作路径为配置的工作路径下新建的文件夹
     * @return 服务器是否分配了任务
     * @throw network_error 无法与服务器通信
     * @throw executor_exception 服务器返回的任务信息不完整，或者文件无法解压
     */
    bool fetch(job &j);

private:
    executor_config config;
};

/**
 * @brief 根据服务器返回的响应头填写任务信息
 * @throw executor_exception 缺少 SubmissionFileId 或者 Timeout 不是正整数
 */
void apply_job_headers(job &j, const http_response &response);

/**
 * @brief 从 Content-Disposition 中获得文件名
 * @return 文件名，如果没有则返回 def
 */
std::string attachment_filename(const std::string &content_disposition, const std::string &def);

/**
 * @brief 判断文件名是否为支持的压缩包格式
 */
bool is_archive(const std::string &filename);

/**
 * @brief 将压缩包解压到 dir
 * 支持 .zip、.tar、.tar.gz、.tgz、.tar.bz2。如果压缩包中只有一个顶层文件夹，
 * 则将文件夹中的内容移动到 dir 中。
 * @throw executor_exception 压缩包格式不支持，或者解压失败
 */
void unpack_archive(const std::filesystem::path &archive, const std::filesystem::path &dir, int timeout);

}  // namespace executor::server
