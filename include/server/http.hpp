#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace executor::server {

/**
 * @brief 一次 HTTP 请求的响应
 */
struct http_response {
    long status = 0;

    /**
     * @brief 响应头，键为小写的头部名称
     */
    std::map<std::string, std::string> headers;

    std::string body;

    /**
     * @brief 获取响应头，名称不区分大小写
     * @return 响应头的值，不存在时返回 def
     */
    std::string header(const std::string &name, const std::string &def = "") const;
};

typedef std::vector<std::pair<std::string, std::string>> form_fields;

/**
 * @brief 以 application/x-www-form-urlencoded 格式编码表单
 */
std::string form_encode(const form_fields &fields);

/**
 * @brief 发送 GET 请求
 * @param timeout 整个请求的超时时间（秒）
 * @throw network_error 无法完成请求
 */
http_response http_get(const std::string &url, long timeout);

/**
 * @brief 发送表单格式的 POST 请求
 * @throw network_error 无法完成请求
 */
http_response http_post(const std::string &url, const form_fields &fields, long timeout);

/**
 * @brief 下载文件到 target
 * @throw network_error 无法下载，或者服务器返回了错误状态码
 */
void download_file(const std::string &url, const std::filesystem::path &target, long timeout);

}  // namespace executor::server
