#pragma once

#include <string>
#include "server/http.hpp"

namespace executor::server {

/**
 * @brief 上报给服务器的任务结果
 * 字段与服务器接口的表单字段一一对应。
 */
struct result_report {
    std::string submission_file_id;
    std::string message;
    std::string action;
    std::string message_tutor;
    std::string executor_dir;
    int error_code = 0;
    std::string secret;
    std::string uuid;

    /**
     * @brief 生成上报的表单字段
     */
    form_fields fields() const;
};

/**
 * @brief 将任务结果发送给服务器
 */
struct result_reporter {
    virtual ~result_reporter();

    /**
     * @brief 上报结果
     * @throw network_error 上报失败
     */
    virtual void send(const result_report &report) = 0;
};

/**
 * @brief 通过 HTTP POST 上报结果到 <server>/jobs/
 */
struct http_reporter : result_reporter {
    /**
     * @param server_address 服务器地址，不包含末尾的 /
     * @param timeout 请求的超时时间（秒）
     */
    http_reporter(const std::string &server_address, long timeout);

    void send(const result_report &report) override;

private:
    std::string server_address;
    long timeout;
};

}  // namespace executor::server
