#pragma once

#include <filesystem>
#include <string>

namespace executor {

enum error_codes {
    /**
     * @brief 验证全部通过
     */
    E_SUCCESS = 0,

    /**
     * @brief 没有更具体分类的失败
     * 服务端会将这个值原样显示给助教
     */
    E_UNSPECIFIC = -9999
};

/**
 * @brief 执行机的配置
 * 在执行机启动时读取一次，之后不再修改，通过构造函数传递给需要的模块。
 *
 * 配置文件为 JSON 格式：
 * @code{.json}
 * {
 *     "server": {
 *         "address": "https://submit.example.org",
 *         "secret": "49846zut93purfh977TTTiuhgalkjfnk89hgurjhg",
 *         "uuid": "e1bc4fd2-3d5b-4b7b-a4c7-53a2b1c0f7d1",
 *         "http_timeout": 60
 *     },
 *     "execution": {
 *         "working_dir": "/tmp/executor",
 *         "timeout": 30,
 *         "cleanup": true,
 *         "compiler": "gcc"
 *     }
 * }
 * @endcode
 */
struct executor_config {
    /**
     * @brief 中心服务器的地址，不包含末尾的 /
     */
    std::string server_address;

    /**
     * @brief 执行机向服务器认证使用的共享密钥
     */
    std::string secret;

    /**
     * @brief 执行机的唯一标识
     */
    std::string uuid;

    /**
     * @brief HTTP 请求的超时时间（秒）
     */
    long http_timeout = 60;

    /**
     * @brief 存放每个任务工作目录的根目录
     *
     * WORKING_DIR
     * ├── 3fa85f64-5717-4562-b3fc-2c963f66afa6 // 随机生成的 uuid，一个任务一个目录
     * │   ├── validator.py // 重命名后的验证脚本
     * │   ├── configure // 可选的 configure 脚本
     * │   └── ... // 解压后的学生提交
     * └── ...
     */
    std::filesystem::path working_dir = "/tmp/executor";

    /**
     * @brief 服务器没有给出超时时间时使用的默认值（秒）
     */
    int timeout = 30;

    /**
     * @brief 任务完成后是否删除工作目录
     */
    bool cleanup = true;

    /**
     * @brief run_build 和 run_compiler 默认使用的编译器
     */
    std::string compiler = "gcc";

    /**
     * @brief 从 JSON 配置文件读取配置
     * @param path 配置文件路径
     * @throw std::invalid_argument 配置文件不存在或者格式不正确
     */
    static executor_config load(const std::filesystem::path &path);

    /**
     * @brief 从 JSON 字符串读取配置，缺失的项使用默认值
     */
    static executor_config parse(const std::string &text);

    /**
     * @brief 检查与服务器通信所需的配置项是否齐全
     * @throw std::invalid_argument 缺少 address、secret 或 uuid
     */
    void require_server() const;
};

}  // namespace executor
