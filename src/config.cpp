#include "config.hpp"
#include <nlohmann/json.hpp>
#include "common/io_utils.hpp"

namespace executor {
using namespace std;
using namespace nlohmann;

executor_config executor_config::load(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw invalid_argument("Unable to find configuration file " + path.string());
    return parse(read_file_content(path));
}

executor_config executor_config::parse(const string &text) {
    executor_config config;
    json j;
    try {
        j = json::parse(text);
    } catch (json::exception &ex) {
        throw invalid_argument(string("Configuration is malformed: ") + ex.what());
    }

    try {
        if (j.count("server")) {
            const json &server = j.at("server");
            config.server_address = server.value("address", config.server_address);
            config.secret = server.value("secret", config.secret);
            config.uuid = server.value("uuid", config.uuid);
            config.http_timeout = server.value("http_timeout", config.http_timeout);
        }

        if (j.count("execution")) {
            const json &execution = j.at("execution");
            config.working_dir = execution.value("working_dir", config.working_dir.string());
            config.timeout = execution.value("timeout", config.timeout);
            config.cleanup = execution.value("cleanup", config.cleanup);
            config.compiler = execution.value("compiler", config.compiler);
        }
    } catch (json::exception &ex) {
        throw invalid_argument(string("Unexpected value type in configuration: ") + ex.what());
    }

    while (!config.server_address.empty() && config.server_address.back() == '/')
        config.server_address.pop_back();

    if (config.timeout <= 0)
        throw invalid_argument("execution.timeout must be positive, got " + to_string(config.timeout));
    if (config.http_timeout <= 0)
        throw invalid_argument("server.http_timeout must be positive");

    return config;
}

void executor_config::require_server() const {
    if (server_address.empty())
        throw invalid_argument("server.address is not configured");
    if (secret.empty())
        throw invalid_argument("server.secret is not configured");
    if (uuid.empty())
        throw invalid_argument("server.uuid is not configured");
}

}  // namespace executor
