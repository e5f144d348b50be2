#include "server/reporter.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace executor::server {
using namespace std;

form_fields result_report::fields() const {
    return {
        {"SubmissionFileId", submission_file_id},
        {"Message", message},
        {"Action", action},
        {"MessageTutor", message_tutor},
        {"ExecutorDir", executor_dir},
        {"ErrorCode", to_string(error_code)},
        {"Secret", secret},
        {"UUID", uuid}};
}

result_reporter::~result_reporter() = default;

http_reporter::http_reporter(const string &server_address, long timeout)
    : server_address(server_address), timeout(timeout) {}

void http_reporter::send(const result_report &report) {
    string url = server_address + "/jobs/";
    LOG(INFO) << "Sending result of submission file " << report.submission_file_id << " to " << url
              << ", error code " << report.error_code;

    http_response response = http_post(url, report.fields(), timeout);
    if (response.status >= 400)
        throw network_error("Server rejected the result of submission file " + report.submission_file_id +
                            ", status code " + to_string(response.status) + ": " + response.body);
}

}  // namespace executor::server
