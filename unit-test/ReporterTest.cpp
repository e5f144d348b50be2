#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "server/http.hpp"
#include "server/reporter.hpp"

using namespace std;
using namespace executor;
using namespace executor::server;

static result_report sample_report() {
    result_report report;
    report.submission_file_id = "42";
    report.message = "All tests passed. Awesome!";
    report.action = "test_full";
    report.message_tutor = "All tests passed.";
    report.executor_dir = "/tmp/executor/job";
    report.error_code = -9999;
    report.secret = "secret";
    report.uuid = "machine-1";
    return report;
}

TEST(ReporterTest, ReportFields) {
    form_fields expected = {
        {"SubmissionFileId", "42"},
        {"Message", "All tests passed. Awesome!"},
        {"Action", "test_full"},
        {"MessageTutor", "All tests passed."},
        {"ExecutorDir", "/tmp/executor/job"},
        {"ErrorCode", "-9999"},
        {"Secret", "secret"},
        {"UUID", "machine-1"}};
    EXPECT_EQ(sample_report().fields(), expected);
}

TEST(ReporterTest, FormEncoding) {
    EXPECT_EQ(form_encode({{"Message", "a b&c=d"}, {"ErrorCode", "0"}}), "Message=a%20b%26c%3Dd&ErrorCode=0");
    EXPECT_EQ(form_encode({}), "");
}

TEST(ReporterTest, HeadersAreCaseInsensitive) {
    http_response response;
    response.headers["submissionfileid"] = "42";
    EXPECT_EQ(response.header("SubmissionFileId"), "42");
    EXPECT_EQ(response.header("Timeout", "30"), "30");
}

TEST(ReporterTest, UnreachableServer) {
    // 端口 9 (discard) 通常没有服务监听
    http_reporter reporter("http://127.0.0.1:9", 5);
    EXPECT_THROW(reporter.send(sample_report()), network_error);
}
