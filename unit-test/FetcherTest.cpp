#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "job.hpp"
#include "process/execution.hpp"
#include "server/fetcher.hpp"
#include "test/mock_reporter.hpp"
#include "test/validators.hpp"

using namespace std;
using namespace executor;
using namespace executor::server;

class FetcherTest : public ::testing::Test {
protected:
    executor_config config = test::test_config(30);
    mock::reporter reporter;
    test::lambda_validator_loader loader{[](job &) {}};
    job j{config, reporter, loader};

    static http_response job_response() {
        http_response response;
        response.status = 200;
        response.headers["submissionfileid"] = "1234";
        response.headers["submissionid"] = "99";
        response.headers["timeout"] = "12";
        response.headers["action"] = "test_validity";
        response.headers["postrunvalidation"] = "http://localhost:8000/download/5/validity_testscript/";
        response.headers["submittername"] = "Alice Example";
        response.headers["submitterstudentid"] = "0815";
        response.headers["authornames"] = "Alice Example, Bob Example";
        response.headers["submitterstudyprogram"] = "Computer Science";
        response.headers["course"] = "Operating Systems";
        response.headers["assignment"] = "Threads";
        return response;
    }
};

TEST_F(FetcherTest, ApplyJobHeaders) {
    apply_job_headers(j, job_response());

    EXPECT_EQ(j.file_id, "1234");
    EXPECT_EQ(j.submission_id, "99");
    EXPECT_EQ(j.timeout, 12);
    EXPECT_EQ(j.action, "test_validity");
    EXPECT_EQ(j.validator_url, "http://localhost:8000/download/5/validity_testscript/");
    EXPECT_EQ(j.submitter_name, "Alice Example");
    EXPECT_EQ(j.submitter_student_id, "0815");
    EXPECT_EQ(j.author_names, "Alice Example, Bob Example");
    EXPECT_EQ(j.submitter_studyprogram, "Computer Science");
    EXPECT_EQ(j.course, "Operating Systems");
    EXPECT_EQ(j.assignment, "Threads");
}

TEST_F(FetcherTest, KeepConfiguredTimeoutWithoutHeader) {
    http_response response = job_response();
    response.headers.erase("timeout");
    apply_job_headers(j, response);
    EXPECT_EQ(j.timeout, 30);
}

TEST_F(FetcherTest, RejectInvalidHeaders) {
    http_response missing_id = job_response();
    missing_id.headers.erase("submissionfileid");
    EXPECT_THROW(apply_job_headers(j, missing_id), internal_error);

    http_response zero_timeout = job_response();
    zero_timeout.headers["timeout"] = "0";
    EXPECT_THROW(apply_job_headers(j, zero_timeout), internal_error);

    http_response bad_timeout = job_response();
    bad_timeout.headers["timeout"] = "ten";
    EXPECT_THROW(apply_job_headers(j, bad_timeout), internal_error);
}

TEST_F(FetcherTest, AttachmentFilename) {
    EXPECT_EQ(attachment_filename("attachment; filename=\"submission.zip\"", "x"), "submission.zip");
    EXPECT_EQ(attachment_filename("attachment;filename=hello.c", "x"), "hello.c");
    EXPECT_EQ(attachment_filename("attachment; filename=\"../../etc/passwd\"", "x"), "passwd");
    EXPECT_EQ(attachment_filename("inline", "validator.py"), "validator.py");
    EXPECT_EQ(attachment_filename("", "submission"), "submission");
}

TEST_F(FetcherTest, ArchiveDetection) {
    EXPECT_TRUE(is_archive("project.zip"));
    EXPECT_TRUE(is_archive("project.TAR.GZ"));
    EXPECT_TRUE(is_archive("project.tgz"));
    EXPECT_TRUE(is_archive("project.tar.bz2"));
    EXPECT_TRUE(is_archive("project.tar"));
    EXPECT_FALSE(is_archive("validator.py"));
    EXPECT_FALSE(is_archive("main.c"));
}

TEST_F(FetcherTest, UnpackFlattensSingleDirectory) {
    test::working_directory source, target;
    filesystem::create_directories(source.path / "project" / "src");
    source.write("project/Makefile", "all:\n");
    source.write("project/src/main.c", "int main() {}");
    result packed = execute_program({"tar", "-czf", "submission.tar.gz", "project"}, source.path, 10);
    ASSERT_TRUE(packed.is_ok()) << packed.output;

    unpack_archive(source.path / "submission.tar.gz", target.path, 10);
    EXPECT_TRUE(filesystem::is_regular_file(target.path / "Makefile"));
    EXPECT_TRUE(filesystem::is_regular_file(target.path / "src" / "main.c"));
    EXPECT_FALSE(filesystem::exists(target.path / "project"));
}

TEST_F(FetcherTest, UnpackKeepsMultipleEntries) {
    test::working_directory source, target;
    source.write("main.c", "int main() {}");
    source.write("validator.py", "def validate(job):\n    pass\n");
    result packed = execute_program({"tar", "-cf", "files.tar", "main.c", "validator.py"}, source.path, 10);
    ASSERT_TRUE(packed.is_ok()) << packed.output;

    target.write("existing.txt", "kept");
    unpack_archive(source.path / "files.tar", target.path, 10);
    EXPECT_TRUE(filesystem::is_regular_file(target.path / "main.c"));
    EXPECT_TRUE(filesystem::is_regular_file(target.path / "validator.py"));
    EXPECT_TRUE(filesystem::is_regular_file(target.path / "existing.txt"));
}

TEST_F(FetcherTest, RejectUnknownArchive) {
    test::working_directory target;
    target.write("archive.rar", "not an archive");
    EXPECT_THROW(unpack_archive(target.path / "archive.rar", target.path, 10), internal_error);
}
