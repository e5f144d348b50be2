#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "job.hpp"
#include "test/mock_reporter.hpp"
#include "test/validators.hpp"
#include "validator/python_validator.hpp"

using namespace std;
using namespace executor;
namespace bp = boost::python;

class PythonValidatorTest : public ::testing::Test {
protected:
    test::working_directory dir;
    executor_config config = test::test_config();
    server::mock::reporter reporter;
    python_validator_loader loader;

    /**
     * @brief 执行工作路径中的 validator.py，返回上报的结果
     */
    server::result_report validate() {
        job j(config, reporter, loader);
        j.working_dir = dir.path;
        j.file_id = "42";
        j.run_validate();
        EXPECT_FALSE(reporter.reports.empty());
        return reporter.reports.back();
    }

    static size_t search_path_length() {
        GIL_guard guard;
        return bp::len(bp::import("sys").attr("path"));
    }

    static bool module_loaded(const string &name) {
        GIL_guard guard;
        bp::dict modules(bp::import("sys").attr("modules"));
        return modules.has_key(name);
    }
};

TEST_F(PythonValidatorTest, ModuleNamesAreNeverReused) {
    test::working_directory other;
    string first = next_module_name(dir.path);
    string second = next_module_name(dir.path);
    EXPECT_NE(first, second);
    EXPECT_NE(next_module_name(other.path), first);
    EXPECT_EQ(first.rfind("validator_", 0), 0u);
}

TEST_F(PythonValidatorTest, MissingValidatorScript) {
    EXPECT_THROW(loader.load(dir.path), validator_error);

    server::result_report report = validate();
    EXPECT_EQ(report.error_code, E_UNSPECIFIC);
    EXPECT_EQ(report.message.rfind("Internal problem while validating your submission.", 0), 0u);
}

TEST_F(PythonValidatorTest, ExplicitPassResult) {
    dir.write("validator.py", R"(
def validate(job):
    job.send_pass_result("Fine.", "Fine for file " + job.file_id)
)");
    server::result_report report = validate();
    EXPECT_EQ(report.error_code, 0);
    EXPECT_EQ(report.message, "Fine.");
    EXPECT_EQ(report.message_tutor, "Fine for file 42");
}

TEST_F(PythonValidatorTest, ImplicitPassResult) {
    dir.write("validator.py", R"(
def validate(job):
    assert job.ensure_files(["validator.py"])
    assert not job.ensure_files(["main.c"])
)");
    server::result_report report = validate();
    EXPECT_EQ(report.error_code, 0);
    EXPECT_EQ(report.message, "All tests passed. Awesome!");
}

TEST_F(PythonValidatorTest, PythonExceptionIsInternalError) {
    dir.write("validator.py", R"(
def validate(job):
    raise ValueError("oops")
)");
    server::result_report report = validate();
    EXPECT_EQ(report.error_code, E_UNSPECIFIC);
    EXPECT_EQ(report.message, "Internal problem while validating your submission. oops");
    EXPECT_EQ(report.message_tutor, "Unknown exception while running the validator. oops");
}

TEST_F(PythonValidatorTest, SyntaxErrorIsInternalError) {
    dir.write("validator.py", "def validate(job)\n    pass\n");
    server::result_report report = validate();
    EXPECT_EQ(report.error_code, E_UNSPECIFIC);
    EXPECT_EQ(report.message.rfind("Internal problem while validating your submission.", 0), 0u);
}

TEST_F(PythonValidatorTest, MissingValidateFunction) {
    dir.write("validator.py", "x = 1\n");
    server::result_report report = validate();
    EXPECT_EQ(report.error_code, E_UNSPECIFIC);
    EXPECT_NE(report.message.find("does not define validate"), string::npos);
}

TEST_F(PythonValidatorTest, JobFailurePropagatesThroughPython) {
    dir.write("validator.py", R"(
def validate(job):
    program = job.spawn_program("sh", ["-c", "echo x; exit 3"])
    program.expect("never")
)");
    server::result_report report = validate();
    EXPECT_EQ(report.error_code, 3);
    EXPECT_EQ(report.message, "Your program terminated unexpectedly.\n\nOutput so far: x\n");
}

TEST_F(PythonValidatorTest, JobFailureCanBeHandledByValidator) {
    dir.write("validator.py", R"(
import executor

def validate(job):
    program = job.spawn_program("sh", ["-c", "echo x; exit 3"])
    try:
        program.expect("never", timeout=5)
    except executor.JobFailure as e:
        job.send_fail_result("handled", e.args[1].kind)
)");
    server::result_report report = validate();
    EXPECT_EQ(report.error_code, E_UNSPECIFIC);
    EXPECT_EQ(report.message, "handled");
    EXPECT_EQ(report.message_tutor, "terminated");
}

TEST_F(PythonValidatorTest, InteractiveProgram) {
    dir.write("validator.py", R"(
def validate(job):
    program = job.spawn_program("sh", ["-c", "read a; echo $((a * 2)); exit 5"])
    program.sendline("21")
    program.expect_exact("42")
    program.expect_exit_status(5)
    result = job.run_program("sh", ["-c", "echo batch"])
    assert result.is_ok()
    assert result.exit_status == 0
    job.send_pass_result(result.output.strip(), str(program.exit_status))
)");
    server::result_report report = validate();
    EXPECT_EQ(report.error_code, 0);
    EXPECT_EQ(report.message, "batch");
    EXPECT_EQ(report.message_tutor, "5");
}

TEST_F(PythonValidatorTest, CompilerConstants) {
    dir.write("validator.py", R"(
import executor

def validate(job):
    job.send_pass_result(executor.GCC.name, executor.GPP.name)
)");
    server::result_report report = validate();
    EXPECT_EQ(report.message, "gcc");
    EXPECT_EQ(report.message_tutor, "g++");
}

TEST_F(PythonValidatorTest, ReloadSeesNewCodeAndFreshState) {
    dir.write("validator.py", R"(
counter = 0

def validate(job):
    global counter
    counter += 1
    job.send_fail_result("first version", str(counter))
)");
    EXPECT_EQ(validate().message_tutor, "1");
    EXPECT_EQ(validate().message_tutor, "1");

    dir.write("validator.py", R"(
counter = 0

def validate(job):
    global counter
    counter += 1
    job.send_fail_result("other version", str(counter))
)");
    server::result_report report = validate();
    EXPECT_EQ(report.message, "other version");
    EXPECT_EQ(report.message_tutor, "1");
}

TEST_F(PythonValidatorTest, HelperModulesAreDropped) {
    size_t path_length = search_path_length();
    dir.write("checks.py", "VALUE = 'first'\n");
    dir.write("validator.py", R"(
import checks

def validate(job):
    job.send_pass_result(checks.VALUE, checks.VALUE)
)");
    EXPECT_EQ(validate().message, "first");
    EXPECT_FALSE(module_loaded("checks"));
    EXPECT_EQ(search_path_length(), path_length);

    dir.write("checks.py", "VALUE = 'second'\n");
    EXPECT_EQ(validate().message, "second");
}

TEST_F(PythonValidatorTest, SearchPathRestoredAfterFailure) {
    size_t path_length = search_path_length();
    dir.write("validator.py", R"(
def validate(job):
    raise RuntimeError("fail")
)");
    validate();
    EXPECT_EQ(search_path_length(), path_length);
}
