#include "gtest/gtest.h"
#include "config.hpp"
#include "failure.hpp"
#include "process/result.hpp"

using namespace std;
using namespace executor;

TEST(FailureTest, TimeoutMessages) {
    failure info = timeout_failure(1, "hello\n");
    EXPECT_EQ(info.kind, failure_kind::TIMEOUT);
    EXPECT_EQ(info.error_code, E_UNSPECIFIC);
    EXPECT_EQ(info.student_message,
              "The execution of your program was cancelled, since it took longer than 1 seconds. \n\nOutput so far: hello\n");
    EXPECT_EQ(info.tutor_message,
              "The execution of the program was cancelled due to the timeout of 1 seconds. \n\nOutput so far: hello\n");
    EXPECT_EQ(info.output, "hello\n");
}

TEST(FailureTest, TerminationUsesNonZeroExitStatus) {
    failure info = termination_failure(3, "x\n");
    EXPECT_EQ(info.kind, failure_kind::TERMINATED);
    EXPECT_EQ(info.error_code, 3);
    EXPECT_EQ(info.student_message, "Your program terminated unexpectedly.\n\nOutput so far: x\n");
    EXPECT_EQ(info.tutor_message, "The student program terminated unexpectedly.\n\nOutput so far: x\n");

    // 返回 0 或者被信号杀死时没有可用的错误码
    EXPECT_EQ(termination_failure(0, "").error_code, E_UNSPECIFIC);
    EXPECT_EQ(termination_failure(nullopt, "").error_code, E_UNSPECIFIC);
}

TEST(FailureTest, ExitStatusMismatch) {
    failure info = exit_status_failure(2, 0, "out");
    EXPECT_EQ(info.kind, failure_kind::EXIT_STATUS);
    EXPECT_EQ(info.error_code, 2);
    EXPECT_NE(info.student_message.find("exited with status 2, expected was 0"), string::npos);

    failure killed = exit_status_failure(nullopt, 0, "");
    EXPECT_EQ(killed.error_code, E_UNSPECIFIC);
}

TEST(FailureTest, ProcessProblem) {
    failure info = process_failure("Broken pipe", "partial");
    EXPECT_EQ(info.kind, failure_kind::PROCESS_ERROR);
    EXPECT_EQ(info.error_code, E_UNSPECIFIC);
    EXPECT_EQ(info.student_message,
              "Unexpected problem during the execution of your program. Broken pipe\n\nOutput so far: partial");
    EXPECT_EQ(info.tutor_message,
              "Unknown exception during the execution of the student program. Broken pipe\n\nOutput so far: partial");
}

TEST(FailureTest, ToolFailureFromResult) {
    result res;
    res.output = "main.c:1: error";
    res.exit_status = 1;
    failure info = tool_failure("Compilation", "gcc -o a.out main.c", res, E_UNSPECIFIC);
    EXPECT_EQ(info.kind, failure_kind::TOOL_FAILURE);
    EXPECT_EQ(info.error_code, E_UNSPECIFIC);
    EXPECT_EQ(info.student_message, "Compilation failed.\n\nmain.c:1: error");
    EXPECT_NE(info.tutor_message.find("exit status 1"), string::npos);
    EXPECT_NE(info.tutor_message.find("gcc -o a.out main.c"), string::npos);

    result timed_out;
    timed_out.timed_out = true;
    EXPECT_NE(tool_failure("make", "make", timed_out, E_UNSPECIFIC).tutor_message.find("time limit exceeded"), string::npos);
}

TEST(FailureTest, InternalError) {
    failure info = internal_failure("boom");
    EXPECT_EQ(info.kind, failure_kind::INTERNAL_ERROR);
    EXPECT_EQ(info.error_code, E_UNSPECIFIC);
    EXPECT_EQ(info.student_message, "Internal problem while validating your submission. boom");
    EXPECT_EQ(info.tutor_message, "Unknown exception while running the validator. boom");
}

TEST(FailureTest, PassOutcome) {
    failure info = pass_outcome("All tests passed. Awesome!", "All tests passed.");
    EXPECT_EQ(info.kind, failure_kind::NONE);
    EXPECT_EQ(info.error_code, E_SUCCESS);
    EXPECT_STREQ(get_display_message(info.kind), "none");
}
