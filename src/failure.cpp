#include "failure.hpp"
#include <fmt/core.h>
#include "config.hpp"
#include "process/result.hpp"

namespace executor {
using namespace std;

const char *get_display_message(failure_kind kind) {
    switch (kind) {
        case failure_kind::NONE: return "none";
        case failure_kind::TIMEOUT: return "timeout";
        case failure_kind::TERMINATED: return "terminated";
        case failure_kind::EXIT_STATUS: return "exit-status";
        case failure_kind::PROCESS_ERROR: return "process-error";
        case failure_kind::TOOL_FAILURE: return "tool-failure";
        case failure_kind::INTERNAL_ERROR: return "internal-error";
    }
    return "unknown";
}

static string output_so_far(const string &output) {
    return "\n\nOutput so far: " + output;
}

failure pass_outcome(const string &student_message, const string &tutor_message) {
    return {failure_kind::NONE, student_message, tutor_message, E_SUCCESS, ""};
}

failure timeout_failure(int timeout, const string &output) {
    failure info;
    info.kind = failure_kind::TIMEOUT;
    info.student_message = fmt::format("The execution of your program was cancelled, since it took longer than {} seconds. ", timeout);
    info.tutor_message = fmt::format("The execution of the program was cancelled due to the timeout of {} seconds. ", timeout);
    info.student_message += output_so_far(output);
    info.tutor_message += output_so_far(output);
    info.error_code = E_UNSPECIFIC;
    info.output = output;
    return info;
}

failure termination_failure(const optional<int> &exit_status, const string &output) {
    failure info;
    info.kind = failure_kind::TERMINATED;
    info.student_message = "Your program terminated unexpectedly." + output_so_far(output);
    info.tutor_message = "The student program terminated unexpectedly." + output_so_far(output);
    // 返回值为 0 时不能作为错误码上报，否则服务器会认为验证通过
    info.error_code = exit_status && *exit_status != 0 ? *exit_status : E_UNSPECIFIC;
    info.output = output;
    return info;
}

failure exit_status_failure(const optional<int> &exit_status, int expected, const string &output) {
    string actual = exit_status ? to_string(*exit_status) : "none (killed by a signal)";
    failure info;
    info.kind = failure_kind::EXIT_STATUS;
    info.student_message = fmt::format("Your program exited with status {}, expected was {}.", actual, expected) + output_so_far(output);
    info.tutor_message = fmt::format("The student program exited with status {}, the validator expected {}.", actual, expected) + output_so_far(output);
    info.error_code = exit_status && *exit_status != 0 ? *exit_status : E_UNSPECIFIC;
    info.output = output;
    return info;
}

failure process_failure(const string &cause, const string &output) {
    failure info;
    info.kind = failure_kind::PROCESS_ERROR;
    info.student_message = "Unexpected problem during the execution of your program. " + cause + output_so_far(output);
    info.tutor_message = "Unknown exception during the execution of the student program. " + cause + output_so_far(output);
    info.error_code = E_UNSPECIFIC;
    info.output = output;
    return info;
}

failure tool_failure(const string &student_message, const string &tutor_message, const string &output, int error_code) {
    return {failure_kind::TOOL_FAILURE, student_message, tutor_message, error_code, output};
}

failure tool_failure(const string &tool, const string &command, const result &res, int error_code) {
    string status = res.timed_out ? "time limit exceeded"
                    : res.exit_status ? fmt::format("exit status {}", *res.exit_status)
                                      : "no exit status";
    return tool_failure(
        fmt::format("{} failed.\n\n{}", tool, res.output),
        fmt::format("{} failed ({}, command: {}).\n\n{}", tool, status, command, res.output),
        res.output, error_code);
}

failure internal_failure(const string &what) {
    failure info;
    info.kind = failure_kind::INTERNAL_ERROR;
    info.student_message = "Internal problem while validating your submission. " + what;
    info.tutor_message = "Unknown exception while running the validator. " + what;
    info.error_code = E_UNSPECIFIC;
    return info;
}

}  // namespace executor
