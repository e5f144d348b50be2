#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace executor {
using namespace std;

executor_exception::executor_exception()
    : executor_exception("") {}

executor_exception::executor_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *executor_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const executor_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : executor_exception() {}

internal_error::internal_error(const string &message)
    : executor_exception(message) {}

network_error::network_error()
    : executor_exception() {}

network_error::network_error(const string &message)
    : executor_exception(message) {}

validator_error::validator_error(const string &message)
    : executor_exception(message) {}

job_failure::job_failure(const failure &info)
    : executor_exception(info.tutor_message), failure_info(info) {}

const failure &job_failure::info() const noexcept {
    return failure_info;
}

}  // namespace executor
