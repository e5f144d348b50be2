#include "process/running_program.hpp"
#include <glog/logging.h>
#include <regex>
#include <system_error>
#include "common/exceptions.hpp"
#include "failure.hpp"

namespace executor {
using namespace std;

running_program::running_program(unique_ptr<interactive_process> process, int default_timeout)
    : process(move(process)), default_timeout(default_timeout) {}

int running_program::effective_timeout(int timeout) const {
    return timeout < 0 ? default_timeout : timeout;
}

string running_program::wait_for(const output_matcher &matcher, int timeout, const string &description) {
    int bound = effective_timeout(timeout);
    DLOG(INFO) << "Expecting " << description << " within " << bound << "s";

    wait_outcome outcome;
    try {
        outcome = process->read_until(matcher, chrono::seconds(bound));
    } catch (system_error &ex) {
        throw job_failure(process_failure(ex.what(), process->transcript()));
    }

    switch (outcome.state) {
        case wait_outcome::status::MATCHED:
            last_before = outcome.before;
            last_matched = outcome.matched;
            return outcome.matched;
        case wait_outcome::status::ENDED:
            LOG(INFO) << "Program ended while expecting " << description;
            throw job_failure(termination_failure(process->exit_status(), process->transcript()));
        case wait_outcome::status::TIMED_OUT:
        default:
            LOG(INFO) << "Timeout of " << bound << "s while expecting " << description;
            throw job_failure(timeout_failure(bound, process->transcript()));
    }
}

string running_program::expect(const string &pattern, int timeout) {
    regex re;
    try {
        re = regex(pattern);
    } catch (regex_error &ex) {
        throw validator_error("Invalid pattern " + pattern + ": " + ex.what());
    }

    return wait_for([&re](const string &buffer) -> optional<match_region> {
        smatch match;
        if (!regex_search(buffer, match, re)) return nullopt;
        size_t begin = match.position(0);
        return match_region{begin, begin + match.length(0)};
    }, timeout, "/" + pattern + "/");
}

string running_program::expect_exact(const string &text, int timeout) {
    return wait_for([&text](const string &buffer) -> optional<match_region> {
        size_t pos = buffer.find(text);
        if (pos == string::npos) return nullopt;
        return match_region{pos, pos + text.size()};
    }, timeout, "\"" + text + "\"");
}

void running_program::send(const string &text) {
    try {
        process->write(text);
    } catch (system_error &ex) {
        throw job_failure(process_failure(ex.what(), process->transcript()));
    }
}

void running_program::sendline(const string &text) {
    send(text + "\n");
}

optional<int> running_program::expect_end(int timeout) {
    int bound = effective_timeout(timeout);
    wait_outcome outcome;
    try {
        outcome = process->wait_for_exit(chrono::seconds(bound));
    } catch (system_error &ex) {
        throw job_failure(process_failure(ex.what(), process->transcript()));
    }

    if (outcome.state != wait_outcome::status::ENDED) {
        LOG(INFO) << "Timeout of " << bound << "s while waiting for the program to end";
        throw job_failure(timeout_failure(bound, process->transcript()));
    }
    last_before = outcome.before;
    last_matched.clear();
    return process->exit_status();
}

void running_program::expect_exit_status(int expected, int timeout) {
    optional<int> status = expect_end(timeout);
    if (!status || *status != expected)
        throw job_failure(exit_status_failure(status, expected, process->transcript()));
}

void running_program::kill() {
    process->kill();
}

optional<int> running_program::exit_status() const {
    return process->exit_status();
}

const string &running_program::before() const {
    return last_before;
}

const string &running_program::matched() const {
    return last_matched;
}

string running_program::output() const {
    return process->transcript();
}

}  // namespace executor
