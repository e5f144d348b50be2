#include "job.hpp"
#include <fnmatch.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "failure.hpp"
#include "process/execution.hpp"
#include "process/interactive_process.hpp"

namespace executor {
using namespace std;

job::job(const executor_config &config, server::result_reporter &reporter, validator_loader &loader, bool online)
    : timeout(config.timeout), config(config), reporter(reporter), loader(loader), online(online) {}

void job::run_validate() {
    LOG(INFO) << "Validating " << *this;

    try {
        unique_ptr<validator> v = loader.load(working_dir);
        v->validate(*this);
    } catch (job_failure &ex) {
        LOG(INFO) << "Validation of submission file " << file_id << " failed ("
                  << get_display_message(ex.info().kind) << "): " << ex.what();
        report_failure(ex.info());
        return;
    } catch (network_error &) {
        // 上报本身失败了，再次上报也没有意义
        throw;
    } catch (executor_exception &ex) {
        LOG(WARNING) << "Validator of submission file " << file_id << " crashed: " << ex;
        report_failure(internal_failure(ex.what()));
        return;
    } catch (exception &ex) {
        LOG(WARNING) << "Validator of submission file " << file_id << " crashed: " << boost::diagnostic_information(ex);
        report_failure(internal_failure(ex.what()));
        return;
    }

    if (!result_sent) {
        LOG(INFO) << "Validator of submission file " << file_id << " did not report a result, assuming success";
        send_pass_result();
    }
}

void job::report_failure(const failure &info) {
    send_result(info.student_message, info.tutor_message, info.error_code);
}

void job::send_result(const string &student_message, const string &tutor_message, int error_code) {
    if (result_sent) {
        LOG(WARNING) << "Result of submission file " << file_id << " has already been sent, dropping "
                     << "error code " << error_code << ": " << tutor_message;
        return;
    }

    server::result_report report;
    report.submission_file_id = file_id;
    report.message = student_message;
    report.action = action;
    report.message_tutor = tutor_message;
    report.executor_dir = working_dir.string();
    report.error_code = error_code;
    report.secret = config.secret;
    report.uuid = config.uuid;
    last_report = report;

    LOG(INFO) << "Result of submission file " << file_id << ": error code " << error_code
              << ", action " << action << ", secret " << (config.secret.empty() ? "<none>" : "<masked>")
              << ", message: " << student_message;

    if (online)
        reporter.send(report);
    result_sent = true;
}

void job::send_pass_result(const string &student_message, const string &tutor_message) {
    send_result(student_message, tutor_message, E_SUCCESS);
}

void job::send_fail_result(const string &student_message, const string &tutor_message) {
    send_result(student_message, tutor_message, E_UNSPECIFIC);
}

void job::run_configure(bool mandatory) {
    if (!filesystem::exists(working_dir / "configure")) {
        failure info = tool_failure(
            "Could not find a configure script for execution.",
            "Could not find a configure script for execution in " + working_dir.string() + ".",
            "", E_UNSPECIFIC);
        if (mandatory) throw job_failure(info);
        LOG(INFO) << "No configure script in " << working_dir << ", skipping";
        return;
    }

    LOG(INFO) << "Running ./configure in " << working_dir;
    try {
        auto program = spawn_program("configure", {}, timeout);
        result res;
        res.exit_status = program->expect_end();
        res.output = program->output();
        res.ok = res.exit_status && *res.exit_status == 0;
        if (!res.is_ok())
            throw job_failure(tool_failure("configure", "./configure", res, E_UNSPECIFIC));
    } catch (job_failure &ex) {
        if (mandatory) throw;
        LOG(INFO) << "Optional configure failed: " << ex.what();
    }
}

void job::run_make(bool mandatory) {
    LOG(INFO) << "Running make in " << working_dir;
    result res = call_make(working_dir, timeout);
    if (res.is_ok()) return;

    failure info = tool_failure("make", "make", res, E_UNSPECIFIC);
    if (mandatory) throw job_failure(info);
    LOG(INFO) << "Optional make failed: " << info.tutor_message;
}

void job::run_compiler(const compiler_profile &compiler, const vector<string> &inputs, const string &output) {
    result res = call_compiler(compiler, working_dir, inputs, output, timeout);
    if (!res.is_ok()) {
        string command = join_command(compiler_command(compiler, working_dir, inputs, output));
        throw job_failure(tool_failure("Compilation", command, res, E_UNSPECIFIC));
    }
}

void job::run_build(const compiler_profile &compiler, const vector<string> &inputs, const string &output) {
    run_configure(false);
    run_make(false);
    run_compiler(compiler, inputs, output);
}

const compiler_profile &job::default_compiler() const {
    return find_compiler(config.compiler);
}

vector<string> job::command_line(const string &name, const vector<string> &arguments) const {
    vector<string> argv;
    if (name.find('/') == string::npos && filesystem::is_regular_file(working_dir / name))
        argv.push_back("./" + name);
    else
        argv.push_back(name);
    argv.insert(argv.end(), arguments.begin(), arguments.end());
    return argv;
}

shared_ptr<running_program> job::spawn_program(const string &name, const vector<string> &arguments, int timeout, bool exclusive) {
    if (exclusive) kill_longrunning();

    auto argv = command_line(name, arguments);
    try {
        auto process = make_unique<local_process>(argv, working_dir);
        return make_shared<running_program>(move(process), timeout < 0 ? this->timeout : timeout);
    } catch (system_error &ex) {
        LOG(INFO) << "Unable to spawn " << join_command(argv) << ": " << ex.what();
        throw job_failure(process_failure(ex.what(), ""));
    }
}

result job::run_program(const string &name, const vector<string> &arguments, int timeout, bool exclusive) {
    if (exclusive) kill_longrunning();

    auto argv = command_line(name, arguments);
    result res = execute_program(argv, working_dir, timeout < 0 ? this->timeout : timeout);
    if (!res.is_ok()) {
        int code = res.exit_status && *res.exit_status != 0 ? *res.exit_status : E_UNSPECIFIC;
        throw job_failure(tool_failure("Execution of " + name, join_command(argv), res, code));
    }
    return res;
}

bool job::ensure_files(const vector<string> &filenames) const {
    vector<string> content = list_directory(working_dir);
    for (auto &name : filenames)
        if (find(content.begin(), content.end(), name) == content.end()) {
            LOG(INFO) << "Missing file " << name << " in " << working_dir;
            return false;
        }
    return true;
}

vector<string> job::find_keywords(const vector<string> &keywords, const string &file_pattern) const {
    vector<string> found;
    for (auto &name : list_directory(working_dir)) {
        if (fnmatch(file_pattern.c_str(), name.c_str(), 0) != 0) continue;
        if (!filesystem::is_regular_file(working_dir / name)) continue;

        string content = read_file_content(working_dir / name);
        bool all = all_of(keywords.begin(), keywords.end(), [&](const string &keyword) {
            return content.find(keyword) != string::npos;
        });
        if (all) found.push_back(name);
    }
    return found;
}

vector<string> job::delete_binaries() {
    vector<filesystem::path> binaries;
    for (auto &entry : filesystem::recursive_directory_iterator(working_dir))
        if (entry.is_regular_file() && is_elf_binary(entry.path()))
            binaries.push_back(entry.path());

    vector<string> deleted;
    for (auto &path : binaries) {
        LOG(INFO) << "Deleting binary " << path;
        filesystem::remove(path);
        deleted.push_back(filesystem::relative(path, working_dir).string());
    }
    sort(deleted.begin(), deleted.end());
    return deleted;
}

filesystem::path job::validator_script_name() const {
    return working_dir / "validator.py";
}

bool job::is_online() const {
    return online;
}

ostream &operator<<(ostream &os, const job &j) {
    os << "job{submission " << j.submission_id << ", file " << j.file_id
       << ", working dir " << j.working_dir << ", timeout " << j.timeout << "s"
       << ", action " << j.action << ", submitter " << j.submitter_name
       << ", course " << j.course << ", assignment " << j.assignment << "}";
    return os;
}

}  // namespace executor
