#include "server/fetcher.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <string.h>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "job.hpp"
#include "process/execution.hpp"

namespace executor::server {
using namespace std;
namespace ba = boost::algorithm;

static string random_name() {
    return boost::uuids::to_string(boost::uuids::random_generator()());
}

static void save_file(const filesystem::path &path, const string &content) {
    ofstream fout(path, ios::binary);
    if (!fout) throw internal_error("Unable to create " + path.string());
    fout << content;
}

job_fetcher::job_fetcher(const executor_config &config) : config(config) {}

bool job_fetcher::fetch(job &j) {
    config.require_server();

    string url = config.server_address + "/jobs/?" + form_encode({{"Secret", config.secret}, {"UUID", config.uuid}});
    http_response response = http_get(url, config.http_timeout);
    if (response.status != 200) {
        LOG(INFO) << "No job available, server answered with status " << response.status;
        return false;
    }

    apply_job_headers(j, response);
    j.submission_url = config.server_address + "/jobs/";
    j.working_dir = config.working_dir / random_name();
    filesystem::create_directories(j.working_dir);
    LOG(INFO) << "Received submission file " << j.file_id << ", working dir " << j.working_dir;

    string filename = assert_safe_path(attachment_filename(response.header("Content-Disposition"), "submission"));
    filesystem::path submission = j.working_dir / filename;
    save_file(submission, response.body);
    if (is_archive(filename)) {
        unpack_archive(submission, j.working_dir, j.timeout);
        filesystem::remove(submission);
    }

    if (j.validator_url.empty())
        throw internal_error("Server did not provide a validator for submission file " + j.file_id);

    LOG(INFO) << "Downloading validator from " << j.validator_url;
    http_response validator = http_get(j.validator_url, config.http_timeout);
    if (validator.status >= 400)
        throw network_error("Unable to download validator " + j.validator_url + ", status code " + to_string(validator.status));

    string validator_name = attachment_filename(validator.header("Content-Disposition"), "validator.py");
    if (is_archive(validator_name)) {
        filesystem::path archive = j.working_dir / (random_name() + "-" + assert_safe_path(validator_name));
        save_file(archive, validator.body);
        unpack_archive(archive, j.working_dir, j.timeout);
        filesystem::remove(archive);
    } else {
        save_file(j.validator_script_name(), validator.body);
    }

    if (!filesystem::is_regular_file(j.validator_script_name()))
        throw internal_error("Validator package of submission file " + j.file_id + " does not contain validator.py");
    return true;
}

void apply_job_headers(job &j, const http_response &response) {
    j.file_id = response.header("SubmissionFileId");
    if (j.file_id.empty())
        throw internal_error("Server response does not contain SubmissionFileId");

    string timeout = response.header("Timeout");
    if (!timeout.empty()) {
        int value;
        try {
            value = boost::lexical_cast<int>(timeout);
        } catch (boost::bad_lexical_cast &) {
            throw internal_error("Server sent an invalid timeout " + timeout);
        }
        if (value <= 0)
            throw internal_error("Server sent a non-positive timeout " + timeout);
        j.timeout = value;
    }

    j.submission_id = response.header("SubmissionId");
    j.action = response.header("Action");
    j.validator_url = response.header("PostRunValidation");
    j.submitter_name = response.header("SubmitterName");
    j.submitter_student_id = response.header("SubmitterStudentId");
    j.author_names = response.header("AuthorNames");
    j.submitter_studyprogram = response.header("SubmitterStudyProgram");
    j.course = response.header("Course");
    j.assignment = response.header("Assignment");
}

string attachment_filename(const string &content_disposition, const string &def) {
    vector<string> parts;
    ba::split(parts, content_disposition, ba::is_any_of(";"));
    for (auto &part : parts) {
        string item = ba::trim_copy(part);
        if (!ba::istarts_with(item, "filename=")) continue;

        string name = ba::trim_copy_if(item.substr(strlen("filename=")), ba::is_any_of("\" "));
        name = filesystem::path(name).filename().string();
        if (!name.empty() && name != "." && name != "..") return name;
    }
    return def;
}

bool is_archive(const string &filename) {
    for (const char *ext : {".zip", ".tar", ".tar.gz", ".tgz", ".tar.bz2"})
        if (ba::iends_with(filename, ext)) return true;
    return false;
}

void unpack_archive(const filesystem::path &archive, const filesystem::path &dir, int timeout) {
    string name = archive.filename().string();
    filesystem::path staging = dir / (".unpack-" + random_name());

    vector<string> argv;
    if (ba::iends_with(name, ".zip"))
        argv = {"unzip", "-q", "-o", archive.string(), "-d", staging.string()};
    else if (ba::iends_with(name, ".tar.gz") || ba::iends_with(name, ".tgz"))
        argv = {"tar", "-xzf", archive.string(), "-C", staging.string()};
    else if (ba::iends_with(name, ".tar.bz2"))
        argv = {"tar", "-xjf", archive.string(), "-C", staging.string()};
    else if (ba::iends_with(name, ".tar"))
        argv = {"tar", "-xf", archive.string(), "-C", staging.string()};
    else
        throw internal_error("Unsupported archive format " + name);

    filesystem::create_directories(staging);
    result res = execute_program(argv, dir, timeout);
    if (!res.is_ok()) {
        filesystem::remove_all(staging);
        throw internal_error("Unable to unpack " + name + ": " + res.output);
    }

    // 压缩包中只有一个顶层文件夹时，使用文件夹中的内容
    filesystem::path source = staging;
    vector<string> entries = list_directory(staging);
    if (entries.size() == 1 && filesystem::is_directory(staging / entries[0]))
        source = staging / entries[0];

    for (auto &entry : list_directory(source)) {
        filesystem::path target = dir / entry;
        if (filesystem::exists(filesystem::symlink_status(target)))
            filesystem::remove_all(target);
        filesystem::rename(source / entry, target);
    }
    filesystem::remove_all(staging);
    LOG(INFO) << "Unpacked " << name << " into " << dir;
}

}  // namespace executor::server
