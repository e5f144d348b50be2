#include "test/validators.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <fstream>
#include <thread>
#include "common/exceptions.hpp"

namespace executor::test {
using namespace std;

struct lambda_validator : public validator {
    explicit lambda_validator(function<void(job &)> action) : action(move(action)) {}

    void validate(job &j) override {
        action(j);
    }

private:
    function<void(job &)> action;
};

lambda_validator_loader::lambda_validator_loader(function<void(job &)> action)
    : action(move(action)) {}

unique_ptr<validator> lambda_validator_loader::load(const filesystem::path &) {
    ++loads;
    return make_unique<lambda_validator>(action);
}

unique_ptr<validator> broken_validator_loader::load(const filesystem::path &dir) {
    throw validator_error("Could not find the validator script " + (dir / "validator.py").string());
}

working_directory::working_directory() {
    path = filesystem::temp_directory_path() / ("executor-test-" + boost::uuids::to_string(boost::uuids::random_generator()()));
    filesystem::create_directories(path);
}

working_directory::~working_directory() {
    error_code ec;
    filesystem::remove_all(path, ec);
}

void working_directory::write(const string &name, const string &content, bool executable) const {
    {
        ofstream fout(path / name, ios::binary);
        fout << content;
    }
    if (executable)
        filesystem::permissions(path / name,
                                filesystem::perms::owner_exec | filesystem::perms::group_exec | filesystem::perms::others_exec,
                                filesystem::perm_options::add);
}

bool process_alive(pid_t pid) {
    ifstream fin("/proc/" + to_string(pid) + "/stat");
    if (!fin) return false;
    string stat((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
    size_t pos = stat.rfind(')');
    return pos != string::npos && pos + 2 < stat.size() && stat[pos + 2] != 'Z';
}

bool wait_process_gone(pid_t pid) {
    for (int i = 0; i < 50 && process_alive(pid); ++i)
        this_thread::sleep_for(chrono::milliseconds(100));
    return !process_alive(pid);
}

executor_config test_config(int timeout) {
    executor_config config;
    config.server_address = "http://localhost:8000";
    config.secret = "49846zut93purfh977TTTiuhgalkjfnk89";
    config.uuid = "a3c0b1b6-0000-4000-8000-000000000000";
    config.timeout = timeout;
    return config;
}

}  // namespace executor::test
