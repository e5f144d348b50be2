#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "job.hpp"
#include "server/fetcher.hpp"
#include "server/reporter.hpp"
#include "validator/python_validator.hpp"
using namespace std;

static void print_report(const executor::job& j) {
    if (!j.last_report) {
        cout << "No result was produced" << endl;
        return;
    }
    const auto& report = *j.last_report;
    cout << "ErrorCode: " << report.error_code << endl
         << "Message: " << report.message << endl
         << "MessageTutor: " << report.message_tutor << endl;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("executor options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file. You can either pass it from environ EXECUTOR_CONFIG")
        ("offline", "run the validator without sending the result to the server")
        ("test", po::value<string>(), "run the validator in the given directory offline and print the result, instead of fetching a job")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "Executor: Fetch a job from the submission server, run its validator and report the result" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "executor 1.0" << endl;
        return EXIT_SUCCESS;
    }

    string config_path;
    if (vm.count("config")) {
        config_path = vm.at("config").as<string>();
    } else {
        config_path = executor::get_env("EXECUTOR_CONFIG", "/etc/executor/executor.json");
    }

    bool test_mode = vm.count("test") > 0;
    executor::executor_config config;
    if (filesystem::is_regular_file(config_path)) {
        try {
            config = executor::executor_config::load(config_path);
        } catch (std::exception& e) {
            LOG(FATAL) << "Configuration file " << config_path << " is malformed: " << e.what();
        }
    } else {
        CHECK(test_mode) << "Configuration file " << config_path << " does not exist";
        LOG(INFO) << "Configuration file " << config_path << " does not exist, using defaults";
    }

    string workdir = executor::get_env("EXECUTOR_WORKDIR", "");
    if (!workdir.empty()) config.working_dir = workdir;

    // 向已经退出的学生程序写入数据时不能让执行机被 SIGPIPE 杀死
    signal(SIGPIPE, SIG_IGN);
    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) << "Unable to initialize libcurl";
    executor::initialize_python(argv[0]);
    executor::PyThread_guard guard;

    bool online = !test_mode && !vm.count("offline");
    executor::server::http_reporter reporter(config.server_address, config.http_timeout);
    executor::python_validator_loader loader;
    executor::job current(config, reporter, loader, online);

    defer {
        if (!test_mode && config.cleanup && !current.working_dir.empty()) {
            error_code ec;
            filesystem::remove_all(current.working_dir, ec);
            if (ec) LOG(WARNING) << "Unable to remove " << current.working_dir << ": " << ec.message();
        }
    };

    try {
        if (test_mode) {
            current.working_dir = filesystem::absolute(vm.at("test").as<string>());
            CHECK(filesystem::is_directory(current.working_dir))
                << "Directory " << current.working_dir << " does not exist";
            current.run_validate();
            print_report(current);
            return EXIT_SUCCESS;
        }

        executor::server::job_fetcher fetcher(config);
        if (!fetcher.fetch(current)) {
            LOG(INFO) << "No job to validate";
            return EXIT_SUCCESS;
        }

        current.run_validate();
        if (!online) print_report(current);
    } catch (executor::executor_exception& ex) {
        LOG(ERROR) << "Unable to process job: " << ex;
        return EXIT_FAILURE;
    } catch (std::exception& ex) {
        LOG(ERROR) << "Unable to process job: " << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
