#include "build/compiler.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "process/execution.hpp"

namespace executor {
using namespace std;

const compiler_profile GCC = {"gcc", {"gcc", "-o", "{output}", "{inputs}"}, {".c"}};
const compiler_profile GPP = {"g++", {"g++", "-o", "{output}", "{inputs}"}, {".cpp", ".cc", ".cxx"}};

const compiler_profile &find_compiler(const string &name) {
    if (name == GCC.name) return GCC;
    if (name == GPP.name || name == "gpp") return GPP;
    throw invalid_argument("Unsupported compiler " + name);
}

vector<string> collect_sources(const compiler_profile &profile, const filesystem::path &dir) {
    vector<string> sources;
    for (auto &name : list_directory(dir)) {
        string ext = filesystem::path(name).extension().string();
        if (find(profile.extensions.begin(), profile.extensions.end(), ext) != profile.extensions.end() &&
            filesystem::is_regular_file(dir / name))
            sources.push_back(name);
    }
    return sources;
}

vector<string> compiler_command(const compiler_profile &profile, const filesystem::path &dir,
                                const vector<string> &inputs, const string &output) {
    vector<string> sources = inputs.empty() ? collect_sources(profile, dir) : inputs;
    vector<string> argv;
    for (auto &arg : profile.command) {
        if (arg == "{inputs}")
            argv.insert(argv.end(), sources.begin(), sources.end());
        else if (arg == "{output}")
            argv.push_back(output.empty() ? "a.out" : output);
        else
            argv.push_back(arg);
    }
    return argv;
}

result call_compiler(const compiler_profile &profile, const filesystem::path &dir,
                     const vector<string> &inputs, const string &output, int timeout) {
    auto argv = compiler_command(profile, dir, inputs, output);
    LOG(INFO) << "Compiling with " << profile.name << " in " << dir;
    return execute_program(argv, dir, timeout);
}

result call_make(const filesystem::path &dir, int timeout) {
    return execute_program({"make"}, dir, timeout);
}

}  // namespace executor
