#include "common/utils.hpp"
#include <stdlib.h>
#include <boost/algorithm/string/join.hpp>

namespace executor {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string join_command(const vector<string> &argv) {
    vector<string> quoted;
    for (auto &arg : argv) {
        if (arg.empty() || arg.find_first_of(" \t\n'\"") != string::npos)
            quoted.push_back("'" + arg + "'");
        else
            quoted.push_back(arg);
    }
    return boost::algorithm::join(quoted, " ");
}

}  // namespace executor
