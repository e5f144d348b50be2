#include "validator/python_validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <map>
#include <mutex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "failure.hpp"
#include "job.hpp"

namespace executor {
using namespace std;
namespace bp = boost::python;

static mutex registry_mutex;
// 工作路径 -> 已经加载过的次数
static map<string, int> module_versions;

string next_module_name(const filesystem::path &dir) {
    string key = filesystem::absolute(dir).lexically_normal().string();
    lock_guard<mutex> guard(registry_mutex);
    int version = ++module_versions[key];
    return fmt::format("validator_{:x}_{}", hash<string>()(key), version);
}

/**
 * @brief 将 Python 异常转换为 C++ 异常
 * executor.JobFailure 会还原为 job_failure，其他异常作为验证脚本的错误。
 */
[[noreturn]] static void rethrow_python_exception(const python_exception &ex, const string &context) {
    if (ex.matches(job_failure_type())) {
        try {
            bp::object args = ex.value.attr("args");
            if (bp::len(args) >= 2) {
                bp::object value = args[1];
                bp::extract<failure> info(value);
                if (info.check()) throw job_failure(info());
            }
        } catch (bp::error_already_set &) {
            PyErr_Clear();
        }
    }

    LOG(WARNING) << context << " raised an exception:\n" << ex.format();
    throw validator_error(ex.message());
}

/**
 * @brief 从 sys.modules 中移除验证脚本以及从工作路径导入的模块
 * 需要持有 GIL。
 */
static void drop_modules(const filesystem::path &dir, const string &module_name) {
    string prefix = dir.string();
    if (prefix.empty() || prefix.back() != '/') prefix += '/';

    try {
        bp::object modules = bp::import("sys").attr("modules");
        bp::list names = bp::list(modules.attr("keys")());
        for (bp::ssize_t i = 0; i < bp::len(names); ++i) {
            bp::object name = names[i];
            bp::object module = modules[name];
            bp::object file = bp::getattr(module, "__file__", bp::object());
            bool under_dir = false;
            if (!file.is_none()) {
                bp::extract<string> path(file);
                under_dir = path.check() && path().compare(0, prefix.size(), prefix) == 0;
            }
            if (under_dir || bp::extract<string>(name)() == module_name) {
                DLOG(INFO) << "Dropping module " << bp::extract<string>(name)();
                modules.attr("pop")(name, bp::object());
            }
        }
    } catch (bp::error_already_set &) {
        python_exception ex = python_exception::fetch();
        LOG(ERROR) << "Unable to drop modules of " << dir << ": " << ex.message();
    }
}

/**
 * @brief 在 sys.path 最前面插入 dir，返回原来的 sys.path
 */
static bp::object push_search_path(const filesystem::path &dir) {
    bp::object sys = bp::import("sys");
    bp::object saved = sys.attr("path");
    bp::list search_path;
    search_path.append(dir.string());
    search_path.extend(saved);
    sys.attr("path") = search_path;
    return saved;
}

/**
 * @brief 恢复 sys.path，不影响正在传播的 Python 异常
 */
static void restore_search_path(const bp::object &saved) {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    if (PySys_SetObject("path", saved.ptr()) != 0) {
        PyErr_Clear();
        LOG(ERROR) << "Unable to restore sys.path";
    }
    PyErr_Restore(type, value, traceback);
}

python_validator::python_validator(const filesystem::path &dir, const string &module_name, bp::object module)
    : dir(dir), module_name(module_name), module(move(module)) {}

python_validator::~python_validator() {
    GIL_guard guard;
    module.reset();
    drop_modules(dir, module_name);
}

void python_validator::validate(job &j) {
    GIL_guard guard;
    try {
        bp::object saved_path = push_search_path(dir);
        defer { restore_search_path(saved_path); };

        module->attr("validate")(bp::ptr(&j));
    } catch (bp::error_already_set &) {
        rethrow_python_exception(python_exception::fetch(), "validate() of " + (dir / "validator.py").string());
    }
}

unique_ptr<validator> python_validator_loader::load(const filesystem::path &dir) {
    filesystem::path root = filesystem::absolute(dir).lexically_normal();
    filesystem::path script = root / "validator.py";
    if (!filesystem::is_regular_file(script))
        throw validator_error("Could not find the validator script " + script.string());

    string module_name = next_module_name(root);
    LOG(INFO) << "Loading " << script << " as module " << module_name;

    GIL_guard guard;
    try {
        bp::object saved_path = push_search_path(root);
        defer { restore_search_path(saved_path); };

        bp::object sys = bp::import("sys");
        bp::object util = bp::import("importlib.util");
        bp::object spec = util.attr("spec_from_file_location")(module_name, script.string());
        bp::object module = util.attr("module_from_spec")(spec);
        sys.attr("modules")[module_name] = module;
        spec.attr("loader").attr("exec_module")(module);

        if (!PyObject_HasAttrString(module.ptr(), "validate")) {
            drop_modules(root, module_name);
            throw validator_error("The validator script " + script.string() + " does not define validate(job)");
        }
        return make_unique<python_validator>(root, module_name, module);
    } catch (bp::error_already_set &) {
        python_exception ex = python_exception::fetch();
        drop_modules(root, module_name);
        rethrow_python_exception(ex, "Loading " + script.string());
    }
}

}  // namespace executor
