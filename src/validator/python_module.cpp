#include <glog/logging.h>
#include <boost/python/stl_iterator.hpp>
#include "build/compiler.hpp"
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "failure.hpp"
#include "job.hpp"
#include "process/result.hpp"
#include "process/running_program.hpp"
#include "validator/python_validator.hpp"

using namespace std;
using namespace executor;
namespace bp = boost::python;

static PyObject *job_failure_exception = nullptr;

PyObject *executor::job_failure_type() {
    return job_failure_exception;
}

static void translate_job_failure(const job_failure &ex) {
    // args 为 (给助教的信息, Failure)，以便在验证脚本外还原失败信息
    bp::tuple args = bp::make_tuple(string(ex.what()), ex.info());
    PyErr_SetObject(job_failure_exception, args.ptr());
}

static vector<string> to_strings(const bp::object &value) {
    if (value.is_none()) return {};
    bp::extract<string> single(value);
    if (single.check()) return {single()};
    return vector<string>(bp::stl_input_iterator<string>(value), bp::stl_input_iterator<string>());
}

static bp::list to_list(const vector<string> &values) {
    bp::list list;
    for (auto &value : values) list.append(value);
    return list;
}

static bp::object to_object(const optional<int> &value) {
    return value ? bp::object(*value) : bp::object();
}

static string optional_string(const bp::object &value) {
    return value.is_none() ? "" : bp::extract<string>(value)();
}

static string job_working_dir(const job &j) {
    return j.working_dir.string();
}

static string job_validator_script_name(const job &j) {
    return j.validator_script_name().string();
}

static const compiler_profile &select_compiler(const job &j, const bp::object &compiler) {
    if (compiler.is_none()) return j.default_compiler();
    return bp::extract<const compiler_profile &>(compiler)();
}

static void job_run_compiler(job &j, const bp::object &compiler, const bp::object &inputs, const bp::object &output) {
    j.run_compiler(select_compiler(j, compiler), to_strings(inputs), optional_string(output));
}

static void job_run_build(job &j, const bp::object &compiler, const bp::object &inputs, const bp::object &output) {
    j.run_build(select_compiler(j, compiler), to_strings(inputs), optional_string(output));
}

static shared_ptr<running_program> job_spawn_program(job &j, const string &name, const bp::object &arguments, int timeout, bool exclusive) {
    return j.spawn_program(name, to_strings(arguments), timeout, exclusive);
}

static result job_run_program(job &j, const string &name, const bp::object &arguments, int timeout, bool exclusive) {
    return j.run_program(name, to_strings(arguments), timeout, exclusive);
}

static bool job_ensure_files(const job &j, const bp::object &filenames) {
    return j.ensure_files(to_strings(filenames));
}

static bp::list job_find_keywords(const job &j, const bp::object &keywords, const string &file_pattern) {
    return to_list(j.find_keywords(to_strings(keywords), file_pattern));
}

static bp::list job_delete_binaries(job &j) {
    return to_list(j.delete_binaries());
}

static bp::object program_expect_end(running_program &program, int timeout) {
    return to_object(program.expect_end(timeout));
}

static bp::object program_exit_status(const running_program &program) {
    return to_object(program.exit_status());
}

static bp::object result_exit_status(const result &res) {
    return to_object(res.exit_status);
}

static string failure_kind_name(const failure &info) {
    return get_display_message(info.kind);
}

BOOST_PYTHON_MODULE(executor) {
    bp::class_<failure>("Failure")
        .add_property("kind", &failure_kind_name)
        .def_readonly("student_message", &failure::student_message)
        .def_readonly("tutor_message", &failure::tutor_message)
        .def_readonly("error_code", &failure::error_code)
        .def_readonly("output", &failure::output);

    job_failure_exception = PyErr_NewException("executor.JobFailure", PyExc_Exception, nullptr);
    bp::scope().attr("JobFailure") = bp::object(bp::handle<>(bp::borrowed(job_failure_exception)));
    bp::register_exception_translator<job_failure>(&translate_job_failure);

    bp::class_<compiler_profile>("Compiler", bp::no_init)
        .def_readonly("name", &compiler_profile::name);
    bp::scope().attr("GCC") = GCC;
    bp::scope().attr("GPP") = GPP;

    bp::class_<result>("Result")
        .def("is_ok", &result::is_ok)
        .def_readonly("output", &result::output)
        .def_readonly("timed_out", &result::timed_out)
        .add_property("exit_status", &result_exit_status);

    bp::class_<running_program, shared_ptr<running_program>, boost::noncopyable>("RunningProgram", bp::no_init)
        .def("expect", &running_program::expect, (bp::arg("pattern"), bp::arg("timeout") = -1))
        .def("expect_exact", &running_program::expect_exact, (bp::arg("text"), bp::arg("timeout") = -1))
        .def("send", &running_program::send, (bp::arg("text")))
        .def("sendline", &running_program::sendline, (bp::arg("text") = ""))
        .def("expect_end", &program_expect_end, (bp::arg("self"), bp::arg("timeout") = -1))
        .def("expect_exit_status", &running_program::expect_exit_status, (bp::arg("expected"), bp::arg("timeout") = -1))
        .def("kill", &running_program::kill)
        .add_property("exit_status", &program_exit_status)
        .add_property("before", bp::make_function(&running_program::before, bp::return_value_policy<bp::copy_const_reference>()))
        .add_property("after", bp::make_function(&running_program::matched, bp::return_value_policy<bp::copy_const_reference>()))
        .add_property("output", &running_program::output);

    bp::class_<job, boost::noncopyable>("Job", bp::no_init)
        .add_property("working_dir", &job_working_dir)
        .add_property("validator_script_name", &job_validator_script_name)
        .def_readonly("submission_url", &job::submission_url)
        .def_readonly("validator_url", &job::validator_url)
        .def_readonly("timeout", &job::timeout)
        .def_readonly("submission_id", &job::submission_id)
        .def_readonly("file_id", &job::file_id)
        .def_readonly("action", &job::action)
        .def_readonly("submitter_name", &job::submitter_name)
        .def_readonly("submitter_student_id", &job::submitter_student_id)
        .def_readonly("author_names", &job::author_names)
        .def_readonly("submitter_studyprogram", &job::submitter_studyprogram)
        .def_readonly("course", &job::course)
        .def_readonly("assignment", &job::assignment)
        .def_readonly("result_sent", &job::result_sent)
        .def("send_pass_result", &job::send_pass_result,
             (bp::arg("info_student") = "All tests passed. Awesome!", bp::arg("info_tutor") = "All tests passed."))
        .def("send_fail_result", &job::send_fail_result, (bp::arg("info_student"), bp::arg("info_tutor")))
        .def("run_configure", &job::run_configure, (bp::arg("mandatory") = true))
        .def("run_make", &job::run_make, (bp::arg("mandatory") = true))
        .def("run_compiler", &job_run_compiler,
             (bp::arg("self"), bp::arg("compiler") = bp::object(), bp::arg("inputs") = bp::object(), bp::arg("output") = bp::object()))
        .def("run_build", &job_run_build,
             (bp::arg("self"), bp::arg("compiler") = bp::object(), bp::arg("inputs") = bp::object(), bp::arg("output") = bp::object()))
        .def("spawn_program", &job_spawn_program,
             (bp::arg("self"), bp::arg("name"), bp::arg("arguments") = bp::list(), bp::arg("timeout") = -1, bp::arg("exclusive") = false))
        .def("run_program", &job_run_program,
             (bp::arg("self"), bp::arg("name"), bp::arg("arguments") = bp::list(), bp::arg("timeout") = -1, bp::arg("exclusive") = false))
        .def("ensure_files", &job_ensure_files, (bp::arg("self"), bp::arg("filenames")))
        .def("find_keywords", &job_find_keywords, (bp::arg("self"), bp::arg("keywords"), bp::arg("filepattern")))
        .def("delete_binaries", &job_delete_binaries);
}

void executor::initialize_python(const char *program_name) {
    if (PyImport_AppendInittab("executor", &PyInit_executor) == -1)
        throw internal_error("Unable to register the executor Python module");

    wchar_t *name = Py_DecodeLocale(program_name, nullptr);
    if (name) Py_SetProgramName(name);
    Py_Initialize();

    try {
        bp::import("executor");
        // 验证脚本可能在同一秒内被替换，不能使用缓存的字节码
        bp::import("sys").attr("dont_write_bytecode") = true;
    } catch (bp::error_already_set &) {
        python_exception ex = python_exception::fetch();
        throw internal_error("Unable to initialize Python: " + ex.format());
    }
    LOG(INFO) << "Python " << Py_GetVersion() << " initialized";
}
