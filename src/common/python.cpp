#include "common/python.hpp"

namespace executor {
namespace bp = boost::python;

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

PyThread_guard::PyThread_guard() {
    state = PyEval_SaveThread();
}

PyThread_guard::~PyThread_guard() {
    PyEval_RestoreThread(state);
}

static bp::object adopt(PyObject *ptr) {
    if (!ptr) return bp::object();
    return bp::object(bp::handle<>(ptr));
}

python_exception python_exception::fetch() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    if (traceback && value) PyException_SetTraceback(value, traceback);

    python_exception ex;
    ex.type = adopt(type);
    ex.value = adopt(value);
    ex.traceback = adopt(traceback);
    return ex;
}

bool python_exception::matches(PyObject *exception_type) const {
    return !type.is_none() && PyErr_GivenExceptionMatches(type.ptr(), exception_type);
}

std::string python_exception::message() const {
    try {
        std::string text = bp::extract<std::string>(bp::str(value));
        if (!text.empty()) return text;
        return bp::extract<std::string>(type.attr("__name__"));
    } catch (bp::error_already_set &) {
        PyErr_Clear();
        return "unprintable Python exception";
    }
}

std::string python_exception::format() const {
    try {
        bp::object traceback_module = bp::import("traceback");
        bp::object lines = traceback_module.attr("format_exception")(type, value, traceback);
        return bp::extract<std::string>(bp::str("").attr("join")(lines));
    } catch (bp::error_already_set &) {
        PyErr_Clear();
        return message();
    }
}

}  // namespace executor
