#pragma once

#include <Python.h>
#include <boost/python.hpp>
#include <string>

namespace executor {

/**
 * @brief 在当前线程获取 GIL，析构时释放
 * 执行机在 main 中初始化解释器后会释放 GIL，之后所有调用 Python 的代码都需要
 * 先构造 GIL_guard。
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 暂时释放当前线程持有的 GIL，析构时重新获取
 */
class PyThread_guard {
public:
    PyThread_guard();
    ~PyThread_guard();

private:
    PyThreadState *state;
};

/**
 * @brief 从解释器中取出的当前 Python 异常
 * 调用 fetch 后解释器的错误标记会被清除。
 */
struct python_exception {
    boost::python::object type;
    boost::python::object value;
    boost::python::object traceback;

    /**
     * @brief 取出当前的 Python 异常
     * 必须在持有 GIL 且 PyErr_Occurred() 为真时调用
     */
    static python_exception fetch();

    /**
     * @brief 异常是否是 exception_type 或者其子类
     */
    bool matches(PyObject *exception_type) const;

    /**
     * @brief 异常的文本，即 str(exception)，为空时返回异常类型名
     */
    std::string message() const;

    /**
     * @brief 完整的异常栈，用于日志
     */
    std::string format() const;
};

}  // namespace executor
