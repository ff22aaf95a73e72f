#pragma once

#include "pn/error.hpp"
#include "pn/object.hpp"

#include <Python.h>
#include <gtest/gtest.h>

#include <initializer_list>
#include <string>

namespace pn::testing {

inline OwnedRef checked(PyObject* result) {
    if (!result) {
        throw HostError::fetch();
    }
    return OwnedRef::steal(result);
}

inline OwnedRef str(const char* text) {
    return checked(PyUnicode_FromString(text));
}

inline OwnedRef integer(long value) {
    return checked(PyLong_FromLong(value));
}

// Tuple of borrowed items.
inline OwnedRef tuple(std::initializer_list<PyObject*> items) {
    OwnedRef result = checked(PyTuple_New(static_cast<Py_ssize_t>(items.size())));
    Py_ssize_t i = 0;
    for (PyObject* item : items) {
        Py_INCREF(item);
        PyTuple_SET_ITEM(result.get(), i++, item);
    }
    return result;
}

inline OwnedRef dict() {
    return checked(PyDict_New());
}

inline void setItem(PyObject* dict, const char* key, PyObject* value) {
    if (PyDict_SetItemString(dict, key, value) < 0) {
        throw HostError::fetch();
    }
}

// Fresh module-like namespace with builtins available.
inline OwnedRef scope() {
    OwnedRef globals = dict();
    setItem(globals.get(), "__builtins__", PyEval_GetBuiltins());
    return globals;
}

inline void exec(const std::string& code, PyObject* globals) {
    checked(PyRun_String(code.c_str(), Py_file_input, globals, globals));
}

inline OwnedRef eval(const std::string& expression, PyObject* globals) {
    return checked(PyRun_String(expression.c_str(), Py_eval_input, globals, globals));
}

inline std::string text(PyObject* object) {
    OwnedRef repr = checked(PyObject_Str(object));
    return PyUnicode_AsUTF8(repr.get());
}

// Evaluates an expression that must raise; returns "TypeName: message".
inline std::string raised(const std::string& expression, PyObject* globals) {
    PyObject* result = PyRun_String(expression.c_str(), Py_eval_input, globals, globals);
    if (result) {
        Py_DECREF(result);
        return "<no exception>";
    }
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    std::string description = reinterpret_cast<PyTypeObject*>(type)->tp_name;
    description += ": " + text(value);
    Py_XDECREF(type);
    Py_XDECREF(value);
    Py_XDECREF(traceback);
    return description;
}

} // namespace pn::testing
