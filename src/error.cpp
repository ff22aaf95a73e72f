#include "pn/error.hpp"
#include "pn/error_logger.hpp"

namespace pn {

namespace {

std::string describeException(PyObject* value) {
    if (!value) {
        return {};
    }
    PyObject* text = PyObject_Str(value);
    if (!text) {
        PyErr_Clear();
        return "<unprintable exception>";
    }
    const char* utf8 = PyUnicode_AsUTF8(text);
    std::string message = utf8 ? utf8 : "<unprintable exception>";
    if (!utf8) {
        PyErr_Clear();
    }
    Py_DECREF(text);
    return message;
}

} // namespace

// ============================================================================
// HostError Implementation
// ============================================================================

HostError::HostError(PyObject* exceptionType, const std::string& message)
    : HostError(exceptionType, nullptr, message) {}

HostError::HostError(PyObject* exceptionType, PyObject* exceptionValue, const std::string& message)
    : std::runtime_error(message),
      exceptionType_(exceptionType),
      exceptionValue_(exceptionValue) {
    Py_XINCREF(exceptionType_);
    Py_XINCREF(exceptionValue_);
}

HostError::HostError(const HostError& other)
    : std::runtime_error(other),
      exceptionType_(other.exceptionType_),
      exceptionValue_(other.exceptionValue_) {
    Py_XINCREF(exceptionType_);
    Py_XINCREF(exceptionValue_);
}

HostError& HostError::operator=(const HostError& other) {
    if (this != &other) {
        std::runtime_error::operator=(other);
        Py_XINCREF(other.exceptionType_);
        Py_XINCREF(other.exceptionValue_);
        Py_XDECREF(exceptionType_);
        Py_XDECREF(exceptionValue_);
        exceptionType_ = other.exceptionType_;
        exceptionValue_ = other.exceptionValue_;
    }
    return *this;
}

HostError::~HostError() {
    Py_XDECREF(exceptionType_);
    Py_XDECREF(exceptionValue_);
}

void HostError::restore() const {
    if (exceptionValue_) {
        PyErr_SetObject(exceptionType_, exceptionValue_);
    } else {
        PyErr_SetString(exceptionType_, what());
    }
}

bool HostError::matches(PyObject* exceptionType) const {
    return PyErr_GivenExceptionMatches(exceptionType_, exceptionType) != 0;
}

HostError HostError::fetch() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) {
        return HostError(PyExc_SystemError, "error return without exception set");
    }

    PyErr_NormalizeException(&type, &value, &traceback);
    if (traceback && value) {
        PyException_SetTraceback(value, traceback);
    }

    HostError error(type, value, describeException(value));
    Py_XDECREF(type);
    Py_XDECREF(value);
    Py_XDECREF(traceback);
    return error;
}

TypeError::TypeError(const std::string& message)
    : HostError(PyExc_TypeError, message) {}

RuntimeError::RuntimeError(const std::string& message)
    : HostError(PyExc_RuntimeError, message) {}

ValueError::ValueError(const std::string& message)
    : HostError(PyExc_ValueError, message) {}

RegistrationError::RegistrationError(const std::string& message)
    : std::logic_error(message) {}

void raiseInHost(const std::exception& error) {
    if (const auto* hostError = dynamic_cast<const HostError*>(&error)) {
        hostError->restore();
        return;
    }

    // Anything else escaping native code is a bug in the bound code.
    PN_LOG_EXCEPTION(error);
    PyErr_SetString(PyExc_RuntimeError, error.what());
}

} // namespace pn
