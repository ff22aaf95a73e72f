#pragma once

#include <Python.h>

#include <stdexcept>
#include <string>

namespace pn {

// ============================================================================
// HostError - an error that is visible to the host runtime as an exception
// ============================================================================
// Native code throws HostError (or one of its subclasses); call shims turn it
// into the pending CPython error with restore() at the C boundary.

class HostError : public std::runtime_error {
public:
    HostError(PyObject* exceptionType, const std::string& message);
    HostError(const HostError& other);
    HostError& operator=(const HostError& other);
    ~HostError() override;

    PyObject* exceptionType() const { return exceptionType_; }

    // Set this error as the pending host error.
    void restore() const;

    bool matches(PyObject* exceptionType) const;

    // Capture (and clear) the pending host error. If nothing is pending a
    // SystemError describing the missing error is returned instead.
    static HostError fetch();

private:
    HostError(PyObject* exceptionType, PyObject* exceptionValue, const std::string& message);

    // Both references are owned; the GIL is held wherever a HostError lives.
    PyObject* exceptionType_;
    PyObject* exceptionValue_{nullptr};
};

class TypeError : public HostError {
public:
    explicit TypeError(const std::string& message);
};

class RuntimeError : public HostError {
public:
    explicit RuntimeError(const std::string& message);
};

class ValueError : public HostError {
public:
    explicit ValueError(const std::string& message);
};

// Registration of a type object failed. The type stays unusable for the rest
// of the process, so this is not a HostError: it is a broken program.
class RegistrationError : public std::logic_error {
public:
    explicit RegistrationError(const std::string& message);
};

// Translate an exception escaping native code into the pending host error.
// Used by every trampoline that returns into CPython.
void raiseInHost(const std::exception& error);

} // namespace pn
