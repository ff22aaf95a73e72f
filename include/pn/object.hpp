#pragma once

#include <Python.h>

#include <utility>

namespace pn {

// Owning reference to a host object. Copying adds a reference, destruction
// drops one; the GIL must be held for both.
class OwnedRef {
public:
    OwnedRef() = default;
    OwnedRef(const OwnedRef& other) : ptr_(other.ptr_) { Py_XINCREF(ptr_); }
    OwnedRef(OwnedRef&& other) noexcept : ptr_(std::exchange(other.ptr_, nullptr)) {}
    ~OwnedRef() { Py_XDECREF(ptr_); }

    OwnedRef& operator=(OwnedRef other) noexcept {
        std::swap(ptr_, other.ptr_);
        return *this;
    }

    // Take over a new reference (e.g. the result of a C API call).
    static OwnedRef steal(PyObject* ptr) { return OwnedRef(ptr); }
    // Add a reference to a borrowed pointer.
    static OwnedRef borrow(PyObject* ptr) {
        Py_XINCREF(ptr);
        return OwnedRef(ptr);
    }

    PyObject* get() const { return ptr_; }
    PyObject* release() { return std::exchange(ptr_, nullptr); }
    explicit operator bool() const { return ptr_ != nullptr; }

private:
    explicit OwnedRef(PyObject* ptr) : ptr_(ptr) {}

    PyObject* ptr_{nullptr};
};

} // namespace pn
