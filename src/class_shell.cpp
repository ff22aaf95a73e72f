#include "pn/class_shell.hpp"

namespace pn::detail {

namespace {

void tpFreeFallback(PyObject* obj) {
    PyTypeObject* type = Py_TYPE(obj);
    if (PyType_IS_GC(type)) {
        PyObject_GC_Del(obj);
    } else {
        PyObject_Free(obj);
    }
    if (type->tp_flags & Py_TPFLAGS_HEAPTYPE) {
        Py_DECREF(type);
    }
}

} // namespace

void freeObject(PyObject* obj) {
    PyTypeObject* type = Py_TYPE(obj);
    if (type->tp_free) {
        type->tp_free(obj);
    } else {
        tpFreeFallback(obj);
    }
}

void clearNativeBase(PyObject* obj, PyTypeObject* nativeRoot) {
    if (nativeRoot != &PyBaseObject_Type && nativeRoot->tp_clear) {
        nativeRoot->tp_clear(obj);
    }
}

int traverseNativeBase(PyObject* obj, PyTypeObject* nativeRoot, visitproc visit, void* arg) {
    if (nativeRoot != &PyBaseObject_Type && nativeRoot->tp_traverse) {
        return nativeRoot->tp_traverse(obj, visit, arg);
    }
    return 0;
}

void discardAllocation(PyObject* obj, PyTypeObject* nativeRoot) {
    PyTypeObject* type = Py_TYPE(obj);
    if (PyType_IS_GC(type) && PyObject_GC_IsTracked(obj)) {
        PyObject_GC_UnTrack(obj);
    }

    // State the native base may already hold (exception args and the like).
    clearNativeBase(obj, nativeRoot);

    if (type->tp_free) {
        type->tp_free(obj);
        // tp_alloc took a reference to heap types for this instance.
        if (type->tp_flags & Py_TPFLAGS_HEAPTYPE) {
            Py_DECREF(type);
        }
    } else {
        tpFreeFallback(obj);
    }
}

} // namespace pn::detail
