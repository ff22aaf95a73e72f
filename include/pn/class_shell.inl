// Template implementations for class_shell.hpp
// This file is automatically included by class_shell.hpp

#pragma once

#include <string>

namespace pn {

// ============================================================================
// Initializer
// ============================================================================

template<PyClass T>
void Initializer<T>::applyTo(PyObject* obj) && {
    T* slot = ClassShell<T>::payload(obj);
    bool written = false;

    if (value_) {
        ::new (static_cast<void*>(slot)) T(std::move(*value_));
        value_.reset();
        written = true;
    } else if constexpr (ClassLayout<T>::needInit) {
        throw RuntimeError("Base class '" + std::string(ClassInfo<T>::name) + "' is not initialized");
    }

    if constexpr (PyClass<Base>) {
        try {
            if (superInit_) {
                std::unique_ptr<Initializer<Base>> super = std::move(superInit_);
                std::move(*super).applyTo(obj);
            } else if constexpr (ClassLayout<Base>::needInit) {
                throw RuntimeError("Base class '" + std::string(ClassInfo<Base>::name) + "' is not initialized");
            }
        } catch (...) {
            if (written) {
                slot->~T();
            }
            throw;
        }
    }
}

// ============================================================================
// ClassShell - access
// ============================================================================

template<PyClass T>
bool ClassShell<T>::isInstance(PyObject* obj) {
    return obj && PyObject_TypeCheck(obj, typeObject<T>());
}

template<PyClass T>
ClassShell<T> ClassShell<T>::cast(PyObject* obj) {
    if (!isInstance(obj)) {
        const char* actual = obj ? Py_TYPE(obj)->tp_name : "NULL";
        throw TypeError("'" + std::string(actual) + "' object cannot be converted to '" +
                        std::string(Info::name) + "'");
    }
    return ClassShell(obj);
}

// ============================================================================
// ClassShell - construction
// ============================================================================

template<PyClass T>
template<typename U>
    requires IntoInitializer<U, T>
ShellRef<T> ClassShell<T>::newRef(U&& value) {
    return ShellRef<T>(create(typeObject<T>(), intoInitializer<T>(std::forward<U>(value))));
}

template<PyClass T>
template<typename U>
    requires IntoInitializer<U, T>
ShellMut<T> ClassShell<T>::newMut(U&& value) {
    return ShellMut<T>(create(typeObject<T>(), intoInitializer<T>(std::forward<U>(value))));
}

template<PyClass T>
OwnedRef ClassShell<T>::create(PyTypeObject* subtype, Initializer<T> initializer) {
    PyObject* obj = allocate(subtype);
    try {
        std::move(initializer).applyTo(obj);
    } catch (...) {
        detail::discardAllocation(obj, NativeRoot::typeObject());
        throw;
    }
    return OwnedRef::steal(obj);
}

template<PyClass T>
PyObject* ClassShell<T>::allocate(PyTypeObject* subtype) {
    // Registration of T (and its bases) happens here at the latest.
    PyTypeObject* type = typeObject<T>();
    if (!subtype) {
        subtype = type;
    }

    PyObject* obj = nullptr;
    PyTypeObject* root = NativeRoot::typeObject();
    constexpr bool extended = (classFlags<Info>() & TypeFlags::Extended) != 0;
    if (extended && root != &PyBaseObject_Type && root->tp_new) {
        OwnedRef noArgs = OwnedRef::steal(PyTuple_New(0));
        if (!noArgs) {
            throw HostError::fetch();
        }
        obj = root->tp_new(subtype, noArgs.get(), nullptr);
    } else {
        allocfunc alloc = subtype->tp_alloc ? subtype->tp_alloc : PyType_GenericAlloc;
        obj = alloc(subtype, 0);
    }
    if (!obj) {
        throw HostError::fetch();
    }

    resetSlots(obj);
    return obj;
}

template<PyClass T>
void ClassShell<T>::resetSlots(PyObject* obj) {
    if constexpr (Layout::hasDict) {
        *slotAt(obj, Layout::dictOffset) = nullptr;
    }
    if constexpr (Layout::hasWeakRef) {
        *slotAt(obj, Layout::weakrefOffset) = nullptr;
    }
    if constexpr (PyClass<Base>) {
        ClassShell<Base>::resetSlots(obj);
    }
}

// ============================================================================
// ClassShell - type slots
// ============================================================================

template<PyClass T>
void ClassShell<T>::drop(PyObject* obj) {
    payload(obj)->~T();

    if constexpr (Layout::hasDict) {
        Py_CLEAR(*slotAt(obj, Layout::dictOffset));
    }
    if constexpr (Layout::hasWeakRef) {
        if (*slotAt(obj, Layout::weakrefOffset)) {
            PyObject_ClearWeakRefs(obj);
        }
    }

    if constexpr (PyClass<Base>) {
        ClassShell<Base>::drop(obj);
    } else {
        detail::clearNativeBase(obj, Base::typeObject());
    }
}

template<PyClass T>
void ClassShell<T>::dealloc(PyObject* obj) {
    if (PyType_IS_GC(Py_TYPE(obj))) {
        PyObject_GC_UnTrack(obj);
    }

    drop(obj);

    if (PyObject_CallFinalizerFromDealloc(obj) < 0) {
        return;  // resurrected
    }

    detail::freeObject(obj);
}

template<PyClass T>
int ClassShell<T>::traverse(PyObject* obj, visitproc visit, void* arg) {
    if constexpr (Layout::hasDict) {
        Py_VISIT(*slotAt(obj, Layout::dictOffset));
    }
    if constexpr (HasGcSlots<Info>) {
        const GcSlots slots = Info::gcSlots();
        if (slots.traverse) {
            if (const int result = slots.traverse(obj, visit, arg)) {
                return result;
            }
        }
    }
    if constexpr (PyClass<Base>) {
        return ClassShell<Base>::traverse(obj, visit, arg);
    } else {
        return detail::traverseNativeBase(obj, Base::typeObject(), visit, arg);
    }
}

template<PyClass T>
int ClassShell<T>::clear(PyObject* obj) {
    if constexpr (Layout::hasDict) {
        Py_CLEAR(*slotAt(obj, Layout::dictOffset));
    }
    if constexpr (HasGcSlots<Info>) {
        const GcSlots slots = Info::gcSlots();
        if (slots.clear) {
            if (const int result = slots.clear(obj)) {
                return result;
            }
        }
    }
    if constexpr (PyClass<Base>) {
        return ClassShell<Base>::clear(obj);
    } else {
        detail::clearNativeBase(obj, Base::typeObject());
        return 0;
    }
}

} // namespace pn
