#pragma once

#include "pn/class_info.hpp"
#include "pn/class_shell.hpp"
#include "pn/layout.hpp"
#include "pn/type_registry.hpp"

#include <Python.h>

namespace pn {

// ============================================================================
// Per-class registration
// ============================================================================

template<PyClass T>
TypeRegistration& registrationOf() {
    static TypeRegistration registration;
    return registration;
}

template<typename B>
PyTypeObject* baseTypeObject() {
    if constexpr (PyClass<B>) {
        return typeObject<B>();
    } else {
        return B::typeObject();
    }
}

template<PyClass T>
constexpr bool participatesInGc() {
    return (classFlags<ClassInfo<T>>() & TypeFlags::GC) != 0 || HasGcSlots<ClassInfo<T>>;
}

// Collects everything ClassInfo<T> declares into a TypeSpec.
template<PyClass T>
TypeSpec describeType() {
    using Info = ClassInfo<T>;
    constexpr unsigned flags = classFlags<Info>();

    TypeSpec spec;
    spec.name = Info::name;
    spec.module = classModule<Info>();
    spec.doc = classDoc<Info>();
    spec.base = &baseTypeObject<typename Info::Base>;
    spec.layout = &ClassLayout<T>::descriptor;
    spec.dealloc = &ClassShell<T>::dealloc;

    if constexpr (participatesInGc<T>()) {
        spec.gc = GcSlots{&ClassShell<T>::traverse, &ClassShell<T>::clear};
    }
    spec.gcRequested = (flags & TypeFlags::GC) != 0;
    spec.baseType = (flags & TypeFlags::BaseType) != 0;

    if constexpr (HasObjectSlots<Info>) {
        spec.objectSlots = Info::objectSlots();
    }
    if constexpr (HasIterSlots<Info>) {
        spec.iterSlots = Info::iterSlots();
    }
    if constexpr (HasDescrSlots<Info>) {
        spec.descrSlots = Info::descrSlots();
    }

    if constexpr (HasNumberProtocol<Info>) {
        spec.numberMethods = Info::numberMethods();
    }
    if constexpr (HasMappingProtocol<Info>) {
        spec.mappingMethods = Info::mappingMethods();
    }
    if constexpr (HasSequenceProtocol<Info>) {
        spec.sequenceMethods = Info::sequenceMethods();
    }
    if constexpr (HasAsyncProtocol<Info>) {
        spec.asyncMethods = Info::asyncMethods();
    }
    if constexpr (HasBufferProtocol<Info>) {
        spec.bufferProcs = Info::bufferProcs();
    }

    if constexpr (HasMethods<Info>) {
        spec.methods = Info::methods();
    }
    if constexpr (HasContextProtocol<Info>) {
        for (const MethodDef& def : Info::contextMethods()) {
            spec.protocolMethods.push_back(def);
        }
    }
    if constexpr (HasSpecialMethods<Info>) {
        for (const MethodDef& def : Info::specialMethods()) {
            spec.protocolMethods.push_back(def);
        }
    }
    return spec;
}

template<PyClass T>
PyTypeObject* typeObject() {
    return registrationOf<T>().ensureReady(&describeType<T>);
}

// Borrowed reference to T's type object as a PyObject*, for module setup.
template<PyClass T>
PyObject* typeAsObject() {
    return reinterpret_cast<PyObject*>(typeObject<T>());
}

} // namespace pn
