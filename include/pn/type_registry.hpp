#pragma once

#include "pn/class_info.hpp"
#include "pn/layout.hpp"

#include <Python.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pn {

// ============================================================================
// TypeSpec - everything needed to fill in one static type object
// ============================================================================

struct TypeSpec {
    std::string_view name;
    std::string_view module;
    std::string_view doc;
    PyTypeObject* (*base)(){nullptr};  // readies and returns the base type
    const LayoutDescriptor* layout{nullptr};
    destructor dealloc{nullptr};

    std::optional<GcSlots> gc;  // generated traverse/clear for GC types
    bool gcRequested{false};
    bool baseType{false};

    std::optional<ObjectSlots> objectSlots;
    std::optional<IterSlots> iterSlots;
    std::optional<DescrSlots> descrSlots;

    std::optional<PyNumberMethods> numberMethods;
    std::optional<PyMappingMethods> mappingMethods;
    std::optional<PySequenceMethods> sequenceMethods;
    std::optional<PyAsyncMethods> asyncMethods;
    std::optional<PyBufferProcs> bufferProcs;

    std::vector<MethodDef> methods;
    std::vector<MethodDef> protocolMethods;  // context protocol and other dunders
};

// ============================================================================
// TypeRegistration - one-time setup of a native class's type object
// ============================================================================
// Unregistered -> Registering -> Ready, or -> Failed. Ready and Failed are
// terminal. The GIL serializes all transitions.

class TypeRegistration {
public:
    enum class State {
        Unregistered,
        Registering,
        Ready,
        Failed
    };

    using Describe = TypeSpec (*)();

    TypeRegistration();
    TypeRegistration(const TypeRegistration&) = delete;
    TypeRegistration& operator=(const TypeRegistration&) = delete;

    // Registers on the first call; returns the ready type object. Throws
    // RegistrationError on failure, and on every call after a failure.
    PyTypeObject* ensureReady(Describe describe);

    State state() const { return state_; }
    PyTypeObject* object() { return &object_; }
    const std::string& qualifiedName() const { return qualifiedName_; }
    const std::string& failure() const { return failure_; }

private:
    void install(const TypeSpec& spec, PyTypeObject* base);
    void installSlots(const TypeSpec& spec);
    void installMethods(const TypeSpec& spec);
    void installProperties(const TypeSpec& spec);
    unsigned long computeFlags(const TypeSpec& spec, PyTypeObject* base) const;

    PyTypeObject object_{};
    State state_{State::Unregistered};
    std::string qualifiedName_;
    std::string doc_;
    std::string failure_;

    // Storage the type object points into. Never released: static types
    // live for the rest of the process.
    std::vector<PyMethodDef> methodDefs_;
    std::vector<PyGetSetDef> getSetDefs_;
    std::unique_ptr<PyNumberMethods> numberMethods_;
    std::unique_ptr<PyMappingMethods> mappingMethods_;
    std::unique_ptr<PySequenceMethods> sequenceMethods_;
    std::unique_ptr<PyAsyncMethods> asyncMethods_;
    std::unique_ptr<PyBufferProcs> bufferProcs_;
    bool hasConstructor_{false};
};

} // namespace pn
