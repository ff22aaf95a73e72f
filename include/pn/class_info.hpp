#pragma once

#include <Python.h>

#include <concepts>
#include <string_view>
#include <vector>

namespace pn {

// ============================================================================
// Method and property descriptors
// ============================================================================

struct MethodDef {
    enum class Kind {
        New,
        Call,
        Method,
        ClassMethod,
        StaticMethod,
        Getter,
        Setter
    };

    Kind kind{Kind::Method};
    const char* name{nullptr};
    const char* doc{nullptr};
    PyCFunctionWithKeywords method{nullptr};  // Method, ClassMethod, StaticMethod
    newfunc newFunction{nullptr};             // New
    ternaryfunc callFunction{nullptr};        // Call
    getter get{nullptr};                      // Getter
    setter set{nullptr};                      // Setter

    static MethodDef makeNew(newfunc function);
    static MethodDef makeCall(ternaryfunc function);
    static MethodDef makeMethod(const char* name, PyCFunctionWithKeywords function, const char* doc = nullptr);
    static MethodDef makeClassMethod(const char* name, PyCFunctionWithKeywords function, const char* doc = nullptr);
    static MethodDef makeStaticMethod(const char* name, PyCFunctionWithKeywords function, const char* doc = nullptr);
    static MethodDef makeGetter(const char* name, getter function, const char* doc = nullptr);
    static MethodDef makeSetter(const char* name, setter function, const char* doc = nullptr);

    // Only meaningful for Method, ClassMethod and StaticMethod.
    PyMethodDef asMethodDef() const;
};

// ============================================================================
// Slot groups installed directly into the type object
// ============================================================================

struct GcSlots {
    traverseproc traverse{nullptr};
    inquiry clear{nullptr};
};

struct ObjectSlots {
    reprfunc repr{nullptr};
    reprfunc str{nullptr};
    hashfunc hash{nullptr};
    richcmpfunc richcompare{nullptr};
    getattrofunc getattro{nullptr};
    setattrofunc setattro{nullptr};
};

struct IterSlots {
    getiterfunc iter{nullptr};
    iternextfunc next{nullptr};
};

struct DescrSlots {
    descrgetfunc get{nullptr};
    descrsetfunc set{nullptr};
};

namespace TypeFlags {
constexpr unsigned GC = 1u << 0;        // participate in cyclic GC
constexpr unsigned BaseType = 1u << 1;  // allow subclassing
constexpr unsigned Extended = 1u << 2;  // allocate through the native base's tp_new
constexpr unsigned Dict = 1u << 3;      // per-instance __dict__ slot
constexpr unsigned WeakRef = 1u << 4;   // weak reference list slot
} // namespace TypeFlags

// ============================================================================
// Terminal host-native bases
// ============================================================================

struct ObjectBase {
    using Layout = PyObject;
    static constexpr std::string_view name = "object";
    static PyTypeObject* typeObject() { return &PyBaseObject_Type; }
};

struct ExceptionBase {
    using Layout = PyBaseExceptionObject;
    static constexpr std::string_view name = "Exception";
    static PyTypeObject* typeObject() { return reinterpret_cast<PyTypeObject*>(PyExc_Exception); }
};

// ============================================================================
// ClassInfo - compile-time description of a native class
// ============================================================================
// Specialize for every native class:
//
//   template<> struct pn::ClassInfo<Counter> {
//       static constexpr std::string_view name = "Counter";
//       static constexpr std::string_view module = "demo";     // optional
//       static constexpr std::string_view doc = "A counter";   // optional
//       using Base = pn::ObjectBase;
//       static constexpr unsigned flags = pn::TypeFlags::Dict; // optional
//       static std::vector<pn::MethodDef> methods();           // optional
//   };
//
// Each optional capability below is picked up when the corresponding static
// function exists. The specialization must be declared before anything names
// the class through Initializer, ClassShell or a binding; methods() can be
// declared in it and defined later, once the bound functions exist.

template<typename T>
struct ClassInfo;

template<typename B>
concept NativeBase = requires {
    typename B::Layout;
    { B::name } -> std::convertible_to<std::string_view>;
    { B::typeObject() } -> std::same_as<PyTypeObject*>;
};

template<typename T>
concept PyClass = requires {
    typename ClassInfo<T>::Base;
    { ClassInfo<T>::name } -> std::convertible_to<std::string_view>;
};

template<typename Info>
concept HasModuleName = requires { { Info::module } -> std::convertible_to<std::string_view>; };
template<typename Info>
concept HasDoc = requires { { Info::doc } -> std::convertible_to<std::string_view>; };
template<typename Info>
concept HasFlags = requires { { Info::flags } -> std::convertible_to<unsigned>; };
template<typename Info>
concept HasMethods = requires { { Info::methods() } -> std::convertible_to<std::vector<MethodDef>>; };

template<typename Info>
concept HasGcSlots = requires { { Info::gcSlots() } -> std::convertible_to<GcSlots>; };
template<typename Info>
concept HasObjectSlots = requires { { Info::objectSlots() } -> std::convertible_to<ObjectSlots>; };
template<typename Info>
concept HasIterSlots = requires { { Info::iterSlots() } -> std::convertible_to<IterSlots>; };
template<typename Info>
concept HasDescrSlots = requires { { Info::descrSlots() } -> std::convertible_to<DescrSlots>; };

template<typename Info>
concept HasNumberProtocol = requires { { Info::numberMethods() } -> std::convertible_to<PyNumberMethods>; };
template<typename Info>
concept HasMappingProtocol = requires { { Info::mappingMethods() } -> std::convertible_to<PyMappingMethods>; };
template<typename Info>
concept HasSequenceProtocol = requires { { Info::sequenceMethods() } -> std::convertible_to<PySequenceMethods>; };
template<typename Info>
concept HasAsyncProtocol = requires { { Info::asyncMethods() } -> std::convertible_to<PyAsyncMethods>; };
template<typename Info>
concept HasBufferProtocol = requires { { Info::bufferProcs() } -> std::convertible_to<PyBufferProcs>; };

// Protocols that contribute dunder methods rather than slots
template<typename Info>
concept HasContextProtocol = requires { { Info::contextMethods() } -> std::convertible_to<std::vector<MethodDef>>; };
template<typename Info>
concept HasSpecialMethods = requires { { Info::specialMethods() } -> std::convertible_to<std::vector<MethodDef>>; };

template<typename Info>
constexpr std::string_view classModule() {
    if constexpr (HasModuleName<Info>) {
        return Info::module;
    } else {
        return {};
    }
}

template<typename Info>
constexpr std::string_view classDoc() {
    if constexpr (HasDoc<Info>) {
        return Info::doc;
    } else {
        return {};
    }
}

template<typename Info>
constexpr unsigned classFlags() {
    if constexpr (HasFlags<Info>) {
        return Info::flags;
    } else {
        return 0;
    }
}

} // namespace pn
