#pragma once

#include "pn/class_info.hpp"
#include "pn/class_shell.hpp"
#include "pn/class_type.hpp"
#include "pn/error.hpp"
#include "pn/function_description.hpp"
#include "pn/object.hpp"

#include <Python.h>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace pn {

// ============================================================================
// Excess argument parameters
// ============================================================================
// A callable parameter of type Args receives the extra positional tuple, one
// of type Kwargs the extra keyword dict (empty OwnedRef when nothing was
// captured). Neither consumes a bound argument slot.

struct Args {
    OwnedRef tuple;
};

struct Kwargs {
    OwnedRef dict;
};

// ============================================================================
// Type Conversion System
// ============================================================================

namespace detail {

// fromValue takes a borrowed reference; toValue returns a new one.
template<typename T>
struct TypeConverter;

template<>
struct TypeConverter<std::int64_t> {
    static std::int64_t fromValue(PyObject* obj);
    static OwnedRef toValue(std::int64_t val);
};

template<>
struct TypeConverter<std::uint64_t> {
    static std::uint64_t fromValue(PyObject* obj);
    static OwnedRef toValue(std::uint64_t val);
};

template<>
struct TypeConverter<std::int32_t> {
    static std::int32_t fromValue(PyObject* obj);
    static OwnedRef toValue(std::int32_t val);
};

template<>
struct TypeConverter<std::uint32_t> {
    static std::uint32_t fromValue(PyObject* obj);
    static OwnedRef toValue(std::uint32_t val);
};

template<>
struct TypeConverter<double> {
    // Accepts ints as well
    static double fromValue(PyObject* obj);
    static OwnedRef toValue(double val);
};

template<>
struct TypeConverter<float> {
    static float fromValue(PyObject* obj) { return static_cast<float>(TypeConverter<double>::fromValue(obj)); }
    static OwnedRef toValue(float val) { return TypeConverter<double>::toValue(static_cast<double>(val)); }
};

template<>
struct TypeConverter<bool> {
    // Only True and False; no truthiness
    static bool fromValue(PyObject* obj);
    static OwnedRef toValue(bool val);
};

template<>
struct TypeConverter<std::string> {
    static std::string fromValue(PyObject* obj);
    static OwnedRef toValue(const std::string& val);
};

template<>
struct TypeConverter<const char*> {
    static OwnedRef toValue(const char* val);
};

template<>
struct TypeConverter<OwnedRef> {
    static OwnedRef fromValue(PyObject* obj) { return OwnedRef::borrow(obj); }
    static OwnedRef toValue(const OwnedRef& val);
};

template<typename T>
struct TypeConverter<std::optional<T>> {
    static std::optional<T> fromValue(PyObject* obj) {
        if (obj == Py_None) {
            return std::nullopt;
        }
        return TypeConverter<T>::fromValue(obj);
    }
    static OwnedRef toValue(const std::optional<T>& val) {
        if (!val) {
            return OwnedRef::borrow(Py_None);
        }
        return TypeConverter<T>::toValue(*val);
    }
};

// "'int' object" style description used in conversion errors.
std::string typeNameOf(PyObject* obj);

template<typename P>
constexpr bool consumesSlot = !std::is_same_v<std::remove_cvref_t<P>, Args> &&
                              !std::is_same_v<std::remove_cvref_t<P>, Kwargs>;

template<typename... Ps>
constexpr std::size_t slotParameterCount = (std::size_t{0} + ... + (consumesSlot<Ps> ? 1 : 0));

// Output slot index of every parameter (Args/Kwargs get the slot count).
template<typename... Ps>
constexpr std::array<std::size_t, sizeof...(Ps)> slotIndices() {
    std::array<std::size_t, sizeof...(Ps)> indices{};
    constexpr bool consumes[] = {consumesSlot<Ps>..., false};
    std::size_t next = 0;
    for (std::size_t i = 0; i < sizeof...(Ps); ++i) {
        indices[i] = consumes[i] ? next++ : slotParameterCount<Ps...>;
    }
    return indices;
}

template<typename F>
struct FunctionTraits;

template<typename R, typename... Ps>
struct FunctionTraits<R (*)(Ps...)> {
    using Return = R;
};

template<typename C, typename R, typename... Ps>
struct FunctionTraits<R (C::*)(Ps...)> {
    using Class = C;
    using Return = R;
    static constexpr bool isConst = false;
};

template<typename C, typename R, typename... Ps>
struct FunctionTraits<R (C::*)(Ps...) const> {
    using Class = C;
    using Return = R;
    static constexpr bool isConst = true;
};

template<typename M>
struct MemberTraits;

template<typename C, typename V>
struct MemberTraits<V C::*> {
    using Class = C;
};

template<typename C, typename R>
struct MemberTraits<R (C::*)() const> {
    using Class = C;
};

template<typename C, typename A>
struct MemberTraits<void (C::*)(A)> {
    using Class = C;
};

template<typename R>
struct ConstructedClass {
    using type = std::remove_cvref_t<R>;
};

template<PyClass T>
struct ConstructedClass<Initializer<T>> {
    using type = T;
};

} // namespace detail

// ============================================================================
// Call shim factories
// ============================================================================
// Desc is a FunctionDescription with static storage duration; Fn a function
// or member function pointer whose bound parameters match Desc's slots in
// order.
//
//   static constexpr std::string_view kScaleParams[] = {"factor"};
//   static constexpr pn::FunctionDescription kScale{
//       .clsName = "Point", .funcName = "scale",
//       .positionalParameterNames = kScaleParams,
//       .requiredPositionalParameters = 1};
//
//   pn::method<kScale, &Point::scale>()

// Module-level function.
template<const FunctionDescription& Desc, auto Fn>
PyMethodDef function(const char* doc = nullptr);

template<const FunctionDescription& Desc, auto Fn>
MethodDef method(const char* doc = nullptr);

template<const FunctionDescription& Desc, auto Fn>
MethodDef staticMethod(const char* doc = nullptr);

// Fn takes the class (PyTypeObject*) as its first parameter.
template<const FunctionDescription& Desc, auto Fn>
MethodDef classMethod(const char* doc = nullptr);

template<const FunctionDescription& Desc, auto Fn>
MethodDef call();

// Fn returns the class by value or an Initializer for it.
template<const FunctionDescription& Desc, auto Fn>
MethodDef constructor();

// Member is a data member pointer or a const getter member function.
template<auto Member>
MethodDef getter(const char* name, const char* doc = nullptr);

// Member is a data member pointer or a single-argument setter member function.
template<auto Member>
MethodDef setter(const char* name, const char* doc = nullptr);

// Adds the type object of T to a module under its class name.
template<PyClass T>
void addType(PyObject* module);

} // namespace pn

// Include template implementations
#include "pn/binding.inl"
