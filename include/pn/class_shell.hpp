#pragma once

#include "pn/class_info.hpp"
#include "pn/error.hpp"
#include "pn/layout.hpp"
#include "pn/object.hpp"

#include <Python.h>

#include <concepts>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

namespace pn {

// Registers T on first use and returns its type object (class_type.hpp).
template<PyClass T>
PyTypeObject* typeObject();

template<PyClass T>
class Initializer;

namespace detail {

template<typename Base>
struct SuperLink {
    using type = std::nullptr_t;
};

template<PyClass Base>
struct SuperLink<Base> {
    using type = std::unique_ptr<Initializer<Base>>;
};

// The terminal host-native base at the bottom of T's chain.
template<typename T>
struct NativeRoot {
    using type = T;
};

template<PyClass T>
struct NativeRoot<T> {
    using type = typename NativeRoot<typename ClassInfo<T>::Base>::type;
};

// Release memory obtained from tp_alloc or a native tp_new. Falls back to
// PyObject_GC_Del / PyObject_Free when the type has no tp_free, dropping
// the type reference held by instances of heap types.
void freeObject(PyObject* obj);

// Undo an allocation whose payloads were never (or no longer) constructed.
// The instance destructor chain is not run.
void discardAllocation(PyObject* obj, PyTypeObject* nativeRoot);

// Call the terminal native type's own tp_clear, if it has one.
void clearNativeBase(PyObject* obj, PyTypeObject* nativeRoot);

int traverseNativeBase(PyObject* obj, PyTypeObject* nativeRoot, visitproc visit, void* arg);

} // namespace detail

// ============================================================================
// Initializer - construction request for one native class, built bottom-up
// ============================================================================
// Holds the payload for this level and, lazily, the request for the base
// level. Consumed exactly once when applied to freshly allocated memory.
//
//   pn::Initializer<Derived> init = pn::Initializer<Derived>::fromValue(Derived{2});
//   init.getSuper().init(Base{1});
//   auto shell = pn::ClassShell<Derived>::newRef(std::move(init));

template<PyClass T>
class Initializer {
public:
    using Base = typename ClassInfo<T>::Base;

    Initializer() = default;
    // A moved-from initializer holds nothing.
    Initializer(Initializer&& other) noexcept
        : value_(std::exchange(other.value_, std::nullopt)), superInit_(std::move(other.superInit_)) {}

    Initializer& operator=(Initializer&& other) noexcept {
        value_ = std::exchange(other.value_, std::nullopt);
        superInit_ = std::move(other.superInit_);
        return *this;
    }

    Initializer(const Initializer&) = delete;
    Initializer& operator=(const Initializer&) = delete;

    static Initializer fromValue(T value) {
        Initializer initializer;
        initializer.init(std::move(value));
        return initializer;
    }

    // Supplies (or replaces) the payload for this level.
    Initializer& init(T value) {
        value_.emplace(std::move(value));
        return *this;
    }

    bool hasValue() const { return value_.has_value(); }

    template<typename B = Base>
        requires PyClass<B>
    Initializer<B>& getSuper() {
        if (!superInit_) {
            superInit_ = std::make_unique<Initializer<B>>();
        }
        return *superInit_;
    }

    // Move-constructs every supplied payload into obj, this level first.
    // On failure the payloads written so far are destroyed again and the
    // error propagates; the memory itself is left to the caller.
    void applyTo(PyObject* obj) &&;

private:
    std::optional<T> value_;
    typename detail::SuperLink<Base>::type superInit_{};
};

template<typename U, typename T>
concept IntoInitializer = PyClass<T> && (std::same_as<std::remove_cvref_t<U>, Initializer<T>> ||
                                         std::constructible_from<T, U>);

template<PyClass T>
Initializer<T> intoInitializer(Initializer<T> initializer) {
    return initializer;
}

template<PyClass T, typename U>
    requires(!std::same_as<std::remove_cvref_t<U>, Initializer<T>> && std::constructible_from<T, U>)
Initializer<T> intoInitializer(U&& value) {
    return Initializer<T>::fromValue(T(std::forward<U>(value)));
}

// ============================================================================
// ClassShell - typed view over one native class instance
// ============================================================================
// A ClassShell does not own the instance; it only knows where the payload and
// the optional slots live inside the host allocation.

template<PyClass T, bool Mutable>
class ShellHandle;

template<PyClass T>
using ShellRef = ShellHandle<T, false>;

template<PyClass T>
using ShellMut = ShellHandle<T, true>;

template<PyClass T>
class ClassShell {
public:
    using Info = ClassInfo<T>;
    using Base = typename Info::Base;
    using Layout = ClassLayout<T>;
    using NativeRoot = typename detail::NativeRoot<T>::type;

    // Unchecked view; obj must be an instance of T or of a subclass.
    static ClassShell from(PyObject* obj) { return ClassShell(obj); }

    // Checked view; throws TypeError when obj is not an instance of T.
    static ClassShell cast(PyObject* obj);

    static bool isInstance(PyObject* obj);

    PyObject* ptr() const { return obj_; }
    T& get() const { return *payload(obj_); }

    // View of the base level over the same memory.
    auto getSuper() const {
        if constexpr (PyClass<Base>) {
            return ClassShell<Base>::from(obj_);
        } else {
            return reinterpret_cast<typename Base::Layout*>(obj_);
        }
    }

    PyObject** dictSlot() const
        requires(Layout::hasDict)
    {
        return slotAt(obj_, Layout::dictOffset);
    }

    PyObject** weakrefSlot() const
        requires(Layout::hasWeakRef)
    {
        return slotAt(obj_, Layout::weakrefOffset);
    }

    static T* payload(PyObject* obj) {
        return std::launder(reinterpret_cast<T*>(reinterpret_cast<char*>(obj) + Layout::payloadOffset));
    }

    // ------------------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------------------

    template<typename U>
        requires IntoInitializer<U, T>
    static ShellRef<T> newRef(U&& value);

    template<typename U>
        requires IntoInitializer<U, T>
    static ShellMut<T> newMut(U&& value);

    // Allocate an instance of subtype (T or a subclass of T) and populate it
    // from the initializer. Returns a new reference.
    static OwnedRef create(PyTypeObject* subtype, Initializer<T> initializer);

    // Raw allocation with dict and weakref slots reset; payloads unset.
    static PyObject* allocate(PyTypeObject* subtype);

    // ------------------------------------------------------------------------
    // Type slots
    // ------------------------------------------------------------------------

    static void dealloc(PyObject* obj);
    static int traverse(PyObject* obj, visitproc visit, void* arg);
    static int clear(PyObject* obj);

    // Teardown of T's level and every level below it, without freeing.
    static void drop(PyObject* obj);

private:
    explicit ClassShell(PyObject* obj) : obj_(obj) {}

    static PyObject** slotAt(PyObject* obj, std::size_t offset) {
        return reinterpret_cast<PyObject**>(reinterpret_cast<char*>(obj) + offset);
    }

    static void resetSlots(PyObject* obj);

    template<PyClass U>
    friend class ClassShell;

    PyObject* obj_;
};

// ============================================================================
// ShellHandle - owning reference to a native class instance
// ============================================================================

template<PyClass T, bool Mutable>
class ShellHandle {
public:
    using Reference = std::conditional_t<Mutable, T&, const T&>;
    using Pointer = std::conditional_t<Mutable, T*, const T*>;

    explicit ShellHandle(OwnedRef object) : object_(std::move(object)) {}

    Reference get() const { return *ClassShell<T>::payload(object_.get()); }
    Reference operator*() const { return get(); }
    Pointer operator->() const { return ClassShell<T>::payload(object_.get()); }

    ClassShell<T> shell() const { return ClassShell<T>::from(object_.get()); }
    PyObject* ptr() const { return object_.get(); }
    const OwnedRef& object() const { return object_; }
    PyObject* release() { return object_.release(); }

private:
    OwnedRef object_;
};

} // namespace pn

#include "pn/class_shell.inl"
