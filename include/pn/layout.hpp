#pragma once

#include "pn/class_info.hpp"

#include <Python.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>

namespace pn {

// ============================================================================
// LayoutDescriptor - memory plan of one native class instance
// ============================================================================
// An instance is one host allocation laid out as
//
//   [ base region ][ payload ][ dict slot ]?[ weakref slot ]?
//
// where the base region is either the terminal host layout (PyObject,
// PyBaseExceptionObject, ...) or, recursively, the whole region of a native
// base class. Offsets are from the start of the object header.

struct LayoutDescriptor {
    const LayoutDescriptor* base{nullptr};  // null for a terminal host layout
    std::string_view typeName;
    std::size_t basicSize{0};
    std::size_t payloadOffset{0};
    std::size_t payloadSize{0};
    std::optional<std::size_t> dictOffset;
    std::optional<std::size_t> weakrefOffset;
    bool needInit{false};  // construction must supply a payload for this level
    bool isNative{false};  // terminal host layout, not produced here
};

namespace detail {

constexpr std::size_t alignUp(std::size_t offset, std::size_t alignment) {
    return (offset + alignment - 1) / alignment * alignment;
}

} // namespace detail

template<typename B>
struct BaseLayout;

template<NativeBase B>
struct BaseLayout<B> {
    static constexpr std::size_t size = sizeof(typename B::Layout);
    static constexpr std::size_t alignment = alignof(typename B::Layout);
    static constexpr bool needInit = false;
    static constexpr bool isNative = true;
    static constexpr LayoutDescriptor descriptor{
        nullptr, B::name, size, size, 0, std::nullopt, std::nullopt, false, true};
};

template<PyClass T>
struct ClassLayout {
    using Info = ClassInfo<T>;
    using Base = typename Info::Base;

    static constexpr bool hasDict = (classFlags<Info>() & TypeFlags::Dict) != 0;
    static constexpr bool hasWeakRef = (classFlags<Info>() & TypeFlags::WeakRef) != 0;

    // Empty trivial payloads may stay in their zeroed state.
    static constexpr bool needInit = !(std::is_empty_v<T> && std::is_trivial_v<T>);

    static constexpr std::size_t baseSize = BaseLayout<Base>::size;
    static constexpr std::size_t payloadOffset = detail::alignUp(baseSize, alignof(T));
    static constexpr std::size_t payloadEnd = payloadOffset + sizeof(T);

    static constexpr std::size_t dictOffset =
        hasDict ? detail::alignUp(payloadEnd, alignof(PyObject*)) : 0;
    static constexpr std::size_t dictEnd = hasDict ? dictOffset + sizeof(PyObject*) : payloadEnd;

    static constexpr std::size_t weakrefOffset =
        hasWeakRef ? detail::alignUp(dictEnd, alignof(PyObject*)) : 0;
    static constexpr std::size_t weakrefEnd = hasWeakRef ? weakrefOffset + sizeof(PyObject*) : dictEnd;

    static constexpr std::size_t alignment =
        std::max({BaseLayout<Base>::alignment, alignof(T), alignof(PyObject*)});
    static constexpr std::size_t size = detail::alignUp(weakrefEnd, alignment);

    static constexpr LayoutDescriptor descriptor{
        &BaseLayout<Base>::descriptor,
        Info::name,
        size,
        payloadOffset,
        sizeof(T),
        hasDict ? std::optional<std::size_t>(dictOffset) : std::nullopt,
        hasWeakRef ? std::optional<std::size_t>(weakrefOffset) : std::nullopt,
        needInit,
        false};

    static_assert(payloadOffset >= baseSize, "payload overlaps the base region");
    static_assert(!hasDict || dictOffset >= payloadEnd, "dict slot overlaps the payload");
    static_assert(!hasWeakRef || weakrefOffset >= dictEnd, "weakref slot overlaps the dict slot");
    static_assert(alignof(T) <= alignof(std::max_align_t),
                  "host allocations are only max_align_t aligned");
};

template<PyClass B>
struct BaseLayout<B> {
    static constexpr std::size_t size = ClassLayout<B>::size;
    static constexpr std::size_t alignment = ClassLayout<B>::alignment;
    static constexpr bool needInit = ClassLayout<B>::needInit;
    static constexpr bool isNative = false;
    static constexpr const LayoutDescriptor& descriptor = ClassLayout<B>::descriptor;
};

} // namespace pn
