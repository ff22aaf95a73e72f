#include "pn/layout.hpp"

#include <gtest/gtest.h>

#include <string>

namespace layout_test {

struct Plain {
    int value;
};

struct Empty {};

struct Slotted {
    double value{0.0};
};

struct Child {
    std::string label;
};

struct Failure {
    int code{0};
};

} // namespace layout_test

template<>
struct pn::ClassInfo<layout_test::Plain> {
    static constexpr std::string_view name = "Plain";
    using Base = pn::ObjectBase;
};

template<>
struct pn::ClassInfo<layout_test::Empty> {
    static constexpr std::string_view name = "Empty";
    using Base = pn::ObjectBase;
};

template<>
struct pn::ClassInfo<layout_test::Slotted> {
    static constexpr std::string_view name = "Slotted";
    using Base = pn::ObjectBase;
    static constexpr unsigned flags = pn::TypeFlags::Dict | pn::TypeFlags::WeakRef;
};

template<>
struct pn::ClassInfo<layout_test::Child> {
    static constexpr std::string_view name = "Child";
    using Base = layout_test::Slotted;
    static constexpr unsigned flags = pn::TypeFlags::Dict;
};

template<>
struct pn::ClassInfo<layout_test::Failure> {
    static constexpr std::string_view name = "Failure";
    using Base = pn::ExceptionBase;
};

using namespace pn;
using namespace layout_test;

TEST(LayoutTest, PayloadFollowsObjectHeader) {
    using L = ClassLayout<Plain>;
    static_assert(L::payloadOffset >= sizeof(PyObject));
    static_assert(L::payloadOffset % alignof(Plain) == 0);

    const LayoutDescriptor& d = L::descriptor;
    EXPECT_EQ(d.typeName, "Plain");
    EXPECT_EQ(d.payloadSize, sizeof(Plain));
    EXPECT_GE(d.basicSize, d.payloadOffset + d.payloadSize);
    EXPECT_FALSE(d.dictOffset.has_value());
    EXPECT_FALSE(d.weakrefOffset.has_value());
    EXPECT_TRUE(d.needInit);
    EXPECT_FALSE(d.isNative);

    ASSERT_NE(d.base, nullptr);
    EXPECT_TRUE(d.base->isNative);
    EXPECT_EQ(d.base->typeName, "object");
    EXPECT_EQ(d.base->basicSize, sizeof(PyObject));
}

TEST(LayoutTest, EmptyTrivialPayloadNeedsNoInitializer) {
    EXPECT_FALSE(ClassLayout<Empty>::descriptor.needInit);
}

TEST(LayoutTest, OptionalSlotsFollowThePayload) {
    const LayoutDescriptor& d = ClassLayout<Slotted>::descriptor;
    ASSERT_TRUE(d.dictOffset.has_value());
    ASSERT_TRUE(d.weakrefOffset.has_value());

    EXPECT_GE(*d.dictOffset, d.payloadOffset + d.payloadSize);
    EXPECT_GE(*d.weakrefOffset, *d.dictOffset + sizeof(PyObject*));
    EXPECT_GE(d.basicSize, *d.weakrefOffset + sizeof(PyObject*));
    EXPECT_EQ(*d.dictOffset % alignof(PyObject*), 0u);
}

TEST(LayoutTest, DerivedClassStacksOnWholeBaseRegion) {
    const LayoutDescriptor& base = ClassLayout<Slotted>::descriptor;
    const LayoutDescriptor& d = ClassLayout<Child>::descriptor;

    EXPECT_EQ(d.base, &base);
    EXPECT_GE(d.payloadOffset, base.basicSize);
    ASSERT_TRUE(d.dictOffset.has_value());
    EXPECT_GT(*d.dictOffset, *base.weakrefOffset);
    EXPECT_FALSE(d.weakrefOffset.has_value());
    EXPECT_TRUE(d.needInit);
}

TEST(LayoutTest, ExceptionBaseUsesExceptionLayout) {
    const LayoutDescriptor& d = ClassLayout<Failure>::descriptor;
    EXPECT_GE(d.payloadOffset, sizeof(PyBaseExceptionObject));
    ASSERT_NE(d.base, nullptr);
    EXPECT_EQ(d.base->typeName, "Exception");
    EXPECT_TRUE(d.base->isNative);
}
