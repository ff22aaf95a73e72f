#include "pn/error.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace pn;

TEST(HostErrorTest, RestoreSetsPendingError) {
    TypeError("bad argument").restore();
    ASSERT_TRUE(PyErr_Occurred());
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_TypeError));

    const HostError fetched = HostError::fetch();
    EXPECT_FALSE(PyErr_Occurred());
    EXPECT_TRUE(fetched.matches(PyExc_TypeError));
    EXPECT_STREQ(fetched.what(), "bad argument");
}

TEST(HostErrorTest, FetchKeepsExceptionInstance) {
    PyErr_SetString(PyExc_KeyError, "missing");
    const HostError fetched = HostError::fetch();

    fetched.restore();
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_KeyError));
    PyErr_Clear();
}

TEST(HostErrorTest, FetchWithoutPendingErrorIsSystemError) {
    ASSERT_FALSE(PyErr_Occurred());
    const HostError fetched = HostError::fetch();
    EXPECT_TRUE(fetched.matches(PyExc_SystemError));
}

TEST(HostErrorTest, SubclassesMatchTheirHostTypes) {
    EXPECT_TRUE(RuntimeError("x").matches(PyExc_RuntimeError));
    EXPECT_TRUE(ValueError("x").matches(PyExc_ValueError));
    EXPECT_TRUE(ValueError("x").matches(PyExc_Exception));
    EXPECT_FALSE(ValueError("x").matches(PyExc_TypeError));
}

TEST(HostErrorTest, CopiesShareTheExceptionType) {
    const TypeError original("copied");
    HostError copy = original;
    EXPECT_TRUE(copy.matches(PyExc_TypeError));
    copy = ValueError("reassigned");
    EXPECT_TRUE(copy.matches(PyExc_ValueError));
    EXPECT_STREQ(copy.what(), "reassigned");
}

TEST(RaiseInHostTest, HostErrorsPassThrough) {
    raiseInHost(ValueError("out of range"));
    const HostError pending = HostError::fetch();
    EXPECT_TRUE(pending.matches(PyExc_ValueError));
    EXPECT_STREQ(pending.what(), "out of range");
}

TEST(RaiseInHostTest, OtherExceptionsBecomeRuntimeError) {
    raiseInHost(std::out_of_range("index 7"));
    const HostError pending = HostError::fetch();
    EXPECT_TRUE(pending.matches(PyExc_RuntimeError));
    EXPECT_NE(std::string(pending.what()).find("index 7"), std::string::npos);
}
