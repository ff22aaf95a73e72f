#include <Python.h>
#include <gtest/gtest.h>

namespace {

// One embedded interpreter for the whole test binary. It is never finalized:
// static type objects registered by the tests must outlive it.
class PythonEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        if (!Py_IsInitialized()) {
            Py_InitializeEx(0);
        }
        ASSERT_TRUE(Py_IsInitialized());
    }
};

::testing::Environment* const pythonEnvironment =
    ::testing::AddGlobalTestEnvironment(new PythonEnvironment);

} // namespace
