#include "pn/class_type.hpp"
#include "test_support.hpp"

#include <string>

namespace shell_test {

struct Tracked {
    static inline int live = 0;

    Tracked() { ++live; }
    Tracked(const Tracked&) { ++live; }
    Tracked(Tracked&&) noexcept { ++live; }
    Tracked& operator=(const Tracked&) = default;
    ~Tracked() { --live; }
};

struct Counter {
    int count{0};
    Tracked tracked;
};

struct Animal {
    std::string name;
    Tracked tracked;
};

struct Dog {
    int tricks{0};
    Tracked tracked;
};

struct Marker {};

struct Slotted {
    int value{0};
};

struct Failure {
    int code{0};
};

} // namespace shell_test

template<>
struct pn::ClassInfo<shell_test::Counter> {
    static constexpr std::string_view name = "Counter";
    static constexpr std::string_view module = "shell_test";
    using Base = pn::ObjectBase;
};

template<>
struct pn::ClassInfo<shell_test::Animal> {
    static constexpr std::string_view name = "Animal";
    static constexpr std::string_view module = "shell_test";
    using Base = pn::ObjectBase;
    static constexpr unsigned flags = pn::TypeFlags::BaseType;
};

template<>
struct pn::ClassInfo<shell_test::Dog> {
    static constexpr std::string_view name = "Dog";
    static constexpr std::string_view module = "shell_test";
    using Base = shell_test::Animal;
};

template<>
struct pn::ClassInfo<shell_test::Marker> {
    static constexpr std::string_view name = "Marker";
    using Base = pn::ObjectBase;
};

template<>
struct pn::ClassInfo<shell_test::Slotted> {
    static constexpr std::string_view name = "Slotted";
    using Base = pn::ObjectBase;
    static constexpr unsigned flags = pn::TypeFlags::Dict | pn::TypeFlags::WeakRef | pn::TypeFlags::GC;
};

template<>
struct pn::ClassInfo<shell_test::Failure> {
    static constexpr std::string_view name = "Failure";
    static constexpr std::string_view module = "shell_test";
    using Base = pn::ExceptionBase;
    static constexpr unsigned flags = pn::TypeFlags::Extended | pn::TypeFlags::GC;
};

using namespace pn;
using namespace shell_test;

namespace {

template<typename F>
std::string runtimeErrorMessage(F&& construct) {
    try {
        construct();
    } catch (const RuntimeError& error) {
        return error.what();
    }
    return "<no error>";
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(ClassShellTest, NewRefExposesPayload) {
    ShellRef<Counter> shell = ClassShell<Counter>::newRef(Counter{5});
    EXPECT_EQ(shell->count, 5);
    EXPECT_EQ(Py_TYPE(shell.ptr()), typeObject<Counter>());
    EXPECT_EQ(Py_REFCNT(shell.ptr()), 1);
    EXPECT_STREQ(Py_TYPE(shell.ptr())->tp_name, "shell_test.Counter");
}

TEST(ClassShellTest, NewMutAllowsMutation) {
    ShellMut<Counter> shell = ClassShell<Counter>::newMut(Counter{1});
    shell->count = 7;
    EXPECT_EQ(ClassShell<Counter>::from(shell.ptr()).get().count, 7);
}

TEST(ClassShellTest, DeallocDestroysPayloadOnce) {
    const int baseline = Tracked::live;
    {
        ShellRef<Counter> shell = ClassShell<Counter>::newRef(Counter{});
        EXPECT_EQ(Tracked::live, baseline + 1);
    }
    EXPECT_EQ(Tracked::live, baseline);
}

TEST(ClassShellTest, TwoLevelInitializerChain) {
    const int baseline = Tracked::live;
    {
        Initializer<Dog> init = Initializer<Dog>::fromValue(Dog{3});
        init.getSuper().init(Animal{"rex"});

        ShellRef<Dog> shell = ClassShell<Dog>::newRef(std::move(init));
        EXPECT_EQ(shell->tricks, 3);
        EXPECT_EQ(shell.shell().getSuper().get().name, "rex");
        EXPECT_TRUE(ClassShell<Animal>::isInstance(shell.ptr()));
        EXPECT_EQ(Tracked::live, baseline + 2);
    }
    EXPECT_EQ(Tracked::live, baseline);
}

TEST(ClassShellTest, InitializerIsConsumedOnce) {
    const int baseline = Tracked::live;
    Initializer<Dog> init = Initializer<Dog>::fromValue(Dog{1});
    init.getSuper().init(Animal{"rex"});

    Initializer<Dog> moved = std::move(init);
    EXPECT_FALSE(init.hasValue());
    EXPECT_TRUE(moved.hasValue());

    {
        ShellRef<Dog> shell = ClassShell<Dog>::newRef(std::move(moved));
        EXPECT_FALSE(moved.hasValue());
        EXPECT_EQ(Tracked::live, baseline + 2);
    }
    EXPECT_EQ(Tracked::live, baseline);

    EXPECT_EQ(runtimeErrorMessage([&] { ClassShell<Dog>::newRef(std::move(moved)); }),
              "Base class 'Dog' is not initialized");
    EXPECT_EQ(Tracked::live, baseline);
}

TEST(ClassShellTest, MissingBaseInitializerFailsAndRollsBack) {
    const int baseline = Tracked::live;
    EXPECT_EQ(runtimeErrorMessage([] { ClassShell<Dog>::newRef(Dog{3}); }),
              "Base class 'Animal' is not initialized");
    EXPECT_EQ(Tracked::live, baseline);
}

TEST(ClassShellTest, MissingPayloadNamesTheLevel) {
    EXPECT_EQ(runtimeErrorMessage([] {
                  Initializer<Dog> init;
                  init.getSuper().init(Animal{"x"});
                  ClassShell<Dog>::newRef(std::move(init));
              }),
              "Base class 'Dog' is not initialized");
}

TEST(ClassShellTest, EmptyPayloadNeedsNoValue) {
    ShellRef<Marker> shell = ClassShell<Marker>::newRef(Initializer<Marker>{});
    EXPECT_TRUE(ClassShell<Marker>::isInstance(shell.ptr()));
}

// ============================================================================
// Views
// ============================================================================

TEST(ClassShellTest, CastChecksTheType) {
    OwnedRef number = pn::testing::integer(4);
    EXPECT_FALSE(ClassShell<Counter>::isInstance(number.get()));
    EXPECT_THROW(ClassShell<Counter>::cast(number.get()), TypeError);

    ShellRef<Dog> dog = [] {
        Initializer<Dog> init = Initializer<Dog>::fromValue(Dog{});
        init.getSuper().init(Animal{"fido"});
        return ClassShell<Dog>::newRef(std::move(init));
    }();
    EXPECT_EQ(ClassShell<Animal>::cast(dog.ptr()).get().name, "fido");
    EXPECT_THROW(ClassShell<Counter>::cast(dog.ptr()), TypeError);
}

TEST(ClassShellTest, GetSuperOfNativeBaseIsTheHeader) {
    ShellRef<Counter> shell = ClassShell<Counter>::newRef(Counter{});
    PyObject* header = shell.shell().getSuper();
    EXPECT_EQ(header, shell.ptr());
}

TEST(ClassShellTest, DictAndWeakrefSlots) {
    ShellRef<Slotted> shell = ClassShell<Slotted>::newRef(Slotted{1});
    EXPECT_EQ(*shell.shell().dictSlot(), nullptr);
    EXPECT_EQ(*shell.shell().weakrefSlot(), nullptr);

    OwnedRef value = pn::testing::integer(9);
    ASSERT_EQ(PyObject_SetAttrString(shell.ptr(), "extra", value.get()), 0);
    EXPECT_NE(*shell.shell().dictSlot(), nullptr);

    OwnedRef extra = pn::testing::checked(PyObject_GetAttrString(shell.ptr(), "extra"));
    EXPECT_EQ(extra.get(), value.get());

    OwnedRef weak = pn::testing::checked(PyWeakref_NewRef(shell.ptr(), nullptr));
    EXPECT_EQ(PyWeakref_GetObject(weak.get()), shell.ptr());

    OwnedRef owner = shell.object();
    shell = ShellRef<Slotted>(OwnedRef());
    owner = OwnedRef();
    EXPECT_EQ(PyWeakref_GetObject(weak.get()), Py_None);
}

TEST(ClassShellTest, ExceptionBaseInstances) {
    ShellRef<Failure> shell = ClassShell<Failure>::newRef(Failure{42});
    EXPECT_EQ(shell->code, 42);
    EXPECT_EQ(PyObject_IsInstance(shell.ptr(), PyExc_Exception), 1);

    PyErr_SetObject(reinterpret_cast<PyObject*>(typeObject<Failure>()), shell.ptr());
    const HostError raised = HostError::fetch();
    EXPECT_TRUE(raised.matches(reinterpret_cast<PyObject*>(typeObject<Failure>())));
}

TEST(ClassShellTest, CreateWithHostSubclass) {
    OwnedRef globals = pn::testing::scope();
    pn::testing::setItem(globals.get(), "Animal", typeAsObject<Animal>());
    pn::testing::exec("class Puppy(Animal):\n    pass\n", globals.get());
    PyObject* puppy = PyDict_GetItemString(globals.get(), "Puppy");
    ASSERT_NE(puppy, nullptr);

    const int baseline = Tracked::live;
    {
        OwnedRef obj = ClassShell<Animal>::create(reinterpret_cast<PyTypeObject*>(puppy),
                                                  Initializer<Animal>::fromValue(Animal{"pup"}));
        EXPECT_EQ(reinterpret_cast<PyObject*>(Py_TYPE(obj.get())), puppy);
        EXPECT_EQ(ClassShell<Animal>::cast(obj.get()).get().name, "pup");
    }
    EXPECT_EQ(Tracked::live, baseline);
}
