// Template implementations for binding.hpp
// This file is automatically included by binding.hpp

#pragma once

namespace pn {

namespace detail {

// ============================================================================
// TypeConverter for native classes
// ============================================================================

// Pass-by-value: copies the payload out of the instance.
template<PyClass T>
struct TypeConverter<T> {
    static T fromValue(PyObject* obj) {
        return ClassShell<T>::cast(obj).get();
    }
    static OwnedRef toValue(const T& val) {
        return OwnedRef::borrow(ClassShell<T>::newRef(val).ptr());
    }
    static OwnedRef toValue(T&& val) {
        ShellRef<T> shell = ClassShell<T>::newRef(std::move(val));
        return OwnedRef::steal(shell.release());
    }
};

template<PyClass T, bool Mutable>
struct TypeConverter<ShellHandle<T, Mutable>> {
    static ShellHandle<T, Mutable> fromValue(PyObject* obj) {
        return ShellHandle<T, Mutable>(OwnedRef::borrow(ClassShell<T>::cast(obj).ptr()));
    }
    static OwnedRef toValue(const ShellHandle<T, Mutable>& val) {
        return val.object();
    }
};

// ============================================================================
// Argument holders
// ============================================================================

template<typename P>
struct ArgHolder {
    using Value = std::remove_cvref_t<P>;
    Value value;

    decltype(auto) get() {
        if constexpr (std::is_lvalue_reference_v<P>) {
            return (value);
        } else {
            return std::move(value);
        }
    }
};

// Native class references point straight into the instance.
template<PyClass T>
struct ArgHolder<T&> {
    T* ptr;
    T& get() { return *ptr; }
};

template<PyClass T>
struct ArgHolder<const T&> {
    const T* ptr;
    const T& get() { return *ptr; }
};

template<typename P>
struct IsOptional : std::false_type {};

template<typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template<const FunctionDescription& Desc, typename P, std::size_t Slot>
ArgHolder<P> makeHolder(std::span<PyObject*> slots, ExtractedArguments& extracted) {
    using Value = std::remove_cvref_t<P>;

    if constexpr (std::is_same_v<Value, Args>) {
        static_assert(Desc.acceptVarargs, "Args parameter requires acceptVarargs");
        return ArgHolder<P>{Args{extracted.varargs}};
    } else if constexpr (std::is_same_v<Value, Kwargs>) {
        static_assert(Desc.acceptVarkeywords, "Kwargs parameter requires acceptVarkeywords");
        return ArgHolder<P>{Kwargs{extracted.varkwargs}};
    } else {
        PyObject* obj = slots[Slot];
        if (!obj) {
            if constexpr (IsOptional<Value>::value) {
                return ArgHolder<P>{std::nullopt};
            } else {
                const bool keywordOnly = Slot >= Desc.positionalParameterNames.size();
                throw Desc.missingRequiredArguments(keywordOnly ? "keyword" : "positional",
                                                    {Desc.parameterName(Slot)});
            }
        }

        try {
            if constexpr (std::is_lvalue_reference_v<P> && PyClass<Value>) {
                return ArgHolder<P>{&ClassShell<Value>::cast(obj).get()};
            } else {
                return ArgHolder<P>{TypeConverter<Value>::fromValue(obj)};
            }
        } catch (const HostError& error) {
            throw argumentExtractionError(Desc.parameterName(Slot), error);
        }
    }
}

// ============================================================================
// Binder - extract, convert, invoke
// ============================================================================

template<const FunctionDescription& Desc, typename... Ps>
struct Binder {
    static_assert(slotParameterCount<Ps...> == Desc.slotCount(),
                  "parameter list does not match the function description");

    static constexpr std::array<std::size_t, sizeof...(Ps)> kSlots = slotIndices<Ps...>();

    template<typename Invoke>
    static decltype(auto) run(PyObject* args, PyObject* kwargs, Invoke&& invoke) {
        std::array<PyObject*, Desc.slotCount()> slots{};
        ExtractedArguments extracted = Desc.extractTupleDict(args, kwargs, slots);
        return runWith(slots, extracted, std::forward<Invoke>(invoke), std::index_sequence_for<Ps...>{});
    }

private:
    template<typename Invoke, std::size_t... Is>
    static decltype(auto) runWith(std::span<PyObject*> slots,
                                  ExtractedArguments& extracted,
                                  Invoke&& invoke,
                                  std::index_sequence<Is...>) {
        // Braced initialization converts strictly left to right.
        std::tuple<ArgHolder<Ps>...> holders{makeHolder<Desc, Ps, kSlots[Is]>(slots, extracted)...};
        return std::forward<Invoke>(invoke)(std::get<Is>(holders).get()...);
    }
};

template<typename R>
PyObject* toHost(R&& value) {
    using Value = std::remove_cvref_t<R>;
    OwnedRef result = TypeConverter<Value>::toValue(std::forward<R>(value));
    if (!result) {
        throw HostError::fetch();
    }
    return result.release();
}

template<typename F, typename... A>
PyObject* invokeAndConvert(F&& f, A&&... args) {
    using R = std::invoke_result_t<F, A...>;
    if constexpr (std::is_void_v<R>) {
        std::invoke(std::forward<F>(f), std::forward<A>(args)...);
        Py_RETURN_NONE;
    } else {
        return toHost(std::invoke(std::forward<F>(f), std::forward<A>(args)...));
    }
}

// ============================================================================
// Shims
// ============================================================================

template<const FunctionDescription& Desc, auto Fn, typename F = decltype(Fn)>
struct FunctionShim;

template<const FunctionDescription& Desc, auto Fn, typename R, typename... Ps>
struct FunctionShim<Desc, Fn, R (*)(Ps...)> {
    static PyObject* invoke(PyObject*, PyObject* args, PyObject* kwargs) {
        try {
            return Binder<Desc, Ps...>::run(args, kwargs, [](auto&&... values) {
                return invokeAndConvert(Fn, std::forward<decltype(values)>(values)...);
            });
        } catch (const std::exception& e) {
            raiseInHost(e);
            return nullptr;
        }
    }
};

template<const FunctionDescription& Desc, auto Fn, typename F = decltype(Fn)>
struct ClassMethodShim;

template<const FunctionDescription& Desc, auto Fn, typename R, typename... Ps>
struct ClassMethodShim<Desc, Fn, R (*)(PyTypeObject*, Ps...)> {
    static PyObject* invoke(PyObject* cls, PyObject* args, PyObject* kwargs) {
        try {
            PyTypeObject* type = reinterpret_cast<PyTypeObject*>(cls);
            return Binder<Desc, Ps...>::run(args, kwargs, [type](auto&&... values) {
                return invokeAndConvert(Fn, type, std::forward<decltype(values)>(values)...);
            });
        } catch (const std::exception& e) {
            raiseInHost(e);
            return nullptr;
        }
    }
};

template<const FunctionDescription& Desc, auto Fn, typename F = decltype(Fn)>
struct MethodShim;

template<const FunctionDescription& Desc, auto Fn, typename C, typename R, typename... Ps>
struct MethodShim<Desc, Fn, R (C::*)(Ps...)> {
    static PyObject* invoke(PyObject* self, PyObject* args, PyObject* kwargs) {
        try {
            C& instance = ClassShell<C>::cast(self).get();
            return Binder<Desc, Ps...>::run(args, kwargs, [&instance](auto&&... values) {
                return invokeAndConvert(Fn, instance, std::forward<decltype(values)>(values)...);
            });
        } catch (const std::exception& e) {
            raiseInHost(e);
            return nullptr;
        }
    }
};

template<const FunctionDescription& Desc, auto Fn, typename C, typename R, typename... Ps>
struct MethodShim<Desc, Fn, R (C::*)(Ps...) const> {
    static PyObject* invoke(PyObject* self, PyObject* args, PyObject* kwargs) {
        try {
            const C& instance = ClassShell<C>::cast(self).get();
            return Binder<Desc, Ps...>::run(args, kwargs, [&instance](auto&&... values) {
                return invokeAndConvert(Fn, instance, std::forward<decltype(values)>(values)...);
            });
        } catch (const std::exception& e) {
            raiseInHost(e);
            return nullptr;
        }
    }
};

template<const FunctionDescription& Desc, auto Fn, typename F = decltype(Fn)>
struct ConstructorShim;

template<const FunctionDescription& Desc, auto Fn, typename R, typename... Ps>
struct ConstructorShim<Desc, Fn, R (*)(Ps...)> {
    using Class = typename ConstructedClass<R>::type;
    static_assert(PyClass<Class>, "constructor must return a native class or its Initializer");

    static PyObject* invoke(PyTypeObject* subtype, PyObject* args, PyObject* kwargs) {
        try {
            Initializer<Class> initializer = Binder<Desc, Ps...>::run(args, kwargs, [](auto&&... values) {
                return intoInitializer<Class>(Fn(std::forward<decltype(values)>(values)...));
            });
            return ClassShell<Class>::create(subtype, std::move(initializer)).release();
        } catch (const std::exception& e) {
            raiseInHost(e);
            return nullptr;
        }
    }
};

template<auto Member>
struct GetterShim {
    using Class = typename MemberTraits<decltype(Member)>::Class;

    static PyObject* get(PyObject* self, void*) {
        try {
            const Class& instance = ClassShell<Class>::cast(self).get();
            if constexpr (std::is_member_function_pointer_v<decltype(Member)>) {
                return toHost((instance.*Member)());
            } else {
                return toHost(instance.*Member);
            }
        } catch (const std::exception& e) {
            raiseInHost(e);
            return nullptr;
        }
    }
};

template<auto Member, typename M = decltype(Member)>
struct SetterValue {
    using type = std::remove_cvref_t<decltype(std::declval<typename MemberTraits<M>::Class&>().*Member)>;
};

template<auto Member, typename C, typename A>
struct SetterValue<Member, void (C::*)(A)> {
    using type = std::remove_cvref_t<A>;
};

template<auto Member>
struct SetterShim {
    using Class = typename MemberTraits<decltype(Member)>::Class;
    using Value = typename SetterValue<Member>::type;

    static int set(PyObject* self, PyObject* value, void*) {
        try {
            if (!value) {
                throw TypeError("attribute cannot be deleted");
            }
            Class& instance = ClassShell<Class>::cast(self).get();
            if constexpr (std::is_member_function_pointer_v<decltype(Member)>) {
                (instance.*Member)(TypeConverter<Value>::fromValue(value));
            } else {
                instance.*Member = TypeConverter<Value>::fromValue(value);
            }
            return 0;
        } catch (const std::exception& e) {
            raiseInHost(e);
            return -1;
        }
    }
};

template<typename F>
PyCFunction asCFunction(F function) {
    return reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)()>(function));
}

} // namespace detail

// ============================================================================
// Factories
// ============================================================================

template<const FunctionDescription& Desc, auto Fn>
PyMethodDef function(const char* doc) {
    return PyMethodDef{Desc.funcName,
                       detail::asCFunction(&detail::FunctionShim<Desc, Fn>::invoke),
                       METH_VARARGS | METH_KEYWORDS,
                       doc};
}

template<const FunctionDescription& Desc, auto Fn>
MethodDef method(const char* doc) {
    return MethodDef::makeMethod(Desc.funcName, &detail::MethodShim<Desc, Fn>::invoke, doc);
}

template<const FunctionDescription& Desc, auto Fn>
MethodDef staticMethod(const char* doc) {
    return MethodDef::makeStaticMethod(Desc.funcName, &detail::FunctionShim<Desc, Fn>::invoke, doc);
}

template<const FunctionDescription& Desc, auto Fn>
MethodDef classMethod(const char* doc) {
    return MethodDef::makeClassMethod(Desc.funcName, &detail::ClassMethodShim<Desc, Fn>::invoke, doc);
}

template<const FunctionDescription& Desc, auto Fn>
MethodDef call() {
    return MethodDef::makeCall(&detail::MethodShim<Desc, Fn>::invoke);
}

template<const FunctionDescription& Desc, auto Fn>
MethodDef constructor() {
    return MethodDef::makeNew(&detail::ConstructorShim<Desc, Fn>::invoke);
}

template<auto Member>
MethodDef getter(const char* name, const char* doc) {
    return MethodDef::makeGetter(name, &detail::GetterShim<Member>::get, doc);
}

template<auto Member>
MethodDef setter(const char* name, const char* doc) {
    return MethodDef::makeSetter(name, &detail::SetterShim<Member>::set, doc);
}

template<PyClass T>
void addType(PyObject* module) {
    const std::string name(ClassInfo<T>::name);
    if (PyModule_AddObjectRef(module, name.c_str(), typeAsObject<T>()) < 0) {
        throw HostError::fetch();
    }
}

} // namespace pn
