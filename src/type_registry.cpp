#include "pn/type_registry.hpp"
#include "pn/error.hpp"
#include "pn/error_logger.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>

namespace pn {

namespace {

// Names of the types currently in the Registering state, outermost first.
std::vector<std::string>& registrationStack() {
    static std::vector<std::string> stack;
    return stack;
}

class RegistrationScope {
public:
    explicit RegistrationScope(std::string name) { registrationStack().push_back(std::move(name)); }
    ~RegistrationScope() { registrationStack().pop_back(); }
    RegistrationScope(const RegistrationScope&) = delete;
    RegistrationScope& operator=(const RegistrationScope&) = delete;
};

} // namespace

// ============================================================================
// MethodDef
// ============================================================================

MethodDef MethodDef::makeNew(newfunc function) {
    MethodDef def;
    def.kind = Kind::New;
    def.name = "__new__";
    def.newFunction = function;
    return def;
}

MethodDef MethodDef::makeCall(ternaryfunc function) {
    MethodDef def;
    def.kind = Kind::Call;
    def.name = "__call__";
    def.callFunction = function;
    return def;
}

MethodDef MethodDef::makeMethod(const char* name, PyCFunctionWithKeywords function, const char* doc) {
    MethodDef def;
    def.kind = Kind::Method;
    def.name = name;
    def.doc = doc;
    def.method = function;
    return def;
}

MethodDef MethodDef::makeClassMethod(const char* name, PyCFunctionWithKeywords function, const char* doc) {
    MethodDef def = makeMethod(name, function, doc);
    def.kind = Kind::ClassMethod;
    return def;
}

MethodDef MethodDef::makeStaticMethod(const char* name, PyCFunctionWithKeywords function, const char* doc) {
    MethodDef def = makeMethod(name, function, doc);
    def.kind = Kind::StaticMethod;
    return def;
}

MethodDef MethodDef::makeGetter(const char* name, getter function, const char* doc) {
    MethodDef def;
    def.kind = Kind::Getter;
    def.name = name;
    def.doc = doc;
    def.get = function;
    return def;
}

MethodDef MethodDef::makeSetter(const char* name, setter function, const char* doc) {
    MethodDef def;
    def.kind = Kind::Setter;
    def.name = name;
    def.doc = doc;
    def.set = function;
    return def;
}

PyMethodDef MethodDef::asMethodDef() const {
    int flags = METH_VARARGS | METH_KEYWORDS;
    if (kind == Kind::ClassMethod) {
        flags |= METH_CLASS;
    } else if (kind == Kind::StaticMethod) {
        flags |= METH_STATIC;
    }
    return PyMethodDef{name, reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)()>(method)), flags, doc};
}

// ============================================================================
// TypeRegistration
// ============================================================================

TypeRegistration::TypeRegistration() {
    PyObject* header = reinterpret_cast<PyObject*>(&object_);
    Py_SET_REFCNT(header, 1);
    Py_SET_TYPE(header, &PyType_Type);
}

PyTypeObject* TypeRegistration::ensureReady(Describe describe) {
    switch (state_) {
        case State::Ready:
            return &object_;
        case State::Failed:
            throw RegistrationError(failure_);
        case State::Registering:
            throw RegistrationError("type '" + qualifiedName_ + "' is used while it is being registered");
        case State::Unregistered:
            break;
    }

    state_ = State::Registering;
    try {
        const TypeSpec spec = describe();
        qualifiedName_ = spec.module.empty() ? std::string(spec.name)
                                             : std::string(spec.module) + "." + std::string(spec.name);
        RegistrationScope scope(qualifiedName_);
        PyTypeObject* base = spec.base ? spec.base() : &PyBaseObject_Type;
        install(spec, base);
    } catch (const std::exception& e) {
        state_ = State::Failed;
        std::string displayName = qualifiedName_.empty() ? std::string("<unnamed>") : qualifiedName_;
        std::replace(displayName.begin(), displayName.end(), '\0', '?');
        failure_ = "failed to create type object for " + displayName + ": " + e.what();
        std::vector<std::string> chain = registrationStack();
        chain.push_back(displayName);
        ErrorLogger::instance().logHostError(failure_, displayName, chain);
        throw RegistrationError(failure_);
    }

    state_ = State::Ready;
    return &object_;
}

void TypeRegistration::install(const TypeSpec& spec, PyTypeObject* base) {
    if (!spec.layout || !spec.dealloc) {
        throw RegistrationError("type '" + qualifiedName_ + "' has no layout");
    }
    if (qualifiedName_.find('\0') != std::string::npos) {
        throw ValueError("type name contains a NUL byte");
    }

    object_.tp_name = qualifiedName_.c_str();

    if (spec.doc.empty()) {
        object_.tp_doc = nullptr;
    } else {
        if (spec.doc.find('\0') != std::string_view::npos) {
            throw ValueError("type doc contains a NUL byte");
        }
        doc_ = std::string(spec.doc);
        object_.tp_doc = doc_.c_str();
    }

    object_.tp_base = base;
    object_.tp_dealloc = spec.dealloc;

    const LayoutDescriptor& layout = *spec.layout;
    object_.tp_basicsize = static_cast<Py_ssize_t>(layout.basicSize);
    object_.tp_itemsize = 0;
    if (layout.dictOffset) {
        object_.tp_dictoffset = static_cast<Py_ssize_t>(*layout.dictOffset);
    }
    if (layout.weakrefOffset) {
        object_.tp_weaklistoffset = static_cast<Py_ssize_t>(*layout.weakrefOffset);
    }

    if (spec.gc) {
        object_.tp_traverse = spec.gc->traverse;
        object_.tp_clear = spec.gc->clear;
    }

    installSlots(spec);
    installMethods(spec);
    installProperties(spec);

    object_.tp_flags = computeFlags(spec, base);

    if (PyType_Ready(&object_) < 0) {
        throw HostError::fetch();
    }
}

void TypeRegistration::installSlots(const TypeSpec& spec) {
    if (spec.numberMethods) {
        numberMethods_ = std::make_unique<PyNumberMethods>(*spec.numberMethods);
        object_.tp_as_number = numberMethods_.get();
    }
    if (spec.mappingMethods) {
        mappingMethods_ = std::make_unique<PyMappingMethods>(*spec.mappingMethods);
        object_.tp_as_mapping = mappingMethods_.get();
    }
    if (spec.sequenceMethods) {
        sequenceMethods_ = std::make_unique<PySequenceMethods>(*spec.sequenceMethods);
        object_.tp_as_sequence = sequenceMethods_.get();
    }
    if (spec.asyncMethods) {
        asyncMethods_ = std::make_unique<PyAsyncMethods>(*spec.asyncMethods);
        object_.tp_as_async = asyncMethods_.get();
    }
    if (spec.bufferProcs) {
        bufferProcs_ = std::make_unique<PyBufferProcs>(*spec.bufferProcs);
        object_.tp_as_buffer = bufferProcs_.get();
    }

    if (spec.objectSlots) {
        const ObjectSlots& slots = *spec.objectSlots;
        object_.tp_repr = slots.repr;
        object_.tp_str = slots.str;
        object_.tp_hash = slots.hash;
        object_.tp_richcompare = slots.richcompare;
        object_.tp_getattro = slots.getattro;
        object_.tp_setattro = slots.setattro;
    }
    if (spec.iterSlots) {
        object_.tp_iter = spec.iterSlots->iter;
        object_.tp_iternext = spec.iterSlots->next;
    }
    if (spec.descrSlots) {
        object_.tp_descr_get = spec.descrSlots->get;
        object_.tp_descr_set = spec.descrSlots->set;
    }
}

void TypeRegistration::installMethods(const TypeSpec& spec) {
    bool hasCall = false;

    auto collect = [&](const std::vector<MethodDef>& defs) {
        for (const MethodDef& def : defs) {
            switch (def.kind) {
                case MethodDef::Kind::New:
                    if (hasConstructor_) {
                        throw RegistrationError("more than one constructor");
                    }
                    hasConstructor_ = true;
                    object_.tp_new = def.newFunction;
                    break;
                case MethodDef::Kind::Call:
                    if (hasCall) {
                        throw RegistrationError("more than one __call__ implementation");
                    }
                    hasCall = true;
                    object_.tp_call = def.callFunction;
                    break;
                case MethodDef::Kind::Method:
                case MethodDef::Kind::ClassMethod:
                case MethodDef::Kind::StaticMethod:
                    methodDefs_.push_back(def.asMethodDef());
                    break;
                case MethodDef::Kind::Getter:
                case MethodDef::Kind::Setter:
                    break;
            }
        }
    };

    collect(spec.methods);
    collect(spec.protocolMethods);

    if (!methodDefs_.empty()) {
        methodDefs_.push_back(PyMethodDef{nullptr, nullptr, 0, nullptr});
        object_.tp_methods = methodDefs_.data();
    }
}

void TypeRegistration::installProperties(const TypeSpec& spec) {
    for (const MethodDef& def : spec.methods) {
        if (def.kind != MethodDef::Kind::Getter && def.kind != MethodDef::Kind::Setter) {
            continue;
        }
        auto existing = std::find_if(getSetDefs_.begin(), getSetDefs_.end(), [&](const PyGetSetDef& entry) {
            return std::strcmp(entry.name, def.name) == 0;
        });
        if (existing == getSetDefs_.end()) {
            getSetDefs_.push_back(PyGetSetDef{def.name, nullptr, nullptr, def.doc, nullptr});
            existing = std::prev(getSetDefs_.end());
        }
        if (def.kind == MethodDef::Kind::Getter) {
            existing->get = def.get;
        } else {
            existing->set = def.set;
        }
        if (!existing->doc) {
            existing->doc = def.doc;
        }
    }

    if (spec.layout->dictOffset) {
        getSetDefs_.push_back(
            PyGetSetDef{"__dict__", PyObject_GenericGetDict, PyObject_GenericSetDict, nullptr, nullptr});
    }

    if (!getSetDefs_.empty()) {
        getSetDefs_.push_back(PyGetSetDef{nullptr, nullptr, nullptr, nullptr, nullptr});
        object_.tp_getset = getSetDefs_.data();
    }
}

unsigned long TypeRegistration::computeFlags(const TypeSpec& spec, PyTypeObject* base) const {
    unsigned long flags = Py_TPFLAGS_DEFAULT;
    if (spec.gc || spec.gcRequested) {
        flags |= Py_TPFLAGS_HAVE_GC;
    }
    if (spec.baseType) {
        flags |= Py_TPFLAGS_BASETYPE;
    }
    if (!hasConstructor_ && base != &PyBaseObject_Type) {
        flags |= Py_TPFLAGS_DISALLOW_INSTANTIATION;
    }
    return flags;
}

} // namespace pn
