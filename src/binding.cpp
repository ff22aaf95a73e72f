#include "pn/binding.hpp"

#include <limits>

namespace pn::detail {

namespace {

OwnedRef checked(PyObject* result) {
    if (!result) {
        throw HostError::fetch();
    }
    return OwnedRef::steal(result);
}

[[noreturn]] void throwOverflow(const char* target) {
    throw HostError(PyExc_OverflowError, std::string("Python int too large to convert to ") + target);
}

} // namespace

std::string typeNameOf(PyObject* obj) {
    return "'" + std::string(Py_TYPE(obj)->tp_name) + "' object";
}

// ============================================================================
// Integers
// ============================================================================

std::int64_t TypeConverter<std::int64_t>::fromValue(PyObject* obj) {
    const long long value = PyLong_AsLongLong(obj);
    if (value == -1 && PyErr_Occurred()) {
        throw HostError::fetch();
    }
    return static_cast<std::int64_t>(value);
}

OwnedRef TypeConverter<std::int64_t>::toValue(std::int64_t val) {
    return checked(PyLong_FromLongLong(val));
}

std::uint64_t TypeConverter<std::uint64_t>::fromValue(PyObject* obj) {
    if (!PyLong_Check(obj)) {
        throw TypeError(typeNameOf(obj) + " cannot be interpreted as an integer");
    }
    const unsigned long long value = PyLong_AsUnsignedLongLong(obj);
    if (value == static_cast<unsigned long long>(-1) && PyErr_Occurred()) {
        throw HostError::fetch();
    }
    return static_cast<std::uint64_t>(value);
}

OwnedRef TypeConverter<std::uint64_t>::toValue(std::uint64_t val) {
    return checked(PyLong_FromUnsignedLongLong(val));
}

std::int32_t TypeConverter<std::int32_t>::fromValue(PyObject* obj) {
    const std::int64_t value = TypeConverter<std::int64_t>::fromValue(obj);
    if (value < std::numeric_limits<std::int32_t>::min() || value > std::numeric_limits<std::int32_t>::max()) {
        throwOverflow("i32");
    }
    return static_cast<std::int32_t>(value);
}

OwnedRef TypeConverter<std::int32_t>::toValue(std::int32_t val) {
    return checked(PyLong_FromLong(val));
}

std::uint32_t TypeConverter<std::uint32_t>::fromValue(PyObject* obj) {
    const std::uint64_t value = TypeConverter<std::uint64_t>::fromValue(obj);
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        throwOverflow("u32");
    }
    return static_cast<std::uint32_t>(value);
}

OwnedRef TypeConverter<std::uint32_t>::toValue(std::uint32_t val) {
    return checked(PyLong_FromUnsignedLong(val));
}

// ============================================================================
// Floating point, bool, strings
// ============================================================================

double TypeConverter<double>::fromValue(PyObject* obj) {
    const double value = PyFloat_AsDouble(obj);
    if (value == -1.0 && PyErr_Occurred()) {
        throw HostError::fetch();
    }
    return value;
}

OwnedRef TypeConverter<double>::toValue(double val) {
    return checked(PyFloat_FromDouble(val));
}

bool TypeConverter<bool>::fromValue(PyObject* obj) {
    if (!PyBool_Check(obj)) {
        throw TypeError(typeNameOf(obj) + " is not an instance of 'bool'");
    }
    return obj == Py_True;
}

OwnedRef TypeConverter<bool>::toValue(bool val) {
    return checked(PyBool_FromLong(val ? 1 : 0));
}

std::string TypeConverter<std::string>::fromValue(PyObject* obj) {
    if (!PyUnicode_Check(obj)) {
        throw TypeError(typeNameOf(obj) + " is not an instance of 'str'");
    }
    Py_ssize_t size = 0;
    const char* utf8 = PyUnicode_AsUTF8AndSize(obj, &size);
    if (!utf8) {
        throw HostError::fetch();
    }
    return std::string(utf8, static_cast<std::size_t>(size));
}

OwnedRef TypeConverter<std::string>::toValue(const std::string& val) {
    return checked(PyUnicode_FromStringAndSize(val.data(), static_cast<Py_ssize_t>(val.size())));
}

OwnedRef TypeConverter<const char*>::toValue(const char* val) {
    return checked(PyUnicode_FromString(val));
}

OwnedRef TypeConverter<OwnedRef>::toValue(const OwnedRef& val) {
    if (!val) {
        throw HostError::fetch();
    }
    return val;
}

} // namespace pn::detail
