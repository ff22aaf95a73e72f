#pragma once

#include "pn/config.hpp"
#include "pn/error.hpp"
#include "pn/object.hpp"

#include <Python.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pn {

struct KeywordOnlyParameterDescription {
    std::string_view name;
    bool required{false};
};

// One keyword argument as presented by the caller. Both pointers are borrowed.
struct KeywordArgument {
    PyObject* name;
    PyObject* value;
};

// Excess arguments captured by a successful binding. varargs is a tuple
// (possibly empty) whenever the signature accepts extra positional arguments;
// varkwargs is a dict only once an extra keyword has actually been captured.
struct ExtractedArguments {
    OwnedRef varargs;
    OwnedRef varkwargs;
};

// ============================================================================
// FunctionDescription - the parameter signature of one bound callable
// ============================================================================
// Static for the lifetime of the process; binding never mutates it.
//
//   static constexpr std::string_view kParams[] = {"x", "y"};
//   static constexpr pn::FunctionDescription kMove{
//       .clsName = "Point",
//       .funcName = "move",
//       .positionalParameterNames = kParams,
//       .requiredPositionalParameters = 1,
//   };

struct FunctionDescription {
    const char* clsName{nullptr};
    const char* funcName{""};
    std::span<const std::string_view> positionalParameterNames{};
    std::size_t positionalOnlyParameters{0};
    std::size_t requiredPositionalParameters{0};
    std::span<const KeywordOnlyParameterDescription> keywordOnlyParameters{};
    bool acceptVarargs{false};
    bool acceptVarkeywords{false};

    constexpr std::size_t slotCount() const {
        return positionalParameterNames.size() + keywordOnlyParameters.size();
    }

    // Name of the parameter bound to output slot `index`.
    std::string_view parameterName(std::size_t index) const;

    // "Cls.func()" or "func()"
    std::string fullName() const;

    // Binds `args` and `kwargs` into `output`, which must hold exactly
    // slotCount() entries, all null on entry. Filled entries are borrowed from
    // the inputs. Throws TypeError for any binding failure.
    ExtractedArguments extractArguments(std::span<PyObject* const> args,
                                        std::span<const KeywordArgument> kwargs,
                                        std::span<PyObject*> output,
                                        DuplicateKeywordPolicy duplicates) const;
    ExtractedArguments extractArguments(std::span<PyObject* const> args,
                                        std::span<const KeywordArgument> kwargs,
                                        std::span<PyObject*> output) const;

    // METH_VARARGS | METH_KEYWORDS convention: a tuple and an optional dict.
    ExtractedArguments extractTupleDict(PyObject* args,
                                        PyObject* kwargs,
                                        std::span<PyObject*> output) const;

    // Vectorcall convention: nargs positional values followed by one value
    // per entry of the kwnames tuple.
    ExtractedArguments extractFastcall(PyObject* const* args,
                                       Py_ssize_t nargs,
                                       PyObject* kwnames,
                                       std::span<PyObject*> output) const;

    TypeError tooManyPositionalArguments(std::size_t argsProvided) const;
    TypeError multipleValuesForArgument(std::string_view argument) const;
    TypeError unexpectedKeywordArgument(PyObject* argument) const;
    TypeError positionalOnlyKeywordArguments(const std::vector<std::string_view>& parameterNames) const;
    TypeError missingRequiredArguments(std::string_view argumentType,
                                       const std::vector<std::string_view>& parameterNames) const;
};

// Appends 'a', 'a' and 'b', or 'a', 'b', and 'c' to msg.
void pushParameterList(std::string& msg, const std::vector<std::string_view>& parameterNames);

// Prefix a TypeError raised while converting a bound argument with the
// argument's name. Other errors are returned unchanged.
HostError argumentExtractionError(std::string_view argName, const HostError& error);

} // namespace pn
