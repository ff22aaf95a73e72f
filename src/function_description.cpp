#include "pn/function_description.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace pn {

namespace {

// str(object) for messages; names that are not valid UTF-8 fall back to ascii().
std::string objectText(PyObject* object) {
    PyObject* text = PyObject_Str(object);
    if (!text) {
        throw HostError::fetch();
    }
    const char* utf8 = PyUnicode_AsUTF8(text);
    if (!utf8) {
        PyErr_Clear();
        Py_DECREF(text);
        text = PyObject_ASCII(object);
        if (!text) {
            throw HostError::fetch();
        }
        utf8 = PyUnicode_AsUTF8(text);
    }
    if (!utf8) {
        Py_DECREF(text);
        throw HostError::fetch();
    }
    std::string result(utf8);
    Py_DECREF(text);
    return result;
}

} // namespace

// ============================================================================
// Parameter names and messages
// ============================================================================

std::string_view FunctionDescription::parameterName(std::size_t index) const {
    if (index < positionalParameterNames.size()) {
        return positionalParameterNames[index];
    }
    return keywordOnlyParameters[index - positionalParameterNames.size()].name;
}

std::string FunctionDescription::fullName() const {
    if (clsName) {
        return std::string(clsName) + "." + funcName + "()";
    }
    return std::string(funcName) + "()";
}

TypeError FunctionDescription::tooManyPositionalArguments(std::size_t argsProvided) const {
    const char* was = argsProvided == 1 ? "was" : "were";
    const std::size_t total = positionalParameterNames.size();
    std::string msg = fullName() + " takes ";
    if (requiredPositionalParameters != total) {
        msg += "from " + std::to_string(requiredPositionalParameters) + " to " + std::to_string(total);
    } else {
        msg += std::to_string(total);
    }
    msg += " positional arguments but " + std::to_string(argsProvided) + " " + was + " given";
    return TypeError(msg);
}

TypeError FunctionDescription::multipleValuesForArgument(std::string_view argument) const {
    return TypeError(fullName() + " got multiple values for argument '" + std::string(argument) + "'");
}

TypeError FunctionDescription::unexpectedKeywordArgument(PyObject* argument) const {
    return TypeError(fullName() + " got an unexpected keyword argument '" + objectText(argument) + "'");
}

TypeError FunctionDescription::positionalOnlyKeywordArguments(
    const std::vector<std::string_view>& parameterNames) const {
    std::string msg = fullName() + " got some positional-only arguments passed as keyword arguments: ";
    pushParameterList(msg, parameterNames);
    return TypeError(msg);
}

TypeError FunctionDescription::missingRequiredArguments(
    std::string_view argumentType,
    const std::vector<std::string_view>& parameterNames) const {
    const char* arguments = parameterNames.size() == 1 ? "argument" : "arguments";
    std::string msg = fullName() + " missing " + std::to_string(parameterNames.size()) + " required " +
                      std::string(argumentType) + " " + arguments + ": ";
    pushParameterList(msg, parameterNames);
    return TypeError(msg);
}

// ============================================================================
// Binding
// ============================================================================

ExtractedArguments FunctionDescription::extractArguments(std::span<PyObject* const> args,
                                                         std::span<const KeywordArgument> kwargs,
                                                         std::span<PyObject*> output) const {
    return extractArguments(args, kwargs, output, config().duplicateKeywords);
}

ExtractedArguments FunctionDescription::extractArguments(std::span<PyObject* const> args,
                                                         std::span<const KeywordArgument> kwargs,
                                                         std::span<PyObject*> output,
                                                         DuplicateKeywordPolicy duplicates) const {
    const std::size_t numPositional = positionalParameterNames.size();

    if (positionalOnlyParameters > numPositional || requiredPositionalParameters > numPositional) {
        throw std::invalid_argument(fullName() + " has an inconsistent parameter signature");
    }
    if (output.size() != slotCount()) {
        throw std::invalid_argument(fullName() + " expects " + std::to_string(slotCount()) +
                                    " output slots, got " + std::to_string(output.size()));
    }

    ExtractedArguments extracted;

    // Positional arguments
    std::size_t argsProvided = args.size();
    if (acceptVarargs) {
        argsProvided = std::min(numPositional, args.size());
    } else if (argsProvided > numPositional) {
        throw tooManyPositionalArguments(argsProvided);
    }

    std::copy_n(args.begin(), argsProvided, output.begin());

    if (acceptVarargs) {
        const auto remaining = args.subspan(argsProvided);
        PyObject* tuple = PyTuple_New(static_cast<Py_ssize_t>(remaining.size()));
        if (!tuple) {
            throw HostError::fetch();
        }
        extracted.varargs = OwnedRef::steal(tuple);
        for (std::size_t i = 0; i < remaining.size(); ++i) {
            Py_INCREF(remaining[i]);
            PyTuple_SET_ITEM(tuple, static_cast<Py_ssize_t>(i), remaining[i]);
        }
    }

    // Keyword arguments
    auto positionalOutput = output.first(numPositional);
    auto keywordOutput = output.subspan(numPositional);
    std::vector<std::string_view> positionalOnlyKeywordNames;

    for (const auto& [kwargName, value] : kwargs) {
        if (!PyUnicode_Check(kwargName)) {
            throw TypeError(fullName() + " keywords must be strings");
        }

        Py_ssize_t length = 0;
        const char* utf8 = PyUnicode_AsUTF8AndSize(kwargName, &length);
        bool matched = false;
        if (utf8) {
            const std::string_view name(utf8, static_cast<std::size_t>(length));

            // Same linear scan CPython itself uses to map keyword names.
            for (std::size_t i = 0; i < keywordOnlyParameters.size(); ++i) {
                if (keywordOnlyParameters[i].name == name) {
                    keywordOutput[i] = value;
                    matched = true;
                    break;
                }
            }

            for (std::size_t i = 0; !matched && i < numPositional; ++i) {
                if (positionalParameterNames[i] != name) {
                    continue;
                }
                matched = true;
                if (i < positionalOnlyParameters) {
                    positionalOnlyKeywordNames.push_back(positionalParameterNames[i]);
                } else if (std::exchange(positionalOutput[i], value) != nullptr) {
                    throw multipleValuesForArgument(positionalParameterNames[i]);
                }
            }
        } else {
            // Not encodable as UTF-8, so it cannot name any declared parameter.
            PyErr_Clear();
        }

        if (matched) {
            continue;
        }

        if (!acceptVarkeywords) {
            throw unexpectedKeywordArgument(kwargName);
        }

        if (!extracted.varkwargs) {
            PyObject* dict = PyDict_New();
            if (!dict) {
                throw HostError::fetch();
            }
            extracted.varkwargs = OwnedRef::steal(dict);
        }

        PyObject* dict = extracted.varkwargs.get();
        switch (duplicates) {
            case DuplicateKeywordPolicy::Overwrite:
                if (PyDict_SetItem(dict, kwargName, value) < 0) {
                    throw HostError::fetch();
                }
                break;
            case DuplicateKeywordPolicy::KeepFirst:
                if (!PyDict_SetDefault(dict, kwargName, value)) {
                    throw HostError::fetch();
                }
                break;
            case DuplicateKeywordPolicy::Reject: {
                const int present = PyDict_Contains(dict, kwargName);
                if (present < 0) {
                    throw HostError::fetch();
                }
                if (present) {
                    throw TypeError(fullName() + " got multiple values for keyword argument '" +
                                    objectText(kwargName) + "'");
                }
                if (PyDict_SetItem(dict, kwargName, value) < 0) {
                    throw HostError::fetch();
                }
                break;
            }
        }
    }

    if (!positionalOnlyKeywordNames.empty()) {
        throw positionalOnlyKeywordArguments(positionalOnlyKeywordNames);
    }

    // Sufficient positional arguments once keywords are in place
    if (argsProvided < requiredPositionalParameters) {
        std::vector<std::string_view> missing;
        for (std::size_t i = 0; i < requiredPositionalParameters; ++i) {
            if (!positionalOutput[i]) {
                missing.push_back(positionalParameterNames[i]);
            }
        }
        if (!missing.empty()) {
            throw missingRequiredArguments("positional", missing);
        }
    }

    std::vector<std::string_view> missingKeywordOnly;
    for (std::size_t i = 0; i < keywordOnlyParameters.size(); ++i) {
        if (keywordOnlyParameters[i].required && !keywordOutput[i]) {
            missingKeywordOnly.push_back(keywordOnlyParameters[i].name);
        }
    }
    if (!missingKeywordOnly.empty()) {
        throw missingRequiredArguments("keyword", missingKeywordOnly);
    }

    return extracted;
}

ExtractedArguments FunctionDescription::extractTupleDict(PyObject* args,
                                                         PyObject* kwargs,
                                                         std::span<PyObject*> output) const {
    std::span<PyObject* const> positional;
    if (args) {
        if (!PyTuple_Check(args)) {
            throw TypeError(fullName() + " expected a tuple of positional arguments");
        }
        positional = std::span<PyObject* const>(PySequence_Fast_ITEMS(args),
                                                static_cast<std::size_t>(PyTuple_GET_SIZE(args)));
    }

    std::vector<KeywordArgument> keywords;
    if (kwargs) {
        if (!PyDict_Check(kwargs)) {
            throw TypeError(fullName() + " expected a dict of keyword arguments");
        }
        keywords.reserve(static_cast<std::size_t>(PyDict_GET_SIZE(kwargs)));
        Py_ssize_t pos = 0;
        PyObject* key = nullptr;
        PyObject* value = nullptr;
        while (PyDict_Next(kwargs, &pos, &key, &value)) {
            keywords.push_back({key, value});
        }
    }

    return extractArguments(positional, keywords, output);
}

ExtractedArguments FunctionDescription::extractFastcall(PyObject* const* args,
                                                        Py_ssize_t nargs,
                                                        PyObject* kwnames,
                                                        std::span<PyObject*> output) const {
    const std::size_t positionalCount = static_cast<std::size_t>(PyVectorcall_NARGS(nargs));
    std::span<PyObject* const> positional(args, positionalCount);

    std::vector<KeywordArgument> keywords;
    if (kwnames) {
        const Py_ssize_t count = PyTuple_GET_SIZE(kwnames);
        keywords.reserve(static_cast<std::size_t>(count));
        for (Py_ssize_t i = 0; i < count; ++i) {
            keywords.push_back({PyTuple_GET_ITEM(kwnames, i), args[positionalCount + static_cast<std::size_t>(i)]});
        }
    }

    return extractArguments(positional, keywords, output);
}

// ============================================================================
// Helpers
// ============================================================================

void pushParameterList(std::string& msg, const std::vector<std::string_view>& parameterNames) {
    for (std::size_t i = 0; i < parameterNames.size(); ++i) {
        if (i != 0) {
            if (parameterNames.size() > 2) {
                msg.push_back(',');
            }
            if (i == parameterNames.size() - 1) {
                msg += " and ";
            } else {
                msg.push_back(' ');
            }
        }
        msg.push_back('\'');
        msg.append(parameterNames[i]);
        msg.push_back('\'');
    }
}

HostError argumentExtractionError(std::string_view argName, const HostError& error) {
    if (error.matches(PyExc_TypeError)) {
        return TypeError("argument '" + std::string(argName) + "': " + error.what());
    }
    return error;
}

} // namespace pn
