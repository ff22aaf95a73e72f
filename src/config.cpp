#include "pn/config.hpp"
#include "pn/error_logger.hpp"

#include <cstdlib>
#include <string_view>
#include <utility>

namespace pn {

namespace {

Config& mutableConfig() {
    static Config settings = Config::fromEnvironment();
    return settings;
}

void applySettings(const Config& settings) {
    ErrorLogger::instance().setLogPath(settings.errorLogPath);
    ErrorLogger::instance().setEchoToStderr(settings.logToStderr);
}

} // namespace

Config Config::fromEnvironment() {
    Config settings;

    if (const char* policy = std::getenv("PN_DUPLICATE_KEYWORDS")) {
        const std::string_view value(policy);
        if (value == "overwrite") {
            settings.duplicateKeywords = DuplicateKeywordPolicy::Overwrite;
        } else if (value == "first") {
            settings.duplicateKeywords = DuplicateKeywordPolicy::KeepFirst;
        } else if (value == "reject") {
            settings.duplicateKeywords = DuplicateKeywordPolicy::Reject;
        }
    }

    if (const char* path = std::getenv("PN_ERROR_LOG")) {
        if (*path != '\0') {
            settings.errorLogPath = path;
        }
    }

    if (const char* echo = std::getenv("PN_LOG_STDERR")) {
        const std::string_view value(echo);
        if (value == "0") {
            settings.logToStderr = false;
        } else if (value == "1") {
            settings.logToStderr = true;
        }
    }

    return settings;
}

const Config& config() {
    return mutableConfig();
}

void setConfig(Config settings) {
    mutableConfig() = std::move(settings);
    applySettings(mutableConfig());
}

const char* toString(DuplicateKeywordPolicy policy) {
    switch (policy) {
        case DuplicateKeywordPolicy::Overwrite:
            return "overwrite";
        case DuplicateKeywordPolicy::KeepFirst:
            return "first";
        case DuplicateKeywordPolicy::Reject:
            return "reject";
    }
    return "unknown";
}

} // namespace pn
