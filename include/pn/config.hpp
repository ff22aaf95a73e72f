#pragma once

#include <string>

namespace pn {

// What to do when the same unmatched keyword name arrives twice and is folded
// into the extra-keyword dict. Only dynamic call paths can produce this.
enum class DuplicateKeywordPolicy {
    Overwrite,  // last value wins
    KeepFirst,  // first value wins
    Reject      // TypeError
};

struct Config {
    DuplicateKeywordPolicy duplicateKeywords{DuplicateKeywordPolicy::Overwrite};
    std::string errorLogPath{"Error.log"};
    bool logToStderr{true};

    // Reads PN_DUPLICATE_KEYWORDS, PN_ERROR_LOG and PN_LOG_STDERR; unset or
    // unrecognised variables keep the defaults above.
    static Config fromEnvironment();
};

// Process-wide settings. Seeded from the environment on first access.
const Config& config();
void setConfig(Config settings);

const char* toString(DuplicateKeywordPolicy policy);

} // namespace pn
