#include "pn/config.hpp"
#include "pn/error_logger.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

using namespace pn;

namespace {

// Restores an environment variable when the test ends.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
            hadOld_ = true;
        }
        setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (hadOld_) {
            setenv(name_, old_.c_str(), 1);
        } else {
            unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::string old_;
    bool hadOld_{false};
};

} // namespace

TEST(ConfigTest, DefaultsWhenUnset) {
    const Config defaults;
    EXPECT_EQ(defaults.duplicateKeywords, DuplicateKeywordPolicy::Overwrite);
    EXPECT_EQ(defaults.errorLogPath, "Error.log");
    EXPECT_TRUE(defaults.logToStderr);
}

TEST(ConfigTest, ReadsDuplicateKeywordPolicy) {
    {
        ScopedEnv env("PN_DUPLICATE_KEYWORDS", "first");
        EXPECT_EQ(Config::fromEnvironment().duplicateKeywords, DuplicateKeywordPolicy::KeepFirst);
    }
    {
        ScopedEnv env("PN_DUPLICATE_KEYWORDS", "reject");
        EXPECT_EQ(Config::fromEnvironment().duplicateKeywords, DuplicateKeywordPolicy::Reject);
    }
    {
        ScopedEnv env("PN_DUPLICATE_KEYWORDS", "sideways");
        EXPECT_EQ(Config::fromEnvironment().duplicateKeywords, DuplicateKeywordPolicy::Overwrite);
    }
}

TEST(ConfigTest, ReadsLoggingSettings) {
    ScopedEnv log("PN_ERROR_LOG", "custom.log");
    ScopedEnv echo("PN_LOG_STDERR", "0");
    const Config settings = Config::fromEnvironment();
    EXPECT_EQ(settings.errorLogPath, "custom.log");
    EXPECT_FALSE(settings.logToStderr);
}

TEST(ConfigTest, SetConfigUpdatesLogger) {
    const Config saved = config();

    Config changed = saved;
    changed.errorLogPath = "config_test_error.log";
    changed.duplicateKeywords = DuplicateKeywordPolicy::Reject;
    setConfig(changed);

    EXPECT_EQ(config().duplicateKeywords, DuplicateKeywordPolicy::Reject);
    EXPECT_EQ(ErrorLogger::instance().logPath(), "config_test_error.log");

    setConfig(saved);
    EXPECT_EQ(ErrorLogger::instance().logPath(), saved.errorLogPath);
}

TEST(ConfigTest, PolicyNames) {
    EXPECT_STREQ(toString(DuplicateKeywordPolicy::Overwrite), "overwrite");
    EXPECT_STREQ(toString(DuplicateKeywordPolicy::KeepFirst), "first");
    EXPECT_STREQ(toString(DuplicateKeywordPolicy::Reject), "reject");
}
