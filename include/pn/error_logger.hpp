#pragma once

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace pn {

/**
 * ErrorLogger - Writes detailed error information to the configured error log
 * (Error.log by default) and echoes it to stderr.
 */
class ErrorLogger {
public:
    static ErrorLogger& instance() {
        static ErrorLogger inst;
        return inst;
    }

    // Log an error with source location
    void logError(const std::string& errorMessage,
                  const std::string& functionName = "",
                  const std::string& fileName = "",
                  int lineNumber = 0);

    // Log a failure reported against a host type object, with the chain of
    // types being registered when it happened (innermost last)
    void logHostError(const std::string& errorMessage,
                      const std::string& typeName,
                      const std::vector<std::string>& typeChain,
                      const std::string& additionalContext = "");

    // Log a general exception
    void logException(const std::exception& ex,
                      const std::string& context = "");

    // Add custom context to the next error log
    void addContext(const std::string& key, const std::string& value);
    void clearContext();

    void setLogPath(const std::string& path);
    const std::string& logPath() const { return logPath_; }
    void setEchoToStderr(bool echo) { echoToStderr_ = echo; }
    bool echoToStderr() const { return echoToStderr_; }

private:
    ErrorLogger();
    ~ErrorLogger() = default;

    std::string getTimestamp() const;
    std::string nativeBacktrace() const;
    void appendContext(std::string& out, const char* heading) const;
    void writeToFile(const std::string& content);

    std::string logPath_ = "Error.log";
    bool echoToStderr_ = true;
    std::vector<std::pair<std::string, std::string>> contextItems_;
};

#define PN_LOG_ERROR(msg) \
    pn::ErrorLogger::instance().logError(msg, __FUNCTION__, __FILE__, __LINE__)

#define PN_LOG_EXCEPTION(ex) \
    pn::ErrorLogger::instance().logException(ex, std::string(__FUNCTION__) + " at " + __FILE__ + ":" + std::to_string(__LINE__))

} // namespace pn
