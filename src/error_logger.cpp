#include "pn/error_logger.hpp"
#include "pn/config.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <typeinfo>

#if defined(__GLIBC__)
#include <execinfo.h>
#include <cstdlib>
#endif

namespace pn {

namespace {

constexpr const char* kBanner =
    "================================================================================\n";

} // namespace

ErrorLogger::ErrorLogger() {
    // Only the environment here: config() may itself log while loading.
    const Config settings = Config::fromEnvironment();
    logPath_ = settings.errorLogPath;
    echoToStderr_ = settings.logToStderr;
}

std::string ErrorLogger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string ErrorLogger::nativeBacktrace() const {
    std::ostringstream oss;
#if defined(__GLIBC__)
    void* stack[64];
    const int frames = backtrace(stack, 64);
    char** symbols = backtrace_symbols(stack, frames);
    if (symbols) {
        oss << "\n--- Native Stack Trace ---\n";
        for (int i = 0; i < frames; ++i) {
            oss << "  [" << std::setw(2) << i << "] " << symbols[i] << "\n";
        }
        std::free(symbols);
    }
#endif
    return oss.str();
}

void ErrorLogger::appendContext(std::string& out, const char* heading) const {
    if (contextItems_.empty()) {
        return;
    }
    std::ostringstream oss;
    oss << "\n--- " << heading << " ---\n";
    for (const auto& item : contextItems_) {
        oss << item.first << ": " << item.second << "\n";
    }
    out += oss.str();
}

void ErrorLogger::writeToFile(const std::string& content) {
    std::ofstream ofs(logPath_, std::ios::app);
    if (ofs.is_open()) {
        ofs << content;
        ofs.flush();
    }
    if (echoToStderr_) {
        std::cerr << content;
    }
}

void ErrorLogger::logError(const std::string& errorMessage,
                           const std::string& functionName,
                           const std::string& fileName,
                           int lineNumber) {
    std::ostringstream oss;
    oss << "\n" << kBanner;
    oss << "ERROR LOG - " << getTimestamp() << "\n";
    oss << kBanner;
    oss << "Message: " << errorMessage << "\n";

    if (!functionName.empty()) {
        oss << "Function: " << functionName << "\n";
    }
    if (!fileName.empty()) {
        oss << "File: " << fileName << "\n";
    }
    if (lineNumber > 0) {
        oss << "Line: " << lineNumber << "\n";
    }

    std::string record = oss.str();
    appendContext(record, "Context");
    record += nativeBacktrace();
    record += kBanner;
    record += "\n";

    writeToFile(record);
    clearContext();
}

void ErrorLogger::logHostError(const std::string& errorMessage,
                               const std::string& typeName,
                               const std::vector<std::string>& typeChain,
                               const std::string& additionalContext) {
    std::ostringstream oss;
    oss << "\n" << kBanner;
    oss << "HOST ERROR LOG - " << getTimestamp() << "\n";
    oss << kBanner;
    oss << "Message: " << errorMessage << "\n";
    oss << "\n--- Host Type ---\n";
    oss << "Type: " << (typeName.empty() ? "<unknown>" : typeName) << "\n";

    if (!typeChain.empty()) {
        oss << "\n--- Registration Chain ---\n";
        for (std::size_t i = 0; i < typeChain.size(); ++i) {
            oss << "  [" << i << "] " << typeChain[i] << "\n";
        }
    }

    if (!additionalContext.empty()) {
        oss << "\n--- Additional Context ---\n";
        oss << additionalContext << "\n";
    }

    std::string record = oss.str();
    appendContext(record, "Debug Context");
    record += kBanner;
    record += "\n";

    writeToFile(record);
    clearContext();
}

void ErrorLogger::logException(const std::exception& ex,
                               const std::string& context) {
    std::ostringstream oss;
    oss << "\n" << kBanner;
    oss << "EXCEPTION LOG - " << getTimestamp() << "\n";
    oss << kBanner;
    oss << "Exception Type: " << typeid(ex).name() << "\n";
    oss << "Message: " << ex.what() << "\n";

    if (!context.empty()) {
        oss << "Context: " << context << "\n";
    }

    std::string record = oss.str();
    appendContext(record, "Debug Context");
    record += nativeBacktrace();
    record += kBanner;
    record += "\n";

    writeToFile(record);
    clearContext();
}

void ErrorLogger::addContext(const std::string& key, const std::string& value) {
    contextItems_.emplace_back(key, value);
}

void ErrorLogger::clearContext() {
    contextItems_.clear();
}

void ErrorLogger::setLogPath(const std::string& path) {
    logPath_ = path;
}

} // namespace pn
