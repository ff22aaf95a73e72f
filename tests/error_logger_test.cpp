#include "pn/error_logger.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace pn;

class ErrorLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedPath_ = ErrorLogger::instance().logPath();
        savedEcho_ = ErrorLogger::instance().echoToStderr();
        path_ = ::testing::TempDir() + "pn_error_logger_test.log";
        std::remove(path_.c_str());
        ErrorLogger::instance().setLogPath(path_);
        ErrorLogger::instance().setEchoToStderr(false);
    }

    void TearDown() override {
        ErrorLogger::instance().setLogPath(savedPath_);
        ErrorLogger::instance().setEchoToStderr(savedEcho_);
        std::remove(path_.c_str());
    }

    std::string contents() const {
        std::ifstream in(path_);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    std::string savedPath_;
    bool savedEcho_{true};
    std::string path_;
};

TEST_F(ErrorLoggerTest, LogErrorWritesLocation) {
    PN_LOG_ERROR("something broke");
    const std::string log = contents();
    EXPECT_NE(log.find("ERROR LOG - "), std::string::npos);
    EXPECT_NE(log.find("Message: something broke"), std::string::npos);
    EXPECT_NE(log.find("Function: "), std::string::npos);
    EXPECT_NE(log.find("error_logger_test.cpp"), std::string::npos);
}

TEST_F(ErrorLoggerTest, LogHostErrorWritesRegistrationChain) {
    ErrorLogger::instance().logHostError("failed to create type object for demo.Leaf: boom",
                                         "demo.Leaf",
                                         {"demo.Root", "demo.Leaf"});
    const std::string log = contents();
    EXPECT_NE(log.find("HOST ERROR LOG - "), std::string::npos);
    EXPECT_NE(log.find("Type: demo.Leaf"), std::string::npos);
    EXPECT_NE(log.find("[0] demo.Root"), std::string::npos);
    EXPECT_NE(log.find("[1] demo.Leaf"), std::string::npos);
}

TEST_F(ErrorLoggerTest, ContextIsWrittenOnceThenCleared) {
    ErrorLogger::instance().addContext("phase", "binding");
    ErrorLogger::instance().logException(std::runtime_error("first"));
    ErrorLogger::instance().logException(std::runtime_error("second"));

    const std::string log = contents();
    const auto firstContext = log.find("phase: binding");
    ASSERT_NE(firstContext, std::string::npos);
    EXPECT_EQ(log.find("phase: binding", firstContext + 1), std::string::npos);
    EXPECT_NE(log.find("Message: second"), std::string::npos);
}

TEST_F(ErrorLoggerTest, RecordsAppend) {
    PN_LOG_ERROR("one");
    PN_LOG_ERROR("two");
    const std::string log = contents();
    EXPECT_LT(log.find("Message: one"), log.find("Message: two"));
}
