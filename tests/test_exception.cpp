/**
 * @file test_exception.cpp
 * @brief Unit tests for the exception hierarchy and result code names
 */

#include <gtest/gtest.h>
#include <fpservice/core/exception.h>

#include <string>

using namespace fpservice::core;

TEST(ExceptionTest, EveryResultCodeHasAName) {
    EXPECT_EQ(resultCodeToString(ResultCode::SUCCESS), "SUCCESS");
    EXPECT_EQ(resultCodeToString(ResultCode::ERROR_INVALID_PARAMETER), "ERROR_INVALID_PARAMETER");
    EXPECT_EQ(resultCodeToString(ResultCode::ERROR_FILE_IO), "ERROR_FILE_IO");
    EXPECT_EQ(resultCodeToString(ResultCode::ERROR_PARSE), "ERROR_PARSE");
    EXPECT_EQ(resultCodeToString(ResultCode::ERROR_CONFIG_INVALID), "ERROR_CONFIG_INVALID");
    EXPECT_EQ(resultCodeToString(ResultCode::ERROR_DAEMON_TRANSPORT), "ERROR_DAEMON_TRANSPORT");
    EXPECT_EQ(resultCodeToString(ResultCode::ERROR_RECEIVER_UNREACHABLE), "ERROR_RECEIVER_UNREACHABLE");
    EXPECT_EQ(resultCodeToString(static_cast<ResultCode>(-99)), "UNKNOWN_ERROR");
}

TEST(ExceptionTest, SubclassesCarryTheirResultCode) {
    EXPECT_EQ(ConfigException("bad").getResultCode(), ResultCode::ERROR_CONFIG_INVALID);
    EXPECT_EQ(DaemonException("gone").getResultCode(), ResultCode::ERROR_DAEMON_TRANSPORT);
    EXPECT_EQ(ReceiverException("dead").getResultCode(), ResultCode::ERROR_RECEIVER_UNREACHABLE);
    EXPECT_EQ(FileException(ResultCode::ERROR_PARSE, "torn").getResultCode(), ResultCode::ERROR_PARSE);
}

TEST(ExceptionTest, ThrowMacroRecordsLocation) {
    try {
        FPSERVICE_THROW(ConfigException, "lockout thresholds out of order");
        FAIL() << "expected ConfigException";
    } catch (const Exception& e) {
        EXPECT_EQ(e.getMessage(), "lockout thresholds out of order");
        EXPECT_NE(e.getContext().find("test_exception.cpp"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("[ERROR_CONFIG_INVALID]"), std::string::npos);
    }
}
