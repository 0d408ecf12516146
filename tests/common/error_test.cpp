// =============================================================================
// pgen - Error Handling Tests
// =============================================================================
// Unit tests for error codes, exception formatting and Result helpers.
// =============================================================================

#include "pgen/common/error.h"

#include <gtest/gtest.h>

#include <string>
#include <system_error>

namespace pgen {
namespace {

// =============================================================================
// ErrorCode Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodesMatchEnumValues) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kChecksumError), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kIncomplete), 6);
}

TEST(ErrorCodeTest, SuccessPredicates) {
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_FALSE(isError(ErrorCode::kSuccess));
    EXPECT_TRUE(isError(ErrorCode::kIncomplete));
    EXPECT_EQ(errorCodeToString(ErrorCode::kIncomplete), "incomplete");
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(ExceptionTest, WhatIncludesCategoryAndMessage) {
    UsageError error("digits must be positive");
    EXPECT_EQ(error.code(), ErrorCode::kUsageError);
    EXPECT_EQ(error.exitCode(), 1);
    EXPECT_EQ(std::string(error.what()), "[usage error] digits must be positive");
    EXPECT_FALSE(error.hasContext());
}

TEST(ExceptionTest, ContextAppearsInWhat) {
    FormatError error("bad code", ErrorContext("codes.txt").withLine(7));
    ASSERT_TRUE(error.hasContext());
    ASSERT_TRUE(error.context()->lineNumber.has_value());
    EXPECT_EQ(*error.context()->lineNumber, 7u);

    const std::string what = error.what();
    EXPECT_NE(what.find("file: codes.txt"), std::string::npos);
    EXPECT_NE(what.find("line: 7"), std::string::npos);
}

TEST(ExceptionTest, CheckDigitMismatchMessage) {
    EXPECT_EQ(ChecksumError::formatCheckDigitMismatch('4', '7'),
              "check digit mismatch: expected '4', got '7'");

    ChecksumError error(ChecksumError::formatCheckDigitMismatch('4', '7'),
                        ErrorContext{}.withPrefix("1000"));
    EXPECT_EQ(error.exitCode(), 4);
    EXPECT_NE(std::string(error.what()).find("prefix: 1000"), std::string::npos);
}

TEST(ExceptionTest, IOErrorKeepsSystemError) {
    const auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    IOError error("Failed to open codes.txt", ec);
    ASSERT_TRUE(error.systemError().has_value());
    EXPECT_EQ(*error.systemError(), ec);
    EXPECT_NE(error.message().find(ec.message()), std::string::npos);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, MakeErrorCarriesCode) {
    auto result = makeError<int>(ErrorCode::kIOError, "disk on fire");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kIOError);
    EXPECT_EQ(result.error().message(), "disk on fire");
}

TEST(ResultTest, UnwrapOrThrowReturnsValue) {
    EXPECT_EQ(unwrapOrThrow(Result<int>{42}), 42);
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
}

TEST(ResultTest, UnwrapOrThrowRaisesMatchingException) {
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kUsageError, "bad")), UsageError);
    EXPECT_THROW(unwrapOrThrow(makeError<int>(ErrorCode::kFormatError, "bad")), FormatError);
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kIncomplete, "short")), PgenException);
}

}  // namespace
}  // namespace pgen
