#include <gtest/gtest.h>

#include "error_out.h"

TEST(FormatError, CommandKindAndMessage) {
    ErrorInfo error(ErrorType::FILE_NOT_FOUND, "load", "no such schema");
    EXPECT_EQ(format_error(error), "tabsh: load: file not found: no such schema\n");
}

TEST(FormatError, SuggestionsFollowOnePerLine) {
    ErrorInfo error(ErrorType::INVALID_ARGUMENT, "--max", "must be positive",
                    {"Pass a number", "See --help"});
    EXPECT_EQ(format_error(error),
              "tabsh: --max: invalid argument: must be positive\nPass a number\nSee --help\n");
}

TEST(FormatError, OmitsEmptyParts) {
    EXPECT_EQ(format_error(ErrorInfo(ErrorType::RUNTIME_ERROR)), "tabsh: runtime error\n");
    EXPECT_EQ(format_error(ErrorInfo()), "tabsh: unknown error\n");
}

TEST(ErrorInfo, DefaultSeverityFollowsType) {
    EXPECT_EQ(ErrorInfo(ErrorType::INVALID_ARGUMENT).severity, ErrorSeverity::WARNING);
    EXPECT_EQ(ErrorInfo(ErrorType::SYNTAX_ERROR).severity, ErrorSeverity::CRITICAL);
    EXPECT_EQ(ErrorInfo(ErrorType::COMMAND_NOT_FOUND).severity, ErrorSeverity::ERROR);
    EXPECT_EQ(ErrorInfo(ErrorType::SYNTAX_ERROR, ErrorSeverity::INFO).severity,
              ErrorSeverity::INFO);
}
