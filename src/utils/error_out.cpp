/*
  error_out.cpp

  This file is part of tabsh, a shell completion engine

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#include "error_out.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
const char* describe_error_type(ErrorType type) {
    switch (type) {
        case ErrorType::COMMAND_NOT_FOUND:
            return "command not found";
        case ErrorType::SYNTAX_ERROR:
            return "syntax error";
        case ErrorType::PERMISSION_DENIED:
            return "permission denied";
        case ErrorType::FILE_NOT_FOUND:
            return "file not found";
        case ErrorType::INVALID_ARGUMENT:
            return "invalid argument";
        case ErrorType::RUNTIME_ERROR:
            return "runtime error";
        case ErrorType::UNKNOWN_ERROR:
        default:
            return "unknown error";
    }
}
}  // namespace

std::string format_error(const ErrorInfo& error) {
    std::ostringstream out;
    out << "tabsh: ";

    if (!error.command_used.empty()) {
        out << error.command_used << ": ";
    }

    out << describe_error_type(error.type);

    if (!error.message.empty()) {
        out << ": " << error.message;
    }

    out << '\n';

    for (const auto& suggestion : error.suggestions) {
        out << suggestion << '\n';
    }

    return out.str();
}

void print_error(const ErrorInfo& error) {
    std::cerr << format_error(error);
}

ErrorInfo::ErrorInfo()
    : type(ErrorType::UNKNOWN_ERROR),
      severity(ErrorSeverity::ERROR),
      command_used(""),
      message(""),
      suggestions() {
}

ErrorInfo::ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t), severity(s), command_used(cmd), message(msg), suggestions(sugg) {
}

ErrorInfo::ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t), severity(get_default_severity(t)), command_used(cmd), message(msg), suggestions(sugg) {
}

ErrorSeverity ErrorInfo::get_default_severity(ErrorType type) {
    switch (type) {
        case ErrorType::SYNTAX_ERROR:
            return ErrorSeverity::CRITICAL;
        case ErrorType::INVALID_ARGUMENT:
            return ErrorSeverity::WARNING;
        case ErrorType::COMMAND_NOT_FOUND:
        case ErrorType::PERMISSION_DENIED:
        case ErrorType::FILE_NOT_FOUND:
        case ErrorType::RUNTIME_ERROR:
        case ErrorType::UNKNOWN_ERROR:
        default:
            return ErrorSeverity::ERROR;
    }
}
