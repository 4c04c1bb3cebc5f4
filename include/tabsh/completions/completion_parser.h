/*
  completion_parser.h

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

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "completion_schema.h"

namespace completion_parser {

struct Token {
    std::string text;
    size_t start = 0;
    size_t end = 0;
};

// Splits on whitespace outside quotes. Quote characters and backslashes stay in the
// token text; an unterminated quote runs to the end of the input.
std::vector<Token> tokenize(const std::string& input);

struct CompletionContext {
    enum class Kind : std::uint8_t {
        Command,
        SubCommand,
        ShortOption,
        LongOption,
        OptionValue,
        Argument,
        Unknown
    };

    Kind kind = Kind::Unknown;
    // OptionValue
    std::string option_name;
    std::optional<completion_schema::ArgumentType> value_type;
    // Argument
    size_t arg_index = 0;
    std::optional<completion_schema::ArgumentType> arg_type;

    static CompletionContext of(Kind kind);
    static CompletionContext option_value(std::string option_name,
                                          std::optional<completion_schema::ArgumentType> type);
    static CompletionContext argument(size_t index,
                                      std::optional<completion_schema::ArgumentType> type);

    bool operator==(const CompletionContext& other) const;
    bool operator!=(const CompletionContext& other) const {
        return !(*this == other);
    }
};

const char* context_kind_name(CompletionContext::Kind kind);

struct ParsedCommandLine {
    std::string command;
    std::vector<std::string> subcommand_path;
    std::vector<std::string> specified_options;
    std::vector<std::string> specified_arguments;
    // Input offset of each entry in specified_arguments.
    std::vector<size_t> argument_starts;
    std::string current_token;
    CompletionContext completion_context;
    // Index of the token under the cursor, or of the empty token about to be typed.
    size_t cursor_index = 0;
    // Span a chosen candidate replaces: start of the current token up to the cursor.
    size_t replace_start = 0;
    size_t replace_end = 0;
    // True when the command has a schema and subcommands were matched exactly.
    bool command_known = false;
};

bool is_redirect_operator(const std::string& token);
// Length of a redirect operator written flush against its target (`>out`, `2>>log`), else 0.
size_t glued_redirect_length(const std::string& token);
bool looks_like_subcommand(const std::string& token);
// Fixed allowlist consulted for every command.
bool is_common_value_option(const std::string& option);

// Declared type of the positional at `index`; a trailing `multiple` argument covers every
// index past the end.
std::optional<completion_schema::ArgumentType> argument_type_at(
    const std::vector<completion_schema::Argument>& arguments, size_t index);

class CommandLineParser {
   public:
    CommandLineParser() = default;
    explicit CommandLineParser(completion_schema::SharedDatabase database);

    ParsedCommandLine parse(const std::string& input, size_t cursor) const;

   private:
    completion_schema::SharedDatabase database_;
};

// Schema-free parse: subcommands are recognized heuristically.
ParsedCommandLine parse(const std::string& input, size_t cursor);

}  // namespace completion_parser
