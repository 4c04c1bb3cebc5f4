/*
  completion_parser.cpp

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

#include "completion_parser.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iterator>
#include <string>
#include <utility>

#include "quote_state.h"
#include "string_utils.h"

namespace completion_parser {

using completion_schema::ArgumentType;
using completion_schema::CommandCompletion;
using completion_schema::CommandOption;
using completion_schema::SubCommand;

namespace {
constexpr size_t kMaxHeuristicSubcommands = 2;
constexpr size_t kMinSubcommandLength = 2;
constexpr size_t kMaxSubcommandLength = 15;

bool is_word_separator(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_vowel(char c) {
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u':
            return true;
        default:
            return false;
    }
}

bool is_consonant(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 && !is_vowel(c);
}

bool is_option_token(const std::string& token) {
    return token.size() > 1 && token[0] == '-' && token != "--";
}

bool is_combined_short_flags(const std::string& token) {
    if (token.size() <= 2 || token[0] != '-' || token[1] == '-') {
        return false;
    }
    return std::all_of(token.begin() + 1, token.end(),
                       [](unsigned char ch) { return std::isalpha(ch) != 0; });
}

// Options visible at the current depth: the command's global options plus those of
// every subcommand on the path, innermost first.
class OptionScope {
   public:
    OptionScope(const CommandCompletion* command, const std::vector<const SubCommand*>& nodes)
        : command_(command), nodes_(nodes) {
    }

    const CommandOption* find(const std::string& form) const {
        if (command_ == nullptr) {
            return nullptr;
        }
        for (auto it = nodes_.rbegin(); it != nodes_.rend(); ++it) {
            for (const auto& option : (*it)->options) {
                if (option.has_form(form)) {
                    return &option;
                }
            }
        }
        for (const auto& option : command_->global_options) {
            if (option.has_form(form)) {
                return &option;
            }
        }
        return nullptr;
    }

    // The form whose value semantics apply to `token`: the token itself, or for an
    // unknown combined flag like "-am" its last letter.
    std::string effective_form(const std::string& token) const {
        if (is_combined_short_flags(token) && find(token) == nullptr) {
            return std::string("-") + token.back();
        }
        return token;
    }

    bool takes_value(const std::string& token) const {
        if (string_utils::starts_with(token, "--") && token.find('=') != std::string::npos) {
            return false;
        }
        std::string form = effective_form(token);
        if (is_common_value_option(form)) {
            return true;
        }
        const CommandOption* option = find(form);
        return option != nullptr && option->takes_value;
    }

    std::optional<ArgumentType> value_type(const std::string& token) const {
        const CommandOption* option = find(effective_form(token));
        if (option == nullptr) {
            return std::nullopt;
        }
        return option->value_type;
    }

    void record(std::vector<std::string>& specified, const std::string& token) const {
        if (is_combined_short_flags(token) && find(token) == nullptr) {
            for (size_t i = 1; i < token.size(); ++i) {
                specified.push_back(std::string("-") + token[i]);
            }
            return;
        }
        specified.push_back(token);
    }

   private:
    const CommandCompletion* command_;
    const std::vector<const SubCommand*>& nodes_;
};

}  // namespace

std::optional<ArgumentType> argument_type_at(
    const std::vector<completion_schema::Argument>& arguments, size_t index) {
    if (index < arguments.size()) {
        return arguments[index].arg_type;
    }
    if (!arguments.empty() && arguments.back().multiple) {
        return arguments.back().arg_type;
    }
    return std::nullopt;
}

std::vector<Token> tokenize(const std::string& input) {
    std::vector<Token> tokens;
    utils::QuoteTracker quotes;
    Token current;
    bool in_token = false;

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (quotes.feed(c) == utils::QuoteTracker::Role::Plain && is_word_separator(c)) {
            if (in_token) {
                current.end = i;
                tokens.push_back(std::move(current));
                current = Token{};
                in_token = false;
            }
            continue;
        }

        if (!in_token) {
            current.start = i;
            in_token = true;
        }
        current.text += c;
    }

    if (in_token) {
        current.end = input.size();
        tokens.push_back(std::move(current));
    }

    return tokens;
}

CompletionContext CompletionContext::of(Kind kind) {
    CompletionContext context;
    context.kind = kind;
    return context;
}

CompletionContext CompletionContext::option_value(std::string option_name,
                                                  std::optional<ArgumentType> type) {
    CompletionContext context = of(Kind::OptionValue);
    context.option_name = std::move(option_name);
    context.value_type = std::move(type);
    return context;
}

CompletionContext CompletionContext::argument(size_t index, std::optional<ArgumentType> type) {
    CompletionContext context = of(Kind::Argument);
    context.arg_index = index;
    context.arg_type = std::move(type);
    return context;
}

bool CompletionContext::operator==(const CompletionContext& other) const {
    return kind == other.kind && option_name == other.option_name &&
           value_type == other.value_type && arg_index == other.arg_index &&
           arg_type == other.arg_type;
}

const char* context_kind_name(CompletionContext::Kind kind) {
    switch (kind) {
        case CompletionContext::Kind::Command:
            return "Command";
        case CompletionContext::Kind::SubCommand:
            return "SubCommand";
        case CompletionContext::Kind::ShortOption:
            return "ShortOption";
        case CompletionContext::Kind::LongOption:
            return "LongOption";
        case CompletionContext::Kind::OptionValue:
            return "OptionValue";
        case CompletionContext::Kind::Argument:
            return "Argument";
        case CompletionContext::Kind::Unknown:
        default:
            return "Unknown";
    }
}

bool is_redirect_operator(const std::string& token) {
    size_t pos = 0;
    while (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos])) != 0) {
        ++pos;
    }
    std::string op = token.substr(pos);
    if (pos > 0 && (op == "&>" || op == "&>>")) {
        return false;
    }
    return op == ">" || op == ">>" || op == "<" || op == "&>" || op == "&>>";
}

size_t glued_redirect_length(const std::string& token) {
    size_t pos = 0;
    while (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos])) != 0) {
        ++pos;
    }
    size_t length = 0;
    for (const char* op : {"&>>", ">>", "&>", ">", "<"}) {
        if (token.compare(pos, std::char_traits<char>::length(op), op) == 0) {
            length = std::char_traits<char>::length(op);
            break;
        }
    }
    if (length == 0 || (pos > 0 && token[pos] == '&')) {
        return 0;
    }
    // a bare operator is a token of its own
    return pos + length < token.size() ? pos + length : 0;
}

bool looks_like_subcommand(const std::string& token) {
    if (token.empty() || token[0] == '-') {
        return false;
    }

    size_t dot = token.rfind('.');
    if (dot != std::string::npos && dot > 0 && dot + 1 < token.size()) {
        return false;
    }

    if (token.find('/') != std::string::npos || token.find('\\') != std::string::npos) {
        return false;
    }

    if (token.size() < kMinSubcommandLength || token.size() > kMaxSubcommandLength) {
        return false;
    }

    bool has_vowel = std::any_of(token.begin(), token.end(), is_vowel);
    bool has_consonant = std::any_of(token.begin(), token.end(), is_consonant);
    if (!has_vowel || !has_consonant) {
        return false;
    }

    // "file", "data", "note": plain nouns rather than verbs
    if (token.size() == 4 && is_consonant(token[0]) && is_vowel(token[1]) &&
        is_consonant(token[2]) && is_vowel(token[3])) {
        return false;
    }

    return true;
}

bool is_common_value_option(const std::string& option) {
    static const char* const kValueOptions[] = {"-m",         "--message", "--target", "--features",
                                                "--git",      "--path",    "--name"};
    return std::any_of(std::begin(kValueOptions), std::end(kValueOptions),
                       [&option](const char* candidate) { return option == candidate; });
}

CommandLineParser::CommandLineParser(completion_schema::SharedDatabase database)
    : database_(std::move(database)) {
}

ParsedCommandLine CommandLineParser::parse(const std::string& input, size_t cursor) const {
    using Kind = CompletionContext::Kind;

    ParsedCommandLine parsed;
    cursor = std::min(cursor, input.size());
    std::vector<Token> tokens = tokenize(input);

    size_t cursor_index = tokens.size();
    bool inside_token = false;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (cursor >= tokens[i].start && cursor <= tokens[i].end) {
            cursor_index = i;
            inside_token = true;
            break;
        }
        if (tokens[i].start > cursor) {
            cursor_index = i;
            break;
        }
    }

    parsed.cursor_index = cursor_index;
    parsed.replace_end = cursor;
    if (inside_token) {
        const Token& token = tokens[cursor_index];
        parsed.current_token = token.text.substr(0, cursor - token.start);
        parsed.replace_start = token.start;
    } else {
        parsed.replace_start = cursor;
    }

    if (!tokens.empty()) {
        parsed.command = tokens[0].text;
    }

    if (tokens.empty() || cursor_index == 0) {
        parsed.completion_context = CompletionContext::of(Kind::Command);
        return parsed;
    }

    const CommandCompletion* schema = database_ ? database_->get_command(parsed.command) : nullptr;
    parsed.command_known = schema != nullptr;

    std::vector<const SubCommand*> nodes;
    OptionScope scope(schema, nodes);
    const std::vector<SubCommand>* level = schema != nullptr ? &schema->subcommands : nullptr;

    const size_t limit = inside_token ? cursor_index + 1 : cursor_index;
    bool options_ended = false;
    bool subcommands_closed = false;
    bool skip_value = false;
    bool skip_redirect_target = false;

    for (size_t i = 1; i < limit; ++i) {
        const bool is_current = inside_token && i == cursor_index;
        const std::string& text = is_current ? parsed.current_token : tokens[i].text;

        if (skip_value) {
            skip_value = false;
            continue;
        }
        if (skip_redirect_target) {
            skip_redirect_target = false;
            continue;
        }
        if (is_current && text.empty()) {
            continue;
        }

        if (!options_ended && is_redirect_operator(text)) {
            skip_redirect_target = true;
            continue;
        }
        if (!options_ended && glued_redirect_length(text) > 0) {
            continue;
        }

        if (!options_ended && text == "--" && !is_current) {
            options_ended = true;
            continue;
        }

        if (!options_ended && !text.empty() && text[0] == '-' && text.size() > 1) {
            if (is_current) {
                continue;
            }
            scope.record(parsed.specified_options, text);
            if (schema == nullptr) {
                subcommands_closed = true;
            }
            if (scope.takes_value(text)) {
                skip_value = true;
            }
            continue;
        }

        if (!is_current && !subcommands_closed) {
            if (schema != nullptr) {
                const SubCommand* next =
                    level != nullptr ? completion_schema::find_subcommand(*level, text) : nullptr;
                if (next != nullptr) {
                    parsed.subcommand_path.push_back(text);
                    nodes.push_back(next);
                    level = &next->subcommands;
                    continue;
                }
            } else if (parsed.subcommand_path.size() < kMaxHeuristicSubcommands &&
                       looks_like_subcommand(text)) {
                parsed.subcommand_path.push_back(text);
                continue;
            }
        }

        subcommands_closed = true;
        parsed.specified_arguments.push_back(text);
        parsed.argument_starts.push_back(tokens[i].start);
    }

    const size_t glued = options_ended ? 0 : glued_redirect_length(parsed.current_token);
    if (glued > 0) {
        parsed.current_token.erase(0, glued);
        parsed.replace_start += glued;
        parsed.completion_context =
            CompletionContext::argument(parsed.specified_arguments.size(), ArgumentType::file());
        return parsed;
    }

    const std::string& current = parsed.current_token;
    const std::string previous = tokens[cursor_index - 1].text;
    const bool has_space_after_command =
        tokens[0].end < input.size() && is_word_separator(input[tokens[0].end]);

    if (!options_ended && string_utils::starts_with(current, "--")) {
        parsed.completion_context = CompletionContext::of(Kind::LongOption);
        return parsed;
    }
    if (!options_ended && !current.empty() && current[0] == '-') {
        parsed.completion_context =
            CompletionContext::of(current.size() == 2 ? Kind::ShortOption : Kind::LongOption);
        return parsed;
    }

    if (cursor_index >= 2 && !options_ended && is_option_token(previous) &&
        scope.takes_value(previous)) {
        parsed.completion_context =
            CompletionContext::option_value(previous, scope.value_type(previous));
        return parsed;
    }

    if ((cursor_index >= 2 && is_redirect_operator(previous)) || is_redirect_operator(current)) {
        parsed.completion_context =
            CompletionContext::argument(parsed.specified_arguments.size(), ArgumentType::file());
        return parsed;
    }

    if (!has_space_after_command) {
        parsed.completion_context = CompletionContext::of(Kind::Command);
        return parsed;
    }

    const bool current_counted =
        !current.empty() && std::find(parsed.specified_arguments.begin(),
                                      parsed.specified_arguments.end(),
                                      current) != parsed.specified_arguments.end();
    const size_t arg_index = parsed.specified_arguments.size() - (current_counted ? 1 : 0);

    if (schema != nullptr) {
        const std::vector<SubCommand>& children =
            nodes.empty() ? schema->subcommands : nodes.back()->subcommands;
        if (!children.empty() && arg_index == 0) {
            parsed.completion_context = CompletionContext::of(Kind::SubCommand);
            return parsed;
        }
        const auto& arguments = nodes.empty() ? schema->arguments : nodes.back()->arguments;
        parsed.completion_context =
            CompletionContext::argument(arg_index, argument_type_at(arguments, arg_index));
        return parsed;
    }

    if (parsed.subcommand_path.empty() || looks_like_subcommand(current)) {
        parsed.completion_context = CompletionContext::of(Kind::SubCommand);
        return parsed;
    }

    parsed.completion_context = CompletionContext::argument(arg_index, std::nullopt);
    return parsed;
}

ParsedCommandLine parse(const std::string& input, size_t cursor) {
    static const CommandLineParser kSchemaFreeParser{};
    return kSchemaFreeParser.parse(input, cursor);
}

}  // namespace completion_parser
