/*
  completion_schema.h

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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace completion_schema {

enum class ArgumentKind : std::uint8_t {
    File,
    Directory,
    Choice,
    Command,
    CommandWithArgs,
    Environment,
    String,
    Number,
    Url,
    Regex,
    Signal,
    User,
    Group,
    Interface,
    Process
};

struct ArgumentType {
    ArgumentKind kind = ArgumentKind::String;
    // File only; entries are matched against the end of the name (".rs", "tar.gz").
    std::vector<std::string> extensions;
    // Choice only.
    std::vector<std::string> choices;

    static ArgumentType file(std::vector<std::string> extensions = {});
    static ArgumentType directory();
    static ArgumentType choice(std::vector<std::string> values);
    static ArgumentType of(ArgumentKind kind);

    bool operator==(const ArgumentType& other) const;
    bool operator!=(const ArgumentType& other) const {
        return !(*this == other);
    }
};

const char* argument_kind_name(ArgumentKind kind);
std::optional<ArgumentKind> argument_kind_from_name(const std::string& name);

struct CommandOption {
    std::optional<std::string> short_form;
    std::optional<std::string> long_form;
    std::optional<std::string> description;
    bool takes_value = false;
    std::optional<ArgumentType> value_type;

    bool has_form(const std::string& form) const;
};

struct Argument {
    std::string name;
    std::optional<std::string> description;
    std::optional<ArgumentType> arg_type;
    bool required = false;
    bool multiple = false;
};

struct SubCommand {
    std::string name;
    std::optional<std::string> description;
    std::vector<std::string> aliases;
    std::vector<CommandOption> options;
    std::vector<Argument> arguments;
    std::vector<SubCommand> subcommands;

    bool answers_to(const std::string& token) const;
};

struct CommandCompletion {
    std::string command;
    std::optional<std::string> description;
    std::vector<CommandOption> global_options;
    std::vector<SubCommand> subcommands;
    std::vector<Argument> arguments;
};

// Finds the child of `children` named (or aliased) `token`.
const SubCommand* find_subcommand(const std::vector<SubCommand>& children, const std::string& token);

// Walks `path` from the root of `completion`. Stops at the first unknown element and
// returns the deepest subcommand reached, or nullptr when the path is empty or the first
// element is unknown.
const SubCommand* resolve_subcommand_path(const CommandCompletion& completion,
                                          const std::vector<std::string>& path);

// Name-keyed registry. Mutable only while it is being assembled; the engine receives it
// as shared_ptr<const CommandCompletionDatabase>.
class CommandCompletionDatabase {
   public:
    // First registrant for a name wins; returns false when `completion` was ignored.
    bool add_command(CommandCompletion completion);

    const CommandCompletion* get_command(const std::string& name) const;
    bool has_command(const std::string& name) const;
    std::vector<std::string> command_names() const;
    size_t size() const;

   private:
    std::unordered_map<std::string, CommandCompletion> commands_;
};

using SharedDatabase = std::shared_ptr<const CommandCompletionDatabase>;

}  // namespace completion_schema
