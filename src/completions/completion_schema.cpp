/*
  completion_schema.cpp

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

#include "completion_schema.h"

#include <algorithm>

namespace completion_schema {

namespace {
struct KindName {
    ArgumentKind kind;
    const char* name;
};

constexpr KindName kKindNames[] = {
    {ArgumentKind::File, "File"},
    {ArgumentKind::Directory, "Directory"},
    {ArgumentKind::Choice, "Choice"},
    {ArgumentKind::Command, "Command"},
    {ArgumentKind::CommandWithArgs, "CommandWithArgs"},
    {ArgumentKind::Environment, "Environment"},
    {ArgumentKind::String, "String"},
    {ArgumentKind::Number, "Number"},
    {ArgumentKind::Url, "Url"},
    {ArgumentKind::Regex, "Regex"},
    {ArgumentKind::Signal, "Signal"},
    {ArgumentKind::User, "User"},
    {ArgumentKind::Group, "Group"},
    {ArgumentKind::Interface, "Interface"},
    {ArgumentKind::Process, "Process"},
};
}  // namespace

ArgumentType ArgumentType::file(std::vector<std::string> extensions) {
    ArgumentType type;
    type.kind = ArgumentKind::File;
    type.extensions = std::move(extensions);
    return type;
}

ArgumentType ArgumentType::directory() {
    return of(ArgumentKind::Directory);
}

ArgumentType ArgumentType::choice(std::vector<std::string> values) {
    ArgumentType type;
    type.kind = ArgumentKind::Choice;
    type.choices = std::move(values);
    return type;
}

ArgumentType ArgumentType::of(ArgumentKind kind) {
    ArgumentType type;
    type.kind = kind;
    return type;
}

bool ArgumentType::operator==(const ArgumentType& other) const {
    return kind == other.kind && extensions == other.extensions && choices == other.choices;
}

const char* argument_kind_name(ArgumentKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "String";
}

std::optional<ArgumentKind> argument_kind_from_name(const std::string& name) {
    for (const auto& entry : kKindNames) {
        if (name == entry.name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

bool CommandOption::has_form(const std::string& form) const {
    return (short_form && *short_form == form) || (long_form && *long_form == form);
}

bool SubCommand::answers_to(const std::string& token) const {
    if (name == token) {
        return true;
    }
    return std::find(aliases.begin(), aliases.end(), token) != aliases.end();
}

const SubCommand* find_subcommand(const std::vector<SubCommand>& children,
                                  const std::string& token) {
    for (const auto& child : children) {
        if (child.answers_to(token)) {
            return &child;
        }
    }
    return nullptr;
}

const SubCommand* resolve_subcommand_path(const CommandCompletion& completion,
                                          const std::vector<std::string>& path) {
    const SubCommand* current = nullptr;
    const std::vector<SubCommand>* level = &completion.subcommands;

    for (const auto& element : path) {
        const SubCommand* next = find_subcommand(*level, element);
        if (next == nullptr) {
            break;
        }
        current = next;
        level = &next->subcommands;
    }
    return current;
}

bool CommandCompletionDatabase::add_command(CommandCompletion completion) {
    std::string name = completion.command;
    auto inserted = commands_.emplace(std::move(name), std::move(completion));
    return inserted.second;
}

const CommandCompletion* CommandCompletionDatabase::get_command(const std::string& name) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool CommandCompletionDatabase::has_command(const std::string& name) const {
    return commands_.find(name) != commands_.end();
}

std::vector<std::string> CommandCompletionDatabase::command_names() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (const auto& entry : commands_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t CommandCompletionDatabase::size() const {
    return commands_.size();
}

}  // namespace completion_schema
