/*
  completion_generator.cpp

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

#include "completion_generator.h"

#include <algorithm>
#include <utility>

#include "completion_utils.h"
#include "debug.h"
#include "string_utils.h"

extern char** environ;

namespace completion_generator {

namespace fs = std::filesystem;
using completion_candidate::CandidateCategory;
using completion_parser::CompletionContext;
using completion_parser::ParsedCommandLine;
using completion_schema::ArgumentKind;
using completion_schema::ArgumentType;
using completion_schema::CommandCompletion;
using completion_schema::CommandOption;
using completion_schema::SubCommand;

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

void add_option_form(std::vector<Candidate>& out, const std::optional<std::string>& form,
                     const CommandOption& option, const ParsedCommandLine& parsed,
                     CandidateCategory category) {
    if (!form.has_value()) {
        return;
    }
    if (!completion_utils::matches_completion_query(*form, parsed.current_token)) {
        return;
    }
    if (contains(parsed.specified_options, *form)) {
        return;
    }
    out.push_back(Candidate::make(*form, category, option.description));
}

void add_options(std::vector<Candidate>& out, const std::vector<CommandOption>& options,
                 const ParsedCommandLine& parsed) {
    for (const auto& option : options) {
        // an option given once under one spelling is spent under the other too
        if ((option.short_form && contains(parsed.specified_options, *option.short_form)) ||
            (option.long_form && contains(parsed.specified_options, *option.long_form))) {
            continue;
        }
        add_option_form(out, option.short_form, option, parsed, CandidateCategory::ShortOption);
        add_option_form(out, option.long_form, option, parsed, CandidateCategory::LongOption);
    }
}

}  // namespace

const std::vector<std::string>& common_commands() {
    static const std::vector<std::string> commands = {
        "cat",   "cd",   "chmod", "chown", "cp",    "curl",  "echo", "find",  "git",
        "grep",  "head", "kill",  "less",  "ls",    "make",  "man",  "mkdir", "mv",
        "ps",    "pwd",  "rm",    "rmdir", "ssh",   "sudo",  "tail", "tar",   "touch",
        "top",   "vim",  "which"};
    return commands;
}

StaticGenerator::StaticGenerator(completion_schema::SharedDatabase database,
                                 completion_paths::DirectoryListingCache& listing,
                                 completion_metadata::ExecutableSearch& executables)
    : database_(std::move(database)), listing_(listing), executables_(executables) {
}

std::vector<Candidate> StaticGenerator::generate(const ParsedCommandLine& parsed,
                                                 const fs::path& current_dir) const {
    const CompletionContext& context = parsed.completion_context;
    switch (context.kind) {
        case CompletionContext::Kind::Command:
            return command_candidates(parsed.current_token, current_dir);
        case CompletionContext::Kind::SubCommand:
            return subcommand_candidates(parsed, current_dir);
        case CompletionContext::Kind::ShortOption:
        case CompletionContext::Kind::LongOption:
            return option_candidates(parsed);
        case CompletionContext::Kind::OptionValue:
            return argument_candidates(context.value_type, parsed.current_token, current_dir,
                                       false);
        case CompletionContext::Kind::Argument:
            return argument_candidates(context.arg_type, parsed.current_token, current_dir,
                                       true);
        case CompletionContext::Kind::Unknown:
        default:
            return {};
    }
}

std::vector<Candidate> StaticGenerator::command_candidates(const std::string& token,
                                                           const fs::path& current_dir) const {
    if (token.find('/') != std::string::npos) {
        completion_paths::PathFilter filter;
        filter.executables_only = true;
        return completion_paths::path_candidates(token, current_dir, filter, listing_);
    }

    std::vector<Candidate> candidates;
    if (database_) {
        for (const auto& name : database_->command_names()) {
            if (completion_utils::matches_completion_query(name, token)) {
                const CommandCompletion* command = database_->get_command(name);
                candidates.push_back(
                    Candidate::make(name, CandidateCategory::Command, command->description));
            }
        }
    }
    for (const auto& name : common_commands()) {
        if (completion_utils::matches_completion_query(name, token)) {
            candidates.push_back(Candidate::make(name, CandidateCategory::Command));
        }
    }

    auto executables = executables_.search(token);
    candidates.insert(candidates.end(), executables.begin(), executables.end());
    return candidates;
}

std::vector<Candidate> StaticGenerator::subcommand_candidates(const ParsedCommandLine& parsed,
                                                              const fs::path& current_dir) const {
    std::vector<Candidate> candidates;
    const CommandCompletion* command =
        database_ ? database_->get_command(parsed.command) : nullptr;
    const SubCommand* node = nullptr;
    if (command != nullptr) {
        node = completion_schema::resolve_subcommand_path(*command, parsed.subcommand_path);
        const auto& children = node != nullptr ? node->subcommands : command->subcommands;
        for (const auto& child : children) {
            if (completion_utils::matches_completion_query(child.name, parsed.current_token)) {
                candidates.push_back(
                    Candidate::make(child.name, CandidateCategory::SubCommand, child.description));
            }
        }
    }
    if (!candidates.empty()) {
        return candidates;
    }

    // nothing to descend into: treat the token as the first open positional
    std::optional<ArgumentType> type;
    if (command != nullptr) {
        const auto& arguments = node != nullptr ? node->arguments : command->arguments;
        size_t filled = parsed.specified_arguments.size();
        if (!parsed.current_token.empty() && filled > 0) {
            --filled;
        }
        type = completion_parser::argument_type_at(arguments, filled);
    }
    candidates = argument_candidates(type, parsed.current_token, current_dir, true);

    if (command != nullptr) {
        add_options(candidates, command->global_options, parsed);
    }
    return candidates;
}

std::vector<Candidate> StaticGenerator::option_candidates(const ParsedCommandLine& parsed) const {
    std::vector<Candidate> candidates;
    const CommandCompletion* command =
        database_ ? database_->get_command(parsed.command) : nullptr;
    if (command == nullptr) {
        return candidates;
    }

    const SubCommand* node =
        completion_schema::resolve_subcommand_path(*command, parsed.subcommand_path);
    if (node != nullptr) {
        add_options(candidates, node->options, parsed);
    }
    add_options(candidates, command->global_options, parsed);
    return candidates;
}

std::vector<Candidate> StaticGenerator::argument_candidates(
    const std::optional<ArgumentType>& type, const std::string& token,
    const fs::path& current_dir, bool files_when_untyped) const {
    if (!type.has_value()) {
        if (files_when_untyped) {
            return file_candidates(token, current_dir);
        }
        return {};
    }

    completion_paths::PathFilter filter;
    switch (type->kind) {
        case ArgumentKind::File:
            filter.extensions = type->extensions;
            return completion_paths::path_candidates(token, current_dir, filter, listing_);
        case ArgumentKind::Directory:
            filter.directories_only = true;
            return completion_paths::path_candidates(token, current_dir, filter, listing_);
        case ArgumentKind::Choice: {
            std::vector<Candidate> candidates;
            const std::string typed = completion_utils::unquote_path(token);
            for (const auto& choice : type->choices) {
                if (completion_utils::matches_completion_query(choice, typed)) {
                    candidates.push_back(Candidate::make(choice, CandidateCategory::Argument));
                }
            }
            return candidates;
        }
        case ArgumentKind::Command:
        case ArgumentKind::CommandWithArgs:
            if (token.find('/') != std::string::npos) {
                filter.executables_only = true;
                return completion_paths::path_candidates(token, current_dir, filter, listing_);
            }
            return executables_.search(token);
        case ArgumentKind::Environment:
            return environment_candidates(token);
        case ArgumentKind::String:
        case ArgumentKind::Number:
        case ArgumentKind::Url:
        case ArgumentKind::Regex:
        case ArgumentKind::Signal:
        case ArgumentKind::User:
        case ArgumentKind::Group:
        case ArgumentKind::Interface:
        case ArgumentKind::Process:
        default:
            return {};
    }
}

std::vector<Candidate> StaticGenerator::file_candidates(const std::string& token,
                                                        const fs::path& current_dir) const {
    return completion_paths::path_candidates(token, current_dir, completion_paths::PathFilter{},
                                             listing_);
}

std::vector<Candidate> StaticGenerator::environment_candidates(const std::string& token) const {
    std::vector<Candidate> candidates;
    const bool dollar = string_utils::starts_with(token, "$");
    const std::string prefix = dollar ? token.substr(1) : token;

    std::vector<std::string> names;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string variable(*entry);
        size_t equals = variable.find('=');
        if (equals == std::string::npos || equals == 0) {
            continue;
        }
        std::string name = variable.substr(0, equals);
        if (completion_utils::matches_completion_query(name, prefix)) {
            names.push_back(std::move(name));
        }
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());

    for (auto& name : names) {
        candidates.push_back(
            Candidate::make(dollar ? "$" + name : name, CandidateCategory::Argument));
    }
    tabsh_debug_msg("environment completion: %zu names for '%s'", candidates.size(),
                    prefix.c_str());
    return candidates;
}

}  // namespace completion_generator
