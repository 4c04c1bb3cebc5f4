/*
  completion_handlers.cpp

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

#include "completion_handlers.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <initializer_list>
#include <iterator>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "completion_utils.h"
#include "debug.h"
#include "string_utils.h"
#include "tabsh.h"

namespace completion_handlers {

using completion_candidate::CandidateCategory;
using completion_parser::CompletionContext;
using completion_parser::ParsedCommandLine;
using tabsh_filesystem::Result;

namespace {

bool is_one_of(const std::string& value, std::initializer_list<const char*> options) {
    for (const char* option : options) {
        if (value == option) {
            return true;
        }
    }
    return false;
}

bool has_option(const ParsedCommandLine& parsed, const std::string& option) {
    return std::find(parsed.specified_options.begin(), parsed.specified_options.end(), option) !=
           parsed.specified_options.end();
}

// Handlers complete plain words; an option or an option's value belongs to the schema.
bool completing_plain_word(const ParsedCommandLine& parsed) {
    const auto kind = parsed.completion_context.kind;
    if (kind == CompletionContext::Kind::OptionValue || kind == CompletionContext::Kind::Command ||
        kind == CompletionContext::Kind::ShortOption ||
        kind == CompletionContext::Kind::LongOption) {
        return false;
    }
    return parsed.current_token.empty() || parsed.current_token[0] != '-';
}

bool is_all_digits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

std::string cache_key(const std::vector<std::string>& argv, const std::string& directory) {
    std::string key = directory;
    for (const auto& arg : argv) {
        key += '\x1f';
        key += arg;
    }
    return key;
}

// "pacman" run directly or behind "sudo"
bool is_package_install(const std::string& command, const std::vector<std::string>& words,
                        const ParsedCommandLine& parsed) {
    if (command == "pacman") {
        return has_option(parsed, "-S");
    }
    if (command == "apt" || command == "apt-get") {
        return !words.empty() && words[0] == "install";
    }
    return false;
}

}  // namespace

const char* handler_name(HandlerKind kind) {
    switch (kind) {
        case HandlerKind::ProcessId:
            return "process-id";
        case HandlerKind::Account:
            return "account";
        case HandlerKind::VcsBranch:
            return "vcs-branch";
        case HandlerKind::Package:
        default:
            return "package";
    }
}

std::vector<std::string> words_before_cursor(const ParsedCommandLine& parsed) {
    std::vector<std::string> words = parsed.subcommand_path;
    words.insert(words.end(), parsed.specified_arguments.begin(),
                 parsed.specified_arguments.end());
    if (!parsed.current_token.empty() && !parsed.specified_arguments.empty() &&
        parsed.specified_arguments.back() == parsed.current_token) {
        words.pop_back();
    }
    return words;
}

DynamicCompleter::DynamicCompleter(CommandRunner runner, completion_cache::ClockFunction clock)
    : runner_(runner ? std::move(runner) : CommandRunner(process_runner::run)),
      output_cache_(completion_cache::kCommandOutputTtl, std::move(clock)) {
}

bool DynamicCompleter::matches(HandlerKind kind, const ParsedCommandLine& parsed) const {
    if (!completing_plain_word(parsed)) {
        return false;
    }
    const std::vector<std::string> words = words_before_cursor(parsed);

    switch (kind) {
        case HandlerKind::ProcessId:
            return parsed.command == "kill";
        case HandlerKind::Account:
            return parsed.command == "sudo" && words.empty();
        case HandlerKind::VcsBranch:
            return parsed.command == "git" && !words.empty() &&
                   is_one_of(words[0], {"checkout", "switch", "merge", "rebase", "push", "pull",
                                        "fetch"});
        case HandlerKind::Package:
            if (parsed.command == "sudo" && !words.empty()) {
                std::vector<std::string> rest(words.begin() + 1, words.end());
                return is_package_install(words[0], rest, parsed);
            }
            return is_package_install(parsed.command, words, parsed);
        default:
            return false;
    }
}

std::vector<Candidate> DynamicCompleter::generate(HandlerKind kind,
                                                  const HandlerRequest& request) {
    try {
        switch (kind) {
            case HandlerKind::ProcessId:
                return process_ids(request);
            case HandlerKind::Account:
                return accounts(request);
            case HandlerKind::VcsBranch:
                return vcs_refs(request);
            case HandlerKind::Package:
                return packages(request);
            default:
                return {};
        }
    } catch (const std::exception& e) {
        tabsh_debug_msg("%s handler failed: %s", handler_name(kind), e.what());
        return {};
    }
}

std::vector<Candidate> DynamicCompleter::complete(const HandlerRequest& request) {
    std::vector<Candidate> candidates;
    for (HandlerKind kind : kAllHandlers) {
        if (request.cancelled != nullptr && request.cancelled->load()) {
            break;
        }
        if (!matches(kind, request.parsed)) {
            continue;
        }
        auto produced = generate(kind, request);
        tabsh_debug_msg("%s handler produced %zu candidates", handler_name(kind), produced.size());
        candidates.insert(candidates.end(), std::make_move_iterator(produced.begin()),
                          std::make_move_iterator(produced.end()));
    }
    return candidates;
}

Result<std::string> DynamicCompleter::query(const std::vector<std::string>& argv,
                                            const HandlerRequest& request) {
    return output_cache_.get_or_load(cache_key(argv, request.working_directory), [&]() {
        process_runner::RunOptions options;
        options.timeout = std::chrono::milliseconds(config::subprocess_timeout_ms);
        options.working_directory = request.working_directory;
        options.cancelled = request.cancelled;
        return runner_(argv, options);
    });
}

std::vector<std::string> DynamicCompleter::query_lines(const std::vector<std::string>& argv,
                                                       const HandlerRequest& request) {
    auto output = query(argv, request);
    if (output.is_error()) {
        tabsh_debug_msg("dynamic query failed: %s", output.error().c_str());
        return {};
    }
    std::vector<std::string> lines;
    for (const auto& line : string_utils::split_lines(output.value())) {
        std::string trimmed = string_utils::trim_ascii_whitespace_copy(line);
        if (!trimmed.empty()) {
            lines.push_back(std::move(trimmed));
        }
    }
    return lines;
}

std::vector<Candidate> DynamicCompleter::process_ids(const HandlerRequest& request) {
    std::vector<Candidate> candidates;
    const std::string& token = request.parsed.current_token;
    auto lines = query_lines({"ps", "-xo", "pid,%cpu,%mem,command"}, request);

    // first line is the column header
    for (size_t i = 1; i < lines.size(); ++i) {
        std::istringstream fields(lines[i]);
        std::string pid;
        std::string cpu;
        std::string mem;
        if (!(fields >> pid >> cpu >> mem) || !is_all_digits(pid)) {
            continue;
        }
        std::string command;
        std::getline(fields, command);
        command = string_utils::trim_ascii_whitespace_copy(command);

        bool wanted = token.empty();
        if (!wanted && is_all_digits(token)) {
            wanted = string_utils::starts_with(pid, token);
        } else if (!wanted) {
            wanted = completion_utils::matches_completion_query(
                completion_utils::base_name(command.substr(0, command.find(' '))), token);
        }
        if (wanted) {
            candidates.push_back(Candidate::make(
                pid, CandidateCategory::Process,
                command + " (cpu " + cpu + "%, mem " + mem + "%)"));
        }
    }
    return candidates;
}

std::vector<Candidate> DynamicCompleter::accounts(const HandlerRequest& request) {
    std::vector<Candidate> candidates;
    for (const auto& line : query_lines({"getent", "passwd"}, request)) {
        std::string name = line.substr(0, line.find(':'));
        if (!name.empty() &&
            completion_utils::matches_completion_query(name, request.parsed.current_token)) {
            candidates.push_back(Candidate::make(name, CandidateCategory::Argument, "user"));
        }
    }
    return candidates;
}

std::vector<Candidate> DynamicCompleter::branches(const std::string& local_prefix,
                                                  const std::string& remote_prefix,
                                                  const HandlerRequest& request) {
    std::vector<Candidate> candidates;
    for (const auto& name :
         query_lines({"git", "branch", "--format=%(refname:short)", "--list", local_prefix + "*"},
                     request)) {
        candidates.push_back(Candidate::make(name, CandidateCategory::Argument, "local branch"));
    }
    for (const auto& name : query_lines({"git", "branch", "-r", "--format=%(refname:short)",
                                         "--list", remote_prefix + "*"},
                                        request)) {
        // origin/HEAD shortens to the bare remote name
        if (name.find('/') == std::string::npos || string_utils::ends_with(name, "/HEAD")) {
            continue;
        }
        candidates.push_back(Candidate::make(name, CandidateCategory::Argument, "remote branch"));
    }
    return candidates;
}

std::vector<Candidate> DynamicCompleter::vcs_refs(const HandlerRequest& request) {
    const ParsedCommandLine& parsed = request.parsed;
    const std::string& token = parsed.current_token;
    const std::vector<std::string> words = words_before_cursor(parsed);
    const std::string& action = words[0];
    const size_t position = words.size() - 1;

    if (!is_one_of(action, {"push", "pull", "fetch"})) {
        if (position > 0) {
            return {};
        }
        return branches(token, token, request);
    }

    const std::vector<std::string> remotes = query_lines({"git", "remote"}, request);
    if (position == 0) {
        std::vector<Candidate> candidates;
        for (const auto& remote : remotes) {
            if (completion_utils::matches_completion_query(remote, token)) {
                candidates.push_back(Candidate::make(remote, CandidateCategory::Argument, "remote"));
            }
        }
        return candidates;
    }

    const std::string& remote = words[1];
    if (position != 1 || std::find(remotes.begin(), remotes.end(), remote) == remotes.end()) {
        return {};
    }

    // A token typed as "origin/fe" keeps the remote in every result; a bare "fe" drops it.
    const std::string remote_prefix = remote + "/";
    const bool qualified = string_utils::starts_with(token, remote_prefix);
    const std::string partial = qualified ? token.substr(remote_prefix.size()) : token;

    std::vector<Candidate> candidates;
    std::unordered_set<std::string> seen;
    for (auto& candidate : branches(partial, remote_prefix + partial, request)) {
        const bool from_remote = string_utils::starts_with(candidate.text, remote_prefix);
        if (qualified && !from_remote) {
            candidate.text = remote_prefix + candidate.text;
        } else if (!qualified && from_remote) {
            candidate.text = candidate.text.substr(remote_prefix.size());
        }
        if (seen.insert(candidate.text).second) {
            candidates.push_back(std::move(candidate));
        }
    }
    return candidates;
}

std::vector<Candidate> DynamicCompleter::packages(const HandlerRequest& request) {
    const ParsedCommandLine& parsed = request.parsed;
    const std::string& partial = parsed.current_token;
    std::vector<std::string> words = words_before_cursor(parsed);
    std::string manager = parsed.command;
    if (manager == "sudo" && !words.empty()) {
        manager = words[0];
    }

    std::vector<std::string> argv;
    if (manager == "pacman") {
        argv = {"pacman", "-Ssq", "^" + partial};
    } else {
        argv = {"apt-cache", "pkgnames"};
        if (!partial.empty()) {
            argv.push_back(partial);
        }
    }

    std::vector<Candidate> candidates;
    for (const auto& name : query_lines(argv, request)) {
        if (completion_utils::matches_completion_query(name, partial)) {
            candidates.push_back(Candidate::make(name, CandidateCategory::Argument, "package"));
        }
    }
    return candidates;
}

}  // namespace completion_handlers
