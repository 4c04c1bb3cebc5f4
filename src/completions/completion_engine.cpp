/*
  completion_engine.cpp

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

#include "completion_engine.h"

#include <ctime>
#include <iterator>
#include <utility>

#include "completion_ranking.h"
#include "debug.h"
#include "tabsh.h"

namespace completion_engine {

namespace fs = std::filesystem;
using completion_parser::CompletionContext;
using completion_parser::ParsedCommandLine;
using completion_schema::ArgumentKind;
using completion_schema::ArgumentType;

namespace {

constexpr int kMaxWrappedDepth = 8;

void append(std::vector<Candidate>& into, std::vector<Candidate>&& from) {
    into.insert(into.end(), std::make_move_iterator(from.begin()),
                std::make_move_iterator(from.end()));
}

const std::optional<ArgumentType>& context_type(const CompletionContext& context) {
    static const std::optional<ArgumentType> kNoType;
    if (context.kind == CompletionContext::Kind::OptionValue) {
        return context.value_type;
    }
    if (context.kind == CompletionContext::Kind::Argument) {
        return context.arg_type;
    }
    return kNoType;
}

}  // namespace

CompletionEngine::CompletionEngine(completion_schema::SharedDatabase database,
                                   EngineServices services)
    : database_(std::move(database)),
      parser_(database_),
      listing_(std::move(services.directory_reader), services.clock),
      executables_(listing_),
      system_(std::move(services.system_root), services.clock),
      static_generator_(database_, listing_, executables_),
      dynamic_(std::move(services.command_runner), services.clock),
      epoch_now_(services.epoch_now ? std::move(services.epoch_now)
                                    : std::function<std::int64_t()>([] {
                                          return static_cast<std::int64_t>(std::time(nullptr));
                                      })) {
}

std::shared_ptr<std::atomic<bool>> CompletionEngine::begin_request() {
    auto flag = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (active_request_) {
        active_request_->store(true);
    }
    active_request_ = flag;
    return flag;
}

CompletionResult CompletionEngine::complete_request(const std::string& input, size_t cursor,
                                                    const fs::path& current_dir,
                                                    size_t max_results,
                                                    const completion_history::HistoryStore* history) {
    PerformanceTracker tracker("complete_request");
    auto cancelled = begin_request();

    CompletionResult result = run(input, cursor, current_dir, history, *cancelled, 0);
    if (cancelled->load()) {
        tabsh_debug_msg("request for '%s' superseded, dropping %zu candidates", input.c_str(),
                        result.candidates.size());
        result.candidates.clear();
        return result;
    }

    completion_ranking::truncate(result.candidates, max_results);
    return result;
}

std::vector<Candidate> CompletionEngine::complete(const std::string& input, size_t cursor,
                                                  const fs::path& current_dir, size_t max_results,
                                                  const completion_history::HistoryStore* history) {
    return complete_request(input, cursor, current_dir, max_results, history).candidates;
}

bool CompletionEngine::find_wrapped_command(const ParsedCommandLine& parsed,
                                            size_t& offset) const {
    if (!database_ || parsed.completion_context.kind == CompletionContext::Kind::Command) {
        return false;
    }
    const auto* command = database_->get_command(parsed.command);
    if (command == nullptr) {
        return false;
    }
    const auto* node = completion_schema::resolve_subcommand_path(*command, parsed.subcommand_path);
    const auto& arguments = node != nullptr ? node->arguments : command->arguments;

    size_t filled = parsed.specified_arguments.size();
    if (!parsed.current_token.empty() && !parsed.argument_starts.empty() &&
        parsed.argument_starts.back() == parsed.replace_start) {
        --filled;
    }

    for (size_t j = 0; j < filled; ++j) {
        auto type = completion_parser::argument_type_at(arguments, j);
        if (type && type->kind == ArgumentKind::CommandWithArgs) {
            offset = parsed.argument_starts[j];
            return true;
        }
    }
    return false;
}

std::vector<Candidate> CompletionEngine::metadata_candidates(const ParsedCommandLine& parsed) {
    const auto& type = context_type(parsed.completion_context);
    if (!type) {
        return {};
    }
    const std::string& token = parsed.current_token;
    switch (type->kind) {
        case ArgumentKind::Signal:
            return completion_metadata::signal_candidates(token);
        case ArgumentKind::User:
            return system_.user_candidates(token, config::include_system_users);
        case ArgumentKind::Group:
            return system_.group_candidates(token);
        case ArgumentKind::Interface:
            return system_.interface_candidates(token);
        case ArgumentKind::Process:
            return system_.process_candidates(token);
        default:
            return {};
    }
}

CompletionResult CompletionEngine::run(const std::string& input, size_t cursor,
                                       const fs::path& current_dir,
                                       const completion_history::HistoryStore* history,
                                       const std::atomic<bool>& cancelled, int depth) {
    CompletionResult result;
    const ParsedCommandLine parsed = parser_.parse(input, cursor);
    result.replace_start = parsed.replace_start;
    result.replace_end = parsed.replace_end;

    tabsh_debug_msg("completing '%s' at %zu: context %s, token '%s'", input.c_str(), cursor,
                    completion_parser::context_kind_name(parsed.completion_context.kind),
                    parsed.current_token.c_str());

    size_t offset = 0;
    if (depth < kMaxWrappedDepth && find_wrapped_command(parsed, offset)) {
        CompletionResult inner = run(input.substr(offset), parsed.replace_end - offset,
                                     current_dir, history, cancelled, depth + 1);
        inner.replace_start += offset;
        inner.replace_end += offset;
        return inner;
    }

    std::vector<Candidate> candidates = static_generator_.generate(parsed, current_dir);

    if (config::dynamic_handlers_enabled && !cancelled.load()) {
        completion_handlers::HandlerRequest request{parsed, current_dir.string(), &cancelled};
        append(candidates, dynamic_.complete(request));
    }

    append(candidates, metadata_candidates(parsed));

    if (history != nullptr && config::history_suggestions) {
        append(candidates,
               completion_history::history_candidates(*history, input, parsed, epoch_now_()));
    }

    if (candidates.empty() &&
        parsed.completion_context.kind == CompletionContext::Kind::Argument) {
        candidates = static_generator_.file_candidates(parsed.current_token, current_dir);
    }

    completion_ranking::deduplicate(candidates);
    completion_ranking::sort_by_priority(candidates);
    if (config::fuzzy_matching || config::smart_ranking) {
        completion_ranking::smart_rank(candidates, parsed.current_token);
    }

    result.candidates = std::move(candidates);
    return result;
}

}  // namespace completion_engine
