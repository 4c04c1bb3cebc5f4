/*
  completion_handlers.h

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

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "completion_cache.h"
#include "completion_candidate.h"
#include "completion_parser.h"
#include "process_runner.h"

namespace completion_handlers {

using completion_candidate::Candidate;

using CommandRunner = std::function<tabsh_filesystem::Result<std::string>(
    const std::vector<std::string>& argv, const process_runner::RunOptions& options)>;

enum class HandlerKind : std::uint8_t {
    ProcessId,
    Account,
    VcsBranch,
    Package
};

constexpr HandlerKind kAllHandlers[] = {HandlerKind::ProcessId, HandlerKind::Account,
                                        HandlerKind::VcsBranch, HandlerKind::Package};

const char* handler_name(HandlerKind kind);

struct HandlerRequest {
    const completion_parser::ParsedCommandLine& parsed;
    std::string working_directory;
    const std::atomic<bool>* cancelled = nullptr;
};

// Live-state completions backed by external commands. Command output is cached per argv
// and working directory; a failed or timed-out query contributes nothing.
class DynamicCompleter {
   public:
    explicit DynamicCompleter(CommandRunner runner = nullptr,
                              completion_cache::ClockFunction clock = nullptr);

    bool matches(HandlerKind kind, const completion_parser::ParsedCommandLine& parsed) const;
    std::vector<Candidate> generate(HandlerKind kind, const HandlerRequest& request);

    // Every matching handler, in declaration order, concatenated.
    std::vector<Candidate> complete(const HandlerRequest& request);

    completion_cache::CacheStats cache_stats() const {
        return output_cache_.stats();
    }

   private:
    tabsh_filesystem::Result<std::string> query(const std::vector<std::string>& argv,
                                                const HandlerRequest& request);
    std::vector<std::string> query_lines(const std::vector<std::string>& argv,
                                         const HandlerRequest& request);

    std::vector<Candidate> process_ids(const HandlerRequest& request);
    std::vector<Candidate> accounts(const HandlerRequest& request);
    std::vector<Candidate> vcs_refs(const HandlerRequest& request);
    std::vector<Candidate> packages(const HandlerRequest& request);
    std::vector<Candidate> branches(const std::string& local_prefix, const std::string& remote_prefix,
                                    const HandlerRequest& request);

    CommandRunner runner_;
    completion_cache::TtlCache<std::string> output_cache_;
};

// Words after the command up to, but not including, the token under the cursor.
std::vector<std::string> words_before_cursor(const completion_parser::ParsedCommandLine& parsed);

}  // namespace completion_handlers
