/*
  completion_engine.h

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
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "completion_cache.h"
#include "completion_candidate.h"
#include "completion_generator.h"
#include "completion_handlers.h"
#include "completion_history.h"
#include "completion_metadata.h"
#include "completion_parser.h"
#include "completion_paths.h"
#include "completion_schema.h"

namespace completion_engine {

using completion_candidate::Candidate;

// Seams for everything that touches the outside world. Empty members fall back to the
// real system.
struct EngineServices {
    completion_handlers::CommandRunner command_runner;
    completion_paths::DirectoryReader directory_reader;
    completion_cache::ClockFunction clock;
    std::filesystem::path system_root = "/";
    std::function<std::int64_t()> epoch_now;
};

struct CompletionResult {
    std::vector<Candidate> candidates;
    // Byte span of `input` that the chosen candidate replaces.
    size_t replace_start = 0;
    size_t replace_end = 0;
};

class CompletionEngine {
   public:
    explicit CompletionEngine(completion_schema::SharedDatabase database,
                              EngineServices services = EngineServices{});

    CompletionEngine(const CompletionEngine&) = delete;
    CompletionEngine& operator=(const CompletionEngine&) = delete;

    // Starting a request cancels the one before it; a cancelled request returns nothing.
    CompletionResult complete_request(const std::string& input, size_t cursor,
                                      const std::filesystem::path& current_dir,
                                      size_t max_results,
                                      const completion_history::HistoryStore* history = nullptr);

    std::vector<Candidate> complete(const std::string& input, size_t cursor,
                                    const std::filesystem::path& current_dir, size_t max_results,
                                    const completion_history::HistoryStore* history = nullptr);

    const completion_schema::SharedDatabase& database() const {
        return database_;
    }

    completion_paths::DirectoryListingCache& directory_cache() {
        return listing_;
    }

    completion_handlers::DynamicCompleter& dynamic_completer() {
        return dynamic_;
    }

   private:
    std::shared_ptr<std::atomic<bool>> begin_request();

    CompletionResult run(const std::string& input, size_t cursor,
                         const std::filesystem::path& current_dir,
                         const completion_history::HistoryStore* history,
                         const std::atomic<bool>& cancelled, int depth);

    // For "sudo git c": the line from the wrapped command on, if one is already typed.
    bool find_wrapped_command(const completion_parser::ParsedCommandLine& parsed,
                              size_t& offset) const;

    std::vector<Candidate> metadata_candidates(
        const completion_parser::ParsedCommandLine& parsed);

    completion_schema::SharedDatabase database_;
    completion_parser::CommandLineParser parser_;
    completion_paths::DirectoryListingCache listing_;
    completion_metadata::ExecutableSearch executables_;
    completion_metadata::SystemTables system_;
    completion_generator::StaticGenerator static_generator_;
    completion_handlers::DynamicCompleter dynamic_;
    std::function<std::int64_t()> epoch_now_;

    std::mutex request_mutex_;
    std::shared_ptr<std::atomic<bool>> active_request_;
};

}  // namespace completion_engine
