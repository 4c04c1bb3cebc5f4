/*
  completion_history.h

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
#include <filesystem>
#include <string>
#include <vector>

#include "completion_candidate.h"
#include "completion_parser.h"
#include "tabsh_filesystem.h"

namespace completion_history {

struct HistoryEntry {
    std::string command;
    size_t frequency = 0;
    // Seconds since the epoch; 0 when the history carried no timestamp.
    std::int64_t last_used = 0;
};

class HistoryStore {
   public:
    virtual ~HistoryStore() = default;

    // One entry per distinct command line.
    virtual std::vector<HistoryEntry> entries() const = 0;
};

class MemoryHistoryStore : public HistoryStore {
   public:
    void add(const std::string& command, std::int64_t timestamp);
    std::vector<HistoryEntry> entries() const override;

   private:
    std::vector<HistoryEntry> entries_;
};

// The shell history file: "# <epoch>" header lines, each followed by the command it
// stamps. Lines before the first header count as unstamped commands.
class FileHistoryStore : public HistoryStore {
   public:
    explicit FileHistoryStore(std::filesystem::path path);

    tabsh_filesystem::Result<void> load();
    std::vector<HistoryEntry> entries() const override;

    const std::filesystem::path& path() const {
        return path_;
    }

   private:
    std::filesystem::path path_;
    std::vector<HistoryEntry> entries_;
};

std::vector<HistoryEntry> parse_history(const std::string& content);

// Frequency weighted by how recently the command was last used.
double frecency(const HistoryEntry& entry, std::int64_t now);

// Tokens that followed the same leading words in past command lines, best frecency first.
// On an empty line the most recent distinct commands are offered instead.
std::vector<completion_candidate::Candidate> history_candidates(
    const HistoryStore& store, const std::string& input,
    const completion_parser::ParsedCommandLine& parsed, std::int64_t now);

}  // namespace completion_history
