/*
  completion_history.cpp

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

#include "completion_history.h"

#include <algorithm>
#include <cstdlib>
#include <unordered_map>
#include <utility>

#include "completion_utils.h"
#include "debug.h"
#include "string_utils.h"

namespace completion_history {

using completion_candidate::Candidate;
using completion_candidate::CandidateCategory;
using tabsh_filesystem::Result;

namespace {

constexpr std::int64_t kHour = 60 * 60;
constexpr std::int64_t kDay = 24 * kHour;
constexpr std::int64_t kWeek = 7 * kDay;
constexpr size_t kRecentCommandLimit = 10;

void record(std::vector<HistoryEntry>& entries, std::unordered_map<std::string, size_t>& index,
            std::string command, std::int64_t timestamp) {
    while (!command.empty() && command.back() == '\n') {
        command.pop_back();
    }
    if (string_utils::trim_ascii_whitespace_copy(command).empty()) {
        return;
    }
    auto it = index.find(command);
    if (it == index.end()) {
        index.emplace(command, entries.size());
        entries.push_back(HistoryEntry{command, 1, timestamp});
        return;
    }
    HistoryEntry& entry = entries[it->second];
    ++entry.frequency;
    entry.last_used = std::max(entry.last_used, timestamp);
}

std::int64_t parse_timestamp(const std::string& header) {
    std::string digits = string_utils::trim_ascii_whitespace_copy(header.substr(1));
    if (digits.empty()) {
        return 0;
    }
    char* end = nullptr;
    long long value = std::strtoll(digits.c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || value < 0) {
        return 0;
    }
    return static_cast<std::int64_t>(value);
}

std::vector<std::string> token_texts(const std::string& line) {
    std::vector<std::string> texts;
    for (auto& token : completion_parser::tokenize(line)) {
        texts.push_back(std::move(token.text));
    }
    return texts;
}

}  // namespace

void MemoryHistoryStore::add(const std::string& command, std::int64_t timestamp) {
    for (auto& entry : entries_) {
        if (entry.command == command) {
            ++entry.frequency;
            entry.last_used = std::max(entry.last_used, timestamp);
            return;
        }
    }
    entries_.push_back(HistoryEntry{command, 1, timestamp});
}

std::vector<HistoryEntry> MemoryHistoryStore::entries() const {
    return entries_;
}

FileHistoryStore::FileHistoryStore(std::filesystem::path path) : path_(std::move(path)) {
}

Result<void> FileHistoryStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        entries_.clear();
        return Result<void>::ok();
    }

    auto content = tabsh_filesystem::read_file_content(path_.string());
    if (content.is_error()) {
        return Result<void>::error(content.error());
    }
    entries_ = parse_history(content.value());
    tabsh_debug_msg("loaded %zu distinct history entries from %s", entries_.size(),
                    path_.c_str());
    return Result<void>::ok();
}

std::vector<HistoryEntry> FileHistoryStore::entries() const {
    return entries_;
}

std::vector<HistoryEntry> parse_history(const std::string& content) {
    std::vector<HistoryEntry> entries;
    std::unordered_map<std::string, size_t> index;

    std::int64_t timestamp = 0;
    bool stamped = false;
    std::string payload;

    for (const auto& line : string_utils::split_lines(content)) {
        if (!line.empty() && line[0] == '#') {
            if (stamped) {
                record(entries, index, payload, timestamp);
            }
            timestamp = parse_timestamp(line);
            payload.clear();
            stamped = true;
            continue;
        }
        if (!stamped) {
            record(entries, index, line, 0);
            continue;
        }
        if (!payload.empty()) {
            payload += '\n';
        }
        payload += line;
    }
    if (stamped) {
        record(entries, index, payload, timestamp);
    }
    return entries;
}

double frecency(const HistoryEntry& entry, std::int64_t now) {
    double weight = 0.5;
    if (entry.last_used > 0) {
        const std::int64_t age = std::max<std::int64_t>(0, now - entry.last_used);
        if (age < kHour) {
            weight = 4.0;
        } else if (age < kDay) {
            weight = 2.0;
        } else if (age < kWeek) {
            weight = 1.0;
        }
    }
    return static_cast<double>(entry.frequency) * weight;
}

std::vector<Candidate> history_candidates(const HistoryStore& store, const std::string& input,
                                          const completion_parser::ParsedCommandLine& parsed,
                                          std::int64_t now) {
    std::vector<Candidate> candidates;
    const std::vector<HistoryEntry> entries = store.entries();

    if (string_utils::trim_ascii_whitespace_copy(input).empty()) {
        std::vector<HistoryEntry> recent = entries;
        std::stable_sort(recent.begin(), recent.end(),
                         [](const HistoryEntry& a, const HistoryEntry& b) {
                             return a.last_used > b.last_used;
                         });
        for (const auto& entry : recent) {
            if (candidates.size() >= kRecentCommandLimit) {
                break;
            }
            if (entry.command.find('\n') != std::string::npos) {
                continue;
            }
            candidates.push_back(Candidate::make(entry.command, CandidateCategory::History,
                                                 "recent command"));
        }
        return candidates;
    }

    const std::vector<std::string> leading = token_texts(input.substr(0, parsed.replace_start));
    const std::string& partial = parsed.current_token;

    std::vector<std::pair<std::string, double>> scored;
    std::unordered_map<std::string, size_t> index;
    for (const auto& entry : entries) {
        std::vector<std::string> words = token_texts(entry.command);
        if (words.size() <= leading.size() ||
            !std::equal(leading.begin(), leading.end(), words.begin())) {
            continue;
        }
        const std::string& word = words[leading.size()];
        if (!completion_utils::matches_completion_query(word, partial)) {
            continue;
        }
        const double score = frecency(entry, now);
        auto it = index.find(word);
        if (it == index.end()) {
            index.emplace(word, scored.size());
            scored.emplace_back(word, score);
        } else {
            scored[it->second].second += score;
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const std::pair<std::string, double>& a,
                        const std::pair<std::string, double>& b) { return a.second > b.second; });
    for (auto& item : scored) {
        candidates.push_back(Candidate::make(std::move(item.first), CandidateCategory::History,
                                             "history"));
    }
    return candidates;
}

}  // namespace completion_history
