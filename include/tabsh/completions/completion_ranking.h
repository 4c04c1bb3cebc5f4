/*
  completion_ranking.h

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
#include <string>
#include <vector>

#include "completion_candidate.h"

namespace completion_ranking {

using completion_candidate::Candidate;

enum class MatchTier : std::uint8_t {
    Exact,
    Prefix,
    Fuzzy,
    None
};

// Subsequence score of `query` against `text`; 0 when `query` is not a subsequence.
// Consecutive runs, word-boundary hits and a first-character hit score higher.
int fuzzy_score(const std::string& query, const std::string& text);

MatchTier classify_match(const std::string& query, const std::string& text);

// Collapses duplicates. Commands, executables, directories and files match on base name,
// every other category on its full text. An executable takes the place of a plain file
// with its name; otherwise the first one seen is kept.
void deduplicate(std::vector<Candidate>& candidates);

// Priority descending, stable within a priority.
void sort_by_priority(std::vector<Candidate>& candidates);

// Exact before prefix before fuzzy (best score first), then priority. Candidates that do
// not match `query` at all sink to the end.
void smart_rank(std::vector<Candidate>& candidates, const std::string& query);

void truncate(std::vector<Candidate>& candidates, size_t max_results);

}  // namespace completion_ranking
