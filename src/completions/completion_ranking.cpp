/*
  completion_ranking.cpp

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

#include "completion_ranking.h"

#include <algorithm>
#include <unordered_map>
#include <utility>

#include "completion_utils.h"

namespace completion_ranking {

using completion_candidate::CandidateCategory;

namespace {

constexpr int kMatchScore = 10;
constexpr int kConsecutiveBonus = 15;
constexpr int kFirstCharacterBonus = 20;
constexpr int kBoundaryBonus = 10;

bool is_boundary(char c) {
    return c == '-' || c == '_' || c == '/' || c == '.' || c == ' ';
}

std::string comparable(const std::string& text) {
    std::string plain = completion_utils::unquote_path(text);
    if (plain.size() > 1 && plain.back() == '/') {
        plain.pop_back();
    }
    return plain;
}

// Only these name filesystem objects, so only these may stand in for one another by name.
bool is_path_like(CandidateCategory category) {
    switch (category) {
        case CandidateCategory::Command:
        case CandidateCategory::Executable:
        case CandidateCategory::Directory:
        case CandidateCategory::File:
            return true;
        default:
            return false;
    }
}

}  // namespace

int fuzzy_score(const std::string& query, const std::string& text) {
    if (query.empty() || text.empty()) {
        return 0;
    }

    const std::string needle = completion_utils::normalize_for_comparison(query);
    const std::string haystack = completion_utils::normalize_for_comparison(text);

    int score = 0;
    size_t q = 0;
    size_t last_match = std::string::npos;
    for (size_t i = 0; i < haystack.size() && q < needle.size(); ++i) {
        if (haystack[i] != needle[q]) {
            continue;
        }
        score += kMatchScore;
        if (i == 0) {
            score += kFirstCharacterBonus;
        } else if (is_boundary(haystack[i - 1])) {
            score += kBoundaryBonus;
        }
        if (last_match != std::string::npos) {
            if (last_match + 1 == i) {
                score += kConsecutiveBonus;
            } else {
                score -= static_cast<int>(i - last_match - 1);
            }
        }
        last_match = i;
        ++q;
    }

    if (q < needle.size()) {
        return 0;
    }
    return std::max(1, score);
}

MatchTier classify_match(const std::string& query, const std::string& text) {
    const std::string typed = comparable(query);
    const std::string plain = comparable(text);
    if (completion_utils::equals_completion_token(plain, typed)) {
        return MatchTier::Exact;
    }
    if (completion_utils::matches_completion_prefix(plain, typed)) {
        return MatchTier::Prefix;
    }
    if (fuzzy_score(typed, plain) > 0) {
        return MatchTier::Fuzzy;
    }
    return MatchTier::None;
}

void deduplicate(std::vector<Candidate>& candidates) {
    std::vector<Candidate> unique;
    unique.reserve(candidates.size());
    std::unordered_map<std::string, size_t> index_by_name;

    for (auto& candidate : candidates) {
        std::string key = is_path_like(candidate.category)
                              ? completion_utils::base_name(comparable(candidate.text))
                              : comparable(candidate.text);
        auto it = index_by_name.find(key);
        if (it == index_by_name.end()) {
            index_by_name.emplace(std::move(key), unique.size());
            unique.push_back(std::move(candidate));
            continue;
        }
        Candidate& kept = unique[it->second];
        if (candidate.category == CandidateCategory::Executable &&
            kept.category == CandidateCategory::File) {
            kept = std::move(candidate);
        }
    }
    candidates = std::move(unique);
}

void sort_by_priority(std::vector<Candidate>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.priority > b.priority; });
}

void smart_rank(std::vector<Candidate>& candidates, const std::string& query) {
    struct Ranked {
        MatchTier tier;
        int score;
        Candidate candidate;
    };

    std::vector<Ranked> ranked;
    ranked.reserve(candidates.size());
    for (auto& candidate : candidates) {
        MatchTier tier = classify_match(query, candidate.text);
        int score = tier == MatchTier::Fuzzy
                        ? fuzzy_score(comparable(query), comparable(candidate.text))
                        : 0;
        ranked.push_back(Ranked{tier, score, std::move(candidate)});
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.tier != b.tier) {
            return a.tier < b.tier;
        }
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.candidate.priority > b.candidate.priority;
    });

    candidates.clear();
    for (auto& entry : ranked) {
        candidates.push_back(std::move(entry.candidate));
    }
}

void truncate(std::vector<Candidate>& candidates, size_t max_results) {
    if (candidates.size() > max_results) {
        candidates.resize(max_results);
    }
}

}  // namespace completion_ranking
