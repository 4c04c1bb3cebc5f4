/*
  completion_utils.cpp

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

#include "completion_utils.h"

#include <algorithm>
#include <cctype>
#include <string>

#include "quote_state.h"
#include "tabsh.h"

namespace completion_utils {

namespace {
bool same_letter(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

bool needs_quoting(char c) {
    switch (c) {
        case ' ':
        case '\t':
        case '\'':
        case '"':
        case '\\':
        case '(':
        case ')':
        case '[':
        case ']':
        case '{':
        case '}':
        case '&':
        case '|':
        case ';':
        case '<':
        case '>':
        case '*':
        case '?':
        case '$':
        case '`':
            return true;
        default:
            return false;
    }
}
}  // namespace

std::string quote_path_if_needed(const std::string& path) {
    if (path.empty())
        return path;

    if (std::none_of(path.begin(), path.end(), needs_quoting))
        return path;

    std::string result = "\"";
    for (char c : path) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') {
            result += '\\';
        }
        result += c;
    }
    result += "\"";

    return result;
}

std::string unquote_path(const std::string& path) {
    std::string result;
    result.reserve(path.size());
    utils::QuoteTracker quotes;
    for (char c : path) {
        if (quotes.feed(c) != utils::QuoteTracker::Role::Syntax) {
            result += c;
        }
    }
    return result;
}

std::string normalize_for_comparison(const std::string& value) {
    if (config::case_sensitive) {
        return value;
    }

    std::string lower_value = value;
    std::transform(lower_value.begin(), lower_value.end(), lower_value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_value;
}

bool starts_with_case_insensitive(const std::string& str, const std::string& prefix) {
    return prefix.size() <= str.size() &&
           std::equal(prefix.begin(), prefix.end(), str.begin(), same_letter);
}

bool starts_with_case_sensitive(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

bool matches_completion_prefix(const std::string& str, const std::string& prefix) {
    return config::case_sensitive ? starts_with_case_sensitive(str, prefix)
                                  : starts_with_case_insensitive(str, prefix);
}

bool equals_completion_token(const std::string& value, const std::string& target) {
    return value.size() == target.size() && matches_completion_prefix(value, target);
}

bool is_subsequence(const std::string& text, const std::string& query) {
    const std::string haystack = normalize_for_comparison(text);
    const std::string needle = normalize_for_comparison(query);
    size_t pos = 0;
    for (char c : haystack) {
        if (pos < needle.size() && c == needle[pos]) {
            ++pos;
        }
    }
    return pos == needle.size();
}

bool matches_completion_query(const std::string& str, const std::string& query) {
    if (matches_completion_prefix(str, query)) {
        return true;
    }
    return config::fuzzy_matching && !query.empty() && is_subsequence(str, query);
}

std::string base_name(const std::string& text) {
    std::string trimmed = text;
    if (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    size_t slash = trimmed.find_last_of('/');
    if (slash == std::string::npos || slash + 1 >= trimmed.size()) {
        return trimmed;
    }
    return trimmed.substr(slash + 1);
}

}  // namespace completion_utils
