/*
  completion_paths.cpp

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

#include "completion_paths.h"

#include <utility>

#include "completion_utils.h"
#include "debug.h"
#include "string_utils.h"
#include "tabsh.h"

namespace completion_paths {

namespace fs = std::filesystem;
using completion_candidate::Candidate;
using completion_candidate::CandidateCategory;
using tabsh_filesystem::EntryKind;
using tabsh_filesystem::Result;

DirectoryListingCache::DirectoryListingCache(DirectoryReader reader,
                                             completion_cache::ClockFunction clock)
    : reader_(reader ? std::move(reader) : DirectoryReader(tabsh_filesystem::list_directory)),
      cache_(completion_cache::kPathListingTtl, std::move(clock)) {
}

Result<DirectoryListing> DirectoryListingCache::list(const fs::path& directory) {
    fs::path key_path = directory.lexically_normal();
    // "dir/" and "dir" share an entry
    if (!key_path.has_filename() && key_path.has_relative_path()) {
        key_path = key_path.parent_path();
    }
    return cache_.get_or_load(key_path.string(), [&]() {
        tabsh_debug_msg("listing directory %s", key_path.c_str());
        return reader_(key_path);
    });
}

SplitToken split_path_token(const std::string& token, const fs::path& current_dir) {
    SplitToken split;
    const std::string unquoted = completion_utils::unquote_path(token);
    const size_t slash = unquoted.rfind('/');
    if (slash == std::string::npos) {
        split.directory = current_dir;
        split.name_prefix = unquoted;
        return split;
    }

    split.display_directory = unquoted.substr(0, slash + 1);
    split.name_prefix = unquoted.substr(slash + 1);

    fs::path typed(tabsh_filesystem::expand_tilde(split.display_directory));
    split.directory = typed.is_absolute() ? typed : current_dir / typed;
    return split;
}

namespace {

bool entry_passes(const tabsh_filesystem::DirectoryEntry& entry, const PathFilter& filter) {
    if (entry.kind == EntryKind::Directory) {
        return true;
    }
    if (filter.directories_only) {
        return false;
    }
    if (filter.executables_only && entry.kind != EntryKind::Executable) {
        return false;
    }
    if (filter.extensions.empty()) {
        return true;
    }
    for (const auto& extension : filter.extensions) {
        std::string suffix = extension;
        if (!suffix.empty() && suffix[0] != '.') {
            suffix.insert(suffix.begin(), '.');
        }
        if (string_utils::ends_with(entry.name, suffix)) {
            return true;
        }
    }
    return false;
}

std::string display_text(const std::string& display_directory, const std::string& name,
                         bool is_directory) {
    std::string tail = name;
    if (is_directory) {
        tail += '/';
    }
    // Leave a leading "~/" unquoted so the shell still expands it.
    if (string_utils::starts_with(display_directory, "~/")) {
        return "~/" + completion_utils::quote_path_if_needed(display_directory.substr(2) + tail);
    }
    return completion_utils::quote_path_if_needed(display_directory + tail);
}

}  // namespace

std::vector<Candidate> path_candidates(const std::string& token, const fs::path& current_dir,
                                       const PathFilter& filter, DirectoryListingCache& listing) {
    std::vector<Candidate> candidates;
    const SplitToken split = split_path_token(token, current_dir);

    auto entries = listing.list(split.directory);
    if (entries.is_error()) {
        tabsh_debug_msg("path completion skipped: %s", entries.error().c_str());
        return candidates;
    }

    const bool want_hidden =
        config::show_hidden_files || string_utils::starts_with(split.name_prefix, ".");

    for (const auto& entry : entries.value()) {
        if (!want_hidden && !entry.name.empty() && entry.name[0] == '.') {
            continue;
        }
        if (!completion_utils::matches_completion_query(entry.name, split.name_prefix)) {
            continue;
        }
        if (!entry_passes(entry, filter)) {
            continue;
        }

        const bool is_directory = entry.kind == EntryKind::Directory;
        CandidateCategory category = CandidateCategory::File;
        if (is_directory) {
            category = CandidateCategory::Directory;
        } else if (entry.kind == EntryKind::Executable) {
            category = CandidateCategory::Executable;
        }
        candidates.push_back(Candidate::make(
            display_text(split.display_directory, entry.name, is_directory), category));
    }
    return candidates;
}

std::optional<std::string> path_completion_prefix(const std::string& input,
                                                  const fs::path& current_dir) {
    if (input.empty() || input.back() == '/') {
        return std::nullopt;
    }

    const SplitToken split = split_path_token(input, current_dir);
    auto entries = tabsh_filesystem::list_directory(split.directory);
    if (entries.is_error()) {
        tabsh_debug_msg("path prefix lookup failed: %s", entries.error().c_str());
        return std::nullopt;
    }

    for (const auto& entry : entries.value()) {
        const std::string display = split.display_directory + entry.name;
        if (string_utils::starts_with(display, input)) {
            return display;
        }
        if (string_utils::starts_with(display, "./") &&
            string_utils::starts_with(display.substr(2), input)) {
            return display.substr(2);
        }
    }
    return std::nullopt;
}

}  // namespace completion_paths
