/*
  completion_paths.h

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

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "completion_cache.h"
#include "completion_candidate.h"
#include "tabsh_filesystem.h"

namespace completion_paths {

using DirectoryListing = std::vector<tabsh_filesystem::DirectoryEntry>;
using DirectoryReader =
    std::function<tabsh_filesystem::Result<DirectoryListing>(const std::filesystem::path&)>;

// Directory reads behind a short TTL, keyed by the normalized absolute directory so every
// prefix typed against one directory shares an entry.
class DirectoryListingCache {
   public:
    explicit DirectoryListingCache(DirectoryReader reader = nullptr,
                                   completion_cache::ClockFunction clock = nullptr);

    tabsh_filesystem::Result<DirectoryListing> list(const std::filesystem::path& directory);

    completion_cache::CacheStats stats() const {
        return cache_.stats();
    }

   private:
    DirectoryReader reader_;
    completion_cache::TtlCache<DirectoryListing> cache_;
};

struct PathFilter {
    bool directories_only = false;
    bool executables_only = false;
    // Plain files must end in one of these; directories are always offered.
    std::vector<std::string> extensions;
};

struct SplitToken {
    // As typed, up to and including the last '/'; "" when the token has none.
    std::string display_directory;
    // Directory actually read.
    std::filesystem::path directory;
    std::string name_prefix;
};

SplitToken split_path_token(const std::string& token, const std::filesystem::path& current_dir);

// Entries of the token's directory whose names start with the token's last segment.
// Directories end in '/', names are quoted when needed, and a "~/" token keeps its form.
std::vector<completion_candidate::Candidate> path_candidates(const std::string& token,
                                                             const std::filesystem::path& current_dir,
                                                             const PathFilter& filter,
                                                             DirectoryListingCache& listing);

// Single best match for non-interactive callers: the first sorted entry whose display path
// starts with `input`, ignoring a leading "./" on either side.
std::optional<std::string> path_completion_prefix(const std::string& input,
                                                  const std::filesystem::path& current_dir);

}  // namespace completion_paths
