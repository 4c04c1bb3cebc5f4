/*
  tabsh.h

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

#include <string>
#include <vector>

#include "tabsh_filesystem.h"

namespace tabsh {
extern const char* const kVersion;
}  // namespace tabsh

namespace config {
extern bool case_sensitive;
extern bool fuzzy_matching;
extern bool smart_ranking;
extern long max_results;
extern long subprocess_timeout_ms;
extern bool show_hidden_files;
extern bool include_system_users;
extern bool history_suggestions;
extern bool dynamic_handlers_enabled;
extern std::vector<std::string> extra_schema_directories;

constexpr long kDefaultMaxResults = 30;
constexpr long kDefaultSubprocessTimeoutMs = 750;

// Applies the keys found in a JSON config document. A missing file is not an error.
tabsh_filesystem::Result<void> load_config_file(const std::string& path);
tabsh_filesystem::Result<void> apply_config_document(const std::string& content,
                                                     const std::string& source);
void reset_to_defaults();
}  // namespace config
