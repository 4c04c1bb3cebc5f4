/*
  tabsh.cpp

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

#include "tabsh.h"

#include <filesystem>
#include <system_error>

#include <nlohmann/json.hpp>

#include "debug.h"

namespace tabsh {
const char* const kVersion = "1.4.0";
}  // namespace tabsh

namespace config {
bool case_sensitive = false;
bool fuzzy_matching = false;
bool smart_ranking = true;
long max_results = kDefaultMaxResults;
long subprocess_timeout_ms = kDefaultSubprocessTimeoutMs;
bool show_hidden_files = false;
bool include_system_users = false;
bool history_suggestions = true;
bool dynamic_handlers_enabled = true;
std::vector<std::string> extra_schema_directories;

namespace {
using tabsh_filesystem::Result;

struct PendingValues {
    bool case_sensitive = config::case_sensitive;
    bool fuzzy_matching = config::fuzzy_matching;
    bool smart_ranking = config::smart_ranking;
    long max_results = config::max_results;
    long subprocess_timeout_ms = config::subprocess_timeout_ms;
    bool show_hidden_files = config::show_hidden_files;
    bool include_system_users = config::include_system_users;
    bool history_suggestions = config::history_suggestions;
    bool dynamic_handlers_enabled = config::dynamic_handlers_enabled;
    std::vector<std::string> extra_schema_directories = config::extra_schema_directories;
};

Result<void> read_bool(const nlohmann::json& document, const char* key, bool& target) {
    if (!document.contains(key)) {
        return Result<void>::ok();
    }
    const auto& value = document.at(key);
    if (!value.is_boolean()) {
        return Result<void>::error(std::string("'") + key + "' must be a boolean");
    }
    target = value.get<bool>();
    return Result<void>::ok();
}

Result<void> read_positive(const nlohmann::json& document, const char* key, long& target) {
    if (!document.contains(key)) {
        return Result<void>::ok();
    }
    const auto& value = document.at(key);
    if (!value.is_number_integer() || value.get<long>() <= 0) {
        return Result<void>::error(std::string("'") + key + "' must be a positive integer");
    }
    target = value.get<long>();
    return Result<void>::ok();
}
}  // namespace

Result<void> apply_config_document(const std::string& content, const std::string& source) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<void>::error(source + ": " + e.what());
    }

    if (!document.is_object()) {
        return Result<void>::error(source + ": top level must be an object");
    }

    PendingValues pending;
    Result<void> checks[] = {
        read_bool(document, "case_sensitive", pending.case_sensitive),
        read_bool(document, "fuzzy_matching", pending.fuzzy_matching),
        read_bool(document, "smart_ranking", pending.smart_ranking),
        read_positive(document, "max_results", pending.max_results),
        read_positive(document, "subprocess_timeout_ms", pending.subprocess_timeout_ms),
        read_bool(document, "show_hidden_files", pending.show_hidden_files),
        read_bool(document, "include_system_users", pending.include_system_users),
        read_bool(document, "history_suggestions", pending.history_suggestions),
        read_bool(document, "dynamic_handlers_enabled", pending.dynamic_handlers_enabled),
    };
    for (const auto& check : checks) {
        if (check.is_error()) {
            return Result<void>::error(source + ": " + check.error());
        }
    }

    if (document.contains("extra_schema_directories")) {
        const auto& dirs = document.at("extra_schema_directories");
        if (!dirs.is_array()) {
            return Result<void>::error(source + ": 'extra_schema_directories' must be an array");
        }
        pending.extra_schema_directories.clear();
        for (const auto& dir : dirs) {
            if (!dir.is_string()) {
                return Result<void>::error(source +
                                           ": 'extra_schema_directories' must hold strings");
            }
            pending.extra_schema_directories.push_back(
                tabsh_filesystem::expand_tilde(dir.get<std::string>()));
        }
    }

    case_sensitive = pending.case_sensitive;
    fuzzy_matching = pending.fuzzy_matching;
    smart_ranking = pending.smart_ranking;
    max_results = pending.max_results;
    subprocess_timeout_ms = pending.subprocess_timeout_ms;
    show_hidden_files = pending.show_hidden_files;
    include_system_users = pending.include_system_users;
    history_suggestions = pending.history_suggestions;
    dynamic_handlers_enabled = pending.dynamic_handlers_enabled;
    extra_schema_directories = std::move(pending.extra_schema_directories);
    return Result<void>::ok();
}

Result<void> load_config_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        tabsh_debug_msg("no config file at %s", path.c_str());
        return Result<void>::ok();
    }

    auto content = tabsh_filesystem::read_file_content(path);
    if (content.is_error()) {
        return Result<void>::error(content.error());
    }
    return apply_config_document(content.value(), path);
}

void reset_to_defaults() {
    case_sensitive = false;
    fuzzy_matching = false;
    smart_ranking = true;
    max_results = kDefaultMaxResults;
    subprocess_timeout_ms = kDefaultSubprocessTimeoutMs;
    show_hidden_files = false;
    include_system_users = false;
    history_suggestions = true;
    dynamic_handlers_enabled = true;
    extra_schema_directories.clear();
}
}  // namespace config
