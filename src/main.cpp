/*
  main.cpp

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

#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "completion_engine.h"
#include "completion_history.h"
#include "completion_paths.h"
#include "completion_schema_loader.h"
#include "debug.h"
#include "error_out.h"
#include "flags.h"
#include "tabsh.h"
#include "tabsh_filesystem.h"
#include "usage.h"

namespace {

void print_candidates(const std::vector<completion_candidate::Candidate>& candidates,
                      bool as_json) {
    if (as_json) {
        nlohmann::json output = nlohmann::json::array();
        for (const auto& candidate : candidates) {
            nlohmann::json entry = {
                {"text", candidate.text},
                {"category", completion_candidate::category_name(candidate.category)},
                {"priority", candidate.priority}};
            if (candidate.description) {
                entry["description"] = *candidate.description;
            }
            output.push_back(std::move(entry));
        }
        std::cout << output.dump(2) << "\n";
        return;
    }

    for (const auto& candidate : candidates) {
        std::cout << candidate.text;
        if (candidate.description) {
            std::cout << '\t' << *candidate.description;
        }
        std::cout << '\n';
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_result =
        config::load_config_file(tabsh_filesystem::g_tabsh_config_file_path().string());
    if (config_result.is_error()) {
        print_error({ErrorType::RUNTIME_ERROR, ErrorSeverity::WARNING, "config",
                     config_result.error(), {"Falling back to default settings"}});
    }

    flags::ParseResult args = flags::parse_arguments(argc, argv);
    if (args.should_exit) {
        return args.exit_code;
    }
    if (args.show_help) {
        print_usage();
        return 0;
    }
    if (args.show_version) {
        print_version();
        return 0;
    }

    const std::string directory =
        args.directory.empty() ? tabsh_filesystem::safe_current_directory() : args.directory;

    if (args.path_prefix) {
        auto match = completion_paths::path_completion_prefix(args.line, directory);
        if (!match) {
            return 1;
        }
        std::cout << *match << "\n";
        return 0;
    }

    completion_schema::SchemaLoader loader(completion_schema::SchemaLoader::default_directories(),
                                           true);
    for (const auto& schema_dir : args.schema_directories) {
        loader.add_directory(schema_dir);
    }
    completion_schema::SharedDatabase database = loader.load();
    tabsh_debug_msg("schema database ready: %zu commands, %zu files rejected", database->size(),
                    loader.report().rejected);

    if (args.list_commands) {
        for (const auto& name : database->command_names()) {
            std::cout << name << "\n";
        }
        return 0;
    }

    completion_history::FileHistoryStore history(
        args.history_file.empty() ? tabsh_filesystem::g_tabsh_history_path()
                                  : std::filesystem::path(args.history_file));
    auto history_result = history.load();
    if (history_result.is_error()) {
        if (!args.history_file.empty()) {
            print_error({ErrorType::FILE_NOT_FOUND, ErrorSeverity::WARNING, "history",
                         history_result.error()});
        }
        tabsh_debug_msg("history unavailable: %s", history_result.error().c_str());
    }

    completion_engine::CompletionEngine engine(database);
    const size_t cursor = args.cursor.value_or(args.line.size());
    auto candidates = engine.complete(args.line, cursor, directory,
                                      static_cast<size_t>(config::max_results), &history);

    print_candidates(candidates, args.json_output);
    return 0;
}
