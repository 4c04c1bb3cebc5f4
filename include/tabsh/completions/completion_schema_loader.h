/*
  completion_schema_loader.h

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
#include <string>
#include <vector>

#include "completion_schema.h"
#include "tabsh_filesystem.h"

namespace completion_schema {

// One schema document per command. Rejects malformed JSON and structurally invalid
// definitions; the error names `source`.
tabsh_filesystem::Result<CommandCompletion> parse_completion_document(const std::string& content,
                                                                      const std::string& source);

tabsh_filesystem::Result<void> validate_completion(const CommandCompletion& completion);
tabsh_filesystem::Result<void> validate_option(const CommandOption& option);
bool is_valid_name(const std::string& name);

struct LoadReport {
    size_t loaded = 0;
    size_t rejected = 0;
    size_t shadowed = 0;
    std::vector<std::string> errors;
};

class SchemaLoader {
   public:
    SchemaLoader();
    SchemaLoader(std::vector<std::filesystem::path> directories, bool include_bundled);

    // Config dir, home fallback, then ./completions, with config::extra_schema_directories
    // ahead of the working-directory entry.
    static std::vector<std::filesystem::path> default_directories();

    void add_directory(const std::filesystem::path& directory);

    // Bundled definitions first, then each directory in order. Bad files are recorded in
    // the report and skipped.
    void load_into(CommandCompletionDatabase& database);
    SharedDatabase load();

    const LoadReport& report() const {
        return report_;
    }

   private:
    void register_document(CommandCompletionDatabase& database, const std::string& content,
                           const std::string& source);
    void load_directory(CommandCompletionDatabase& database,
                        const std::filesystem::path& directory);

    std::vector<std::filesystem::path> directories_;
    bool include_bundled_ = true;
    LoadReport report_;
};

}  // namespace completion_schema
