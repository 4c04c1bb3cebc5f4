/*
  completion_generator.h

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
#include <optional>
#include <string>
#include <vector>

#include "completion_candidate.h"
#include "completion_metadata.h"
#include "completion_parser.h"
#include "completion_paths.h"
#include "completion_schema.h"

namespace completion_generator {

using completion_candidate::Candidate;

// Names offered in command position even when nothing describes them.
const std::vector<std::string>& common_commands();

// Candidates that follow from the schema and the filesystem alone. Metadata-backed kinds
// (signals, accounts, interfaces, processes) are left to the engine.
class StaticGenerator {
   public:
    StaticGenerator(completion_schema::SharedDatabase database,
                    completion_paths::DirectoryListingCache& listing,
                    completion_metadata::ExecutableSearch& executables);

    std::vector<Candidate> generate(const completion_parser::ParsedCommandLine& parsed,
                                    const std::filesystem::path& current_dir) const;

    // `files_when_untyped` selects file completion for a missing type.
    std::vector<Candidate> argument_candidates(
        const std::optional<completion_schema::ArgumentType>& type, const std::string& token,
        const std::filesystem::path& current_dir, bool files_when_untyped) const;

    std::vector<Candidate> file_candidates(const std::string& token,
                                           const std::filesystem::path& current_dir) const;

   private:
    std::vector<Candidate> command_candidates(const std::string& token,
                                              const std::filesystem::path& current_dir) const;
    std::vector<Candidate> subcommand_candidates(const completion_parser::ParsedCommandLine& parsed,
                                                 const std::filesystem::path& current_dir) const;
    std::vector<Candidate> option_candidates(const completion_parser::ParsedCommandLine& parsed) const;
    std::vector<Candidate> environment_candidates(const std::string& token) const;

    completion_schema::SharedDatabase database_;
    completion_paths::DirectoryListingCache& listing_;
    completion_metadata::ExecutableSearch& executables_;
};

}  // namespace completion_generator
