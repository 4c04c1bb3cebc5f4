/*
  completion_candidate.cpp

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

#include "completion_candidate.h"

#include <utility>

namespace completion_candidate {

std::uint32_t default_priority(CandidateCategory category) {
    switch (category) {
        case CandidateCategory::SubCommand:
            return priority::kSubCommand;
        case CandidateCategory::ShortOption:
        case CandidateCategory::LongOption:
            return priority::kOption;
        case CandidateCategory::History:
            return priority::kHistory;
        case CandidateCategory::Command:
        case CandidateCategory::Argument:
            return priority::kArgument;
        case CandidateCategory::Executable:
            return priority::kExecutable;
        case CandidateCategory::Directory:
            return priority::kDirectory;
        case CandidateCategory::Process:
            return priority::kProcess;
        case CandidateCategory::File:
            return priority::kFile;
        case CandidateCategory::Generic:
        default:
            return priority::kGeneric;
    }
}

const char* category_name(CandidateCategory category) {
    switch (category) {
        case CandidateCategory::Command:
            return "command";
        case CandidateCategory::SubCommand:
            return "subcommand";
        case CandidateCategory::ShortOption:
            return "short-option";
        case CandidateCategory::LongOption:
            return "long-option";
        case CandidateCategory::Argument:
            return "argument";
        case CandidateCategory::Executable:
            return "executable";
        case CandidateCategory::Directory:
            return "directory";
        case CandidateCategory::File:
            return "file";
        case CandidateCategory::Process:
            return "process";
        case CandidateCategory::History:
            return "history";
        case CandidateCategory::Generic:
        default:
            return "generic";
    }
}

Candidate Candidate::make(std::string text, CandidateCategory category,
                          std::optional<std::string> description) {
    Candidate candidate;
    candidate.text = std::move(text);
    candidate.description = std::move(description);
    candidate.category = category;
    candidate.priority = default_priority(category);
    return candidate;
}

}  // namespace completion_candidate
