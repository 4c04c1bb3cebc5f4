/*
  completion_candidate.h

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

#include <cstdint>
#include <optional>
#include <string>

namespace completion_candidate {

enum class CandidateCategory : std::uint8_t {
    Command,
    SubCommand,
    ShortOption,
    LongOption,
    Argument,
    Executable,
    Directory,
    File,
    Process,
    History,
    Generic
};

namespace priority {
constexpr std::uint32_t kSubCommand = 100;
constexpr std::uint32_t kOption = 80;
constexpr std::uint32_t kHistory = 70;
constexpr std::uint32_t kArgument = 60;
constexpr std::uint32_t kExecutable = 55;
constexpr std::uint32_t kDirectory = 50;
constexpr std::uint32_t kProcess = 45;
constexpr std::uint32_t kFile = 40;
constexpr std::uint32_t kGeneric = 30;
}  // namespace priority

std::uint32_t default_priority(CandidateCategory category);
const char* category_name(CandidateCategory category);

struct Candidate {
    std::string text;
    std::optional<std::string> description;
    CandidateCategory category = CandidateCategory::Generic;
    std::uint32_t priority = priority::kGeneric;

    static Candidate make(std::string text, CandidateCategory category,
                          std::optional<std::string> description = std::nullopt);

    bool operator==(const Candidate& other) const {
        return text == other.text && description == other.description &&
               category == other.category && priority == other.priority;
    }
};

}  // namespace completion_candidate
