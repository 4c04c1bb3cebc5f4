/*
  flags.h

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

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace flags {

struct ParseResult {
    std::string line;
    std::optional<size_t> cursor;
    std::string directory;
    std::string history_file;
    std::vector<std::string> schema_directories;
    bool path_prefix = false;
    bool list_commands = false;
    bool json_output = false;
    bool show_version = false;
    bool show_help = false;
    int exit_code = 0;
    bool should_exit = false;
};

// Applies the tuning flags to config:: directly; everything else lands in the result.
// Usage errors print an INVALID_ARGUMENT error and set should_exit with exit code 2.
ParseResult parse_arguments(int argc, char* argv[]);

}  // namespace flags
