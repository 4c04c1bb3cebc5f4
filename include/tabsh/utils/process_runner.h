/*
  process_runner.h

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

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "tabsh_filesystem.h"

namespace process_runner {

constexpr size_t kMaxCapturedOutput = 2 * 1024 * 1024;

struct RunOptions {
    std::chrono::milliseconds timeout{750};
    std::string working_directory;
    // Polled while the child runs; when it turns true the child is killed.
    const std::atomic<bool>* cancelled = nullptr;
    size_t max_output = kMaxCapturedOutput;
};

// Runs argv[0] from PATH without a shell and captures stdout. Stdin and stderr are
// /dev/null. Timeout, cancellation, spawn failure and a non-zero exit are errors.
tabsh_filesystem::Result<std::string> run(const std::vector<std::string>& argv,
                                          const RunOptions& options = RunOptions{});

std::string describe_command(const std::vector<std::string>& argv);

}  // namespace process_runner
