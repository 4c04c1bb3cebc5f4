/*
  tabsh_filesystem.h

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

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tabsh_filesystem {

struct Error {
    std::string message;
    explicit Error(const std::string& msg) : message(msg) {
    }
};

template <typename T>
class Result {
   public:
    explicit Result(T value) : value_(std::move(value)), has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<T> ok(T value) {
        return Result<T>(std::move(value));
    }
    static Result<T> error(const std::string& message) {
        return Result<T>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const T& value() const {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    T& value() {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    T value_{};
    std::string error_;
    bool has_value_;
};

template <>
class Result<void> {
   public:
    Result() : has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<void> ok() {
        return Result<void>();
    }
    static Result<void> error(const std::string& message) {
        return Result<void>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    std::string error_;
    bool has_value_;
};

enum class EntryKind : std::uint8_t {
    File,
    Directory,
    Executable,
    Other
};

struct DirectoryEntry {
    std::string name;
    EntryKind kind = EntryKind::File;
};

Result<int> safe_open(const std::string& path, int flags, mode_t mode = 0644);
void safe_close(int fd);
Result<void> set_close_on_exec(int fd);
Result<void> create_pipe_cloexec(int pipe_fds[2]);
void close_pipe(int pipe_fds[2]);

Result<std::string> read_file_content(const std::string& path);

// Lists one directory, resolving symlinks so a link to a directory reports Directory.
// Entries come back sorted by name.
Result<std::vector<DirectoryEntry>> list_directory(const std::filesystem::path& directory);

bool is_executable_file(const std::filesystem::path& path);

const std::filesystem::path& g_user_home_path();
const std::filesystem::path& g_tabsh_config_path();
const std::filesystem::path& g_tabsh_cache_path();
const std::filesystem::path& g_tabsh_history_path();
const std::filesystem::path& g_tabsh_config_file_path();

bool initialize_tabsh_directories();

std::string safe_current_directory();

// "~" and "~/x" expand against $HOME; anything else is returned unchanged.
std::string expand_tilde(const std::string& path);
// Inverse of expand_tilde for display: "/home/u/x" becomes "~/x".
std::string contract_home(const std::string& path);

std::vector<std::string> search_path_directories();

}  // namespace tabsh_filesystem
