/*
  tabsh_filesystem.cpp

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

#include "tabsh_filesystem.h"

#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <system_error>

#include "debug.h"

namespace fs = std::filesystem;

namespace tabsh_filesystem {

namespace {
std::string describe_errno(int err) {
    return std::system_category().message(err);
}

fs::path resolve_home_directory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return fs::path(home);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return fs::path(pw->pw_dir);
    }
    return fs::path("/");
}

fs::path xdg_directory(const char* variable, const char* fallback) {
    const char* value = std::getenv(variable);
    if (value != nullptr && value[0] == '/') {
        return fs::path(value) / "tabsh";
    }
    return g_user_home_path() / fallback / "tabsh";
}

std::string current_home_string() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return home;
    }
    return g_user_home_path().string();
}
}  // namespace

Result<int> safe_open(const std::string& path, int flags, mode_t mode) {
    int fd = ::open(path.c_str(), flags, mode);
    if (fd == -1) {
        return Result<int>::error("Failed to open file '" + path + "': " + describe_errno(errno));
    }
    return Result<int>::ok(fd);
}

void safe_close(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

Result<void> set_close_on_exec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags == -1 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
        return Result<void>::error("Failed to set close-on-exec on descriptor " +
                                   std::to_string(fd) + ": " + describe_errno(errno));
    }
    return Result<void>::ok();
}

Result<void> create_pipe_cloexec(int pipe_fds[2]) {
    if (::pipe(pipe_fds) == -1) {
        return Result<void>::error("Failed to create pipe: " + describe_errno(errno));
    }

    for (int i = 0; i < 2; ++i) {
        auto cloexec_result = set_close_on_exec(pipe_fds[i]);
        if (cloexec_result.is_error()) {
            close_pipe(pipe_fds);
            return cloexec_result;
        }
    }
    return Result<void>::ok();
}

void close_pipe(int pipe_fds[2]) {
    safe_close(pipe_fds[0]);
    safe_close(pipe_fds[1]);
    pipe_fds[0] = -1;
    pipe_fds[1] = -1;
}

Result<std::string> read_file_content(const std::string& path) {
    auto open_result = safe_open(path, O_RDONLY);
    if (open_result.is_error()) {
        return Result<std::string>::error(open_result.error());
    }

    int fd = open_result.value();
    std::string content;
    char buffer[4096];
    ssize_t bytes_read = 0;

    while ((bytes_read = read(fd, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<size_t>(bytes_read));
    }

    safe_close(fd);

    if (bytes_read < 0) {
        return Result<std::string>::error("Failed to read from file '" + path +
                                          "': " + describe_errno(errno));
    }

    return Result<std::string>::ok(content);
}

Result<std::vector<DirectoryEntry>> list_directory(const fs::path& directory) {
    std::vector<DirectoryEntry> entries;
    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Result<std::vector<DirectoryEntry>>::error(
            "Failed to list directory '" + directory.string() + "': " + ec.message());
    }

    for (const auto& dir_entry : it) {
        DirectoryEntry entry;
        entry.name = dir_entry.path().filename().string();

        std::error_code status_ec;
        // status() follows symlinks, so a link to a directory completes like one.
        auto status = dir_entry.status(status_ec);
        if (status_ec) {
            entry.kind = EntryKind::Other;
        } else if (fs::is_directory(status)) {
            entry.kind = EntryKind::Directory;
        } else if (fs::is_regular_file(status)) {
            entry.kind = is_executable_file(dir_entry.path()) ? EntryKind::Executable
                                                              : EntryKind::File;
        } else {
            entry.kind = EntryKind::Other;
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
    return Result<std::vector<DirectoryEntry>>::ok(std::move(entries));
}

bool is_executable_file(const fs::path& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return false;
    }
    if (!S_ISREG(info.st_mode)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

const fs::path& g_user_home_path() {
    static const fs::path home = resolve_home_directory();
    return home;
}

const fs::path& g_tabsh_config_path() {
    static const fs::path config_path = xdg_directory("XDG_CONFIG_HOME", ".config");
    return config_path;
}

const fs::path& g_tabsh_cache_path() {
    static const fs::path cache_path = xdg_directory("XDG_CACHE_HOME", ".cache");
    return cache_path;
}

const fs::path& g_tabsh_history_path() {
    static const fs::path history_path = g_tabsh_cache_path() / "history.txt";
    return history_path;
}

const fs::path& g_tabsh_config_file_path() {
    static const fs::path config_file = g_tabsh_config_path() / "config.json";
    return config_file;
}

bool initialize_tabsh_directories() {
    std::error_code ec;
    fs::create_directories(g_tabsh_cache_path(), ec);
    if (ec) {
        tabsh_debug_msg("failed to create cache directory %s: %s",
                        g_tabsh_cache_path().c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

std::string safe_current_directory() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return "/";
    }
    return cwd.string();
}

std::string expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() == 1) {
        return current_home_string();
    }
    if (path[1] == '/') {
        return current_home_string() + path.substr(1);
    }
    return path;
}

std::string contract_home(const std::string& path) {
    std::string home = current_home_string();
    while (home.size() > 1 && home.back() == '/') {
        home.pop_back();
    }
    if (home.empty() || home == "/") {
        return path;
    }
    if (path == home) {
        return "~";
    }
    if (path.size() > home.size() && path.compare(0, home.size(), home) == 0 &&
        path[home.size()] == '/') {
        return "~" + path.substr(home.size());
    }
    return path;
}

std::vector<std::string> search_path_directories() {
    std::vector<std::string> directories;
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return directories;
    }

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty())
            continue;
        directories.push_back(dir);
    }
    return directories;
}

}  // namespace tabsh_filesystem
