/*
  process_runner.cpp

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

#include "process_runner.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include "debug.h"

namespace process_runner {

using tabsh_filesystem::Result;

namespace {
constexpr int kPollSliceMs = 20;

int extract_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

void kill_and_reap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

[[noreturn]] void exec_child(int stdout_fd, const std::string& working_directory,
                             char* const argv[]) {
    int null_fd = ::open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        ::dup2(null_fd, STDERR_FILENO);
    }
    ::dup2(stdout_fd, STDOUT_FILENO);

    if (!working_directory.empty() && ::chdir(working_directory.c_str()) != 0) {
        _exit(126);
    }

    ::execvp(argv[0], argv);
    _exit(127);
}
}  // namespace

std::string describe_command(const std::vector<std::string>& argv) {
    std::string result;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            result += " ";
        }
        result += argv[i];
    }
    return result;
}

Result<std::string> run(const std::vector<std::string>& argv, const RunOptions& options) {
    if (argv.empty()) {
        return Result<std::string>::error("empty command");
    }

    const std::string label = describe_command(argv);
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int pipe_fds[2] = {-1, -1};
    auto pipe_result = tabsh_filesystem::create_pipe_cloexec(pipe_fds);
    if (pipe_result.is_error()) {
        return Result<std::string>::error(pipe_result.error());
    }

    pid_t pid = fork();
    if (pid == -1) {
        int saved_errno = errno;
        tabsh_filesystem::close_pipe(pipe_fds);
        return Result<std::string>::error("Failed to fork for '" + label +
                                          "': " + std::system_category().message(saved_errno));
    }

    if (pid == 0) {
        exec_child(pipe_fds[1], options.working_directory, c_argv.data());
    }

    tabsh_filesystem::safe_close(pipe_fds[1]);
    const int read_fd = pipe_fds[0];

    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    std::string output;
    char buffer[4096];
    bool eof = false;

    while (!eof) {
        if (options.cancelled != nullptr && options.cancelled->load()) {
            tabsh_filesystem::safe_close(read_fd);
            kill_and_reap(pid);
            return Result<std::string>::error("'" + label + "' cancelled");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            tabsh_filesystem::safe_close(read_fd);
            kill_and_reap(pid);
            return Result<std::string>::error("'" + label + "' timed out after " +
                                              std::to_string(options.timeout.count()) + " ms");
        }

        struct pollfd pfd {};
        pfd.fd = read_fd;
        pfd.events = POLLIN;
        int slice = static_cast<int>(std::min<long long>(remaining.count(), kPollSliceMs));
        int ready = ::poll(&pfd, 1, slice);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            int saved_errno = errno;
            tabsh_filesystem::safe_close(read_fd);
            kill_and_reap(pid);
            return Result<std::string>::error("poll failed for '" + label +
                                              "': " + std::system_category().message(saved_errno));
        }
        if (ready == 0) {
            continue;
        }

        ssize_t count = ::read(read_fd, buffer, sizeof(buffer));
        if (count > 0) {
            output.append(buffer, static_cast<size_t>(count));
            if (output.size() > options.max_output) {
                tabsh_filesystem::safe_close(read_fd);
                kill_and_reap(pid);
                return Result<std::string>::error("'" + label + "' produced too much output");
            }
        } else if (count == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            int saved_errno = errno;
            tabsh_filesystem::safe_close(read_fd);
            kill_and_reap(pid);
            return Result<std::string>::error("read failed for '" + label +
                                              "': " + std::system_category().message(saved_errno));
        }
    }
    tabsh_filesystem::safe_close(read_fd);

    // stdout is closed; give the child what is left of the budget to exit
    int status = 0;
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited == -1 && errno != EINTR) {
            return Result<std::string>::error("waitpid failed for '" + label + "'");
        }
        if (std::chrono::steady_clock::now() >= deadline ||
            (options.cancelled != nullptr && options.cancelled->load())) {
            kill_and_reap(pid);
            return Result<std::string>::error("'" + label + "' did not exit in time");
        }
        ::usleep(2000);
    }

    int exit_code = extract_exit_code(status);
    if (exit_code != 0) {
        tabsh_debug_msg("'%s' exited with status %d", label.c_str(), exit_code);
        return Result<std::string>::error("'" + label + "' failed with exit code " +
                                          std::to_string(exit_code));
    }

    return Result<std::string>::ok(output);
}

}  // namespace process_runner
