/*
  completion_metadata.cpp

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

#include "completion_metadata.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <unordered_set>
#include <utility>

#include "completion_utils.h"
#include "debug.h"
#include "string_utils.h"
#include "tabsh_filesystem.h"

namespace completion_metadata {

namespace fs = std::filesystem;
using completion_candidate::CandidateCategory;
using tabsh_filesystem::Result;

namespace {

bool is_all_digits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

bool parse_unsigned(const std::string& text, unsigned long& out) {
    if (!is_all_digits(text)) {
        return false;
    }
    char* end = nullptr;
    out = std::strtoul(text.c_str(), &end, 10);
    return end != nullptr && *end == '\0';
}

std::string read_trimmed(const fs::path& path) {
    auto content = tabsh_filesystem::read_file_content(path.string());
    if (content.is_error()) {
        return "";
    }
    return string_utils::trim_ascii_whitespace_copy(content.value());
}

bool has_any_prefix(const std::string& name, std::initializer_list<const char*> prefixes) {
    for (const char* prefix : prefixes) {
        if (string_utils::starts_with(name, prefix)) {
            return true;
        }
    }
    return false;
}

}  // namespace

const std::vector<SignalInfo>& signal_table() {
    static const std::vector<SignalInfo> table = {
        {1, "SIGHUP", "Hangup"},
        {2, "SIGINT", "Interrupt"},
        {3, "SIGQUIT", "Quit"},
        {4, "SIGILL", "Illegal instruction"},
        {5, "SIGTRAP", "Trace/breakpoint trap"},
        {6, "SIGABRT", "Aborted"},
        {7, "SIGBUS", "Bus error"},
        {8, "SIGFPE", "Floating point exception"},
        {9, "SIGKILL", "Killed"},
        {10, "SIGUSR1", "User defined signal 1"},
        {11, "SIGSEGV", "Segmentation fault"},
        {12, "SIGUSR2", "User defined signal 2"},
        {13, "SIGPIPE", "Broken pipe"},
        {14, "SIGALRM", "Alarm clock"},
        {15, "SIGTERM", "Terminated"},
        {16, "SIGSTKFLT", "Stack fault"},
        {17, "SIGCHLD", "Child exited"},
        {18, "SIGCONT", "Continued"},
        {19, "SIGSTOP", "Stopped (signal)"},
        {20, "SIGTSTP", "Stopped"},
        {21, "SIGTTIN", "Stopped (tty input)"},
        {22, "SIGTTOU", "Stopped (tty output)"},
        {23, "SIGURG", "Urgent I/O condition"},
        {24, "SIGXCPU", "CPU time limit exceeded"},
        {25, "SIGXFSZ", "File size limit exceeded"},
        {26, "SIGVTALRM", "Virtual timer expired"},
        {27, "SIGPROF", "Profiling timer expired"},
        {28, "SIGWINCH", "Window changed"},
        {29, "SIGIO", "I/O possible"},
        {30, "SIGPWR", "Power failure"},
        {31, "SIGSYS", "Bad system call"},
    };
    return table;
}

std::vector<Candidate> signal_candidates(const std::string& token) {
    std::vector<Candidate> candidates;
    const std::string upper = string_utils::to_upper_copy(token);
    const bool numeric = is_all_digits(token);
    const bool full_form = string_utils::starts_with(upper, "SIG");

    for (const auto& signal : signal_table()) {
        const std::string number = std::to_string(signal.number);
        const std::string description =
            std::string(signal.description) + " (" + number + ")";
        const std::string name = signal.name;

        if (numeric) {
            if (string_utils::starts_with(number, token)) {
                candidates.push_back(
                    Candidate::make(number, CandidateCategory::Argument, description));
            }
            continue;
        }

        if (full_form) {
            if (string_utils::starts_with(name, upper)) {
                candidates.push_back(Candidate::make(name, CandidateCategory::Argument, description));
            }
        } else {
            const std::string short_name = name.substr(3);
            if (string_utils::starts_with(short_name, upper)) {
                candidates.push_back(
                    Candidate::make(short_name, CandidateCategory::Argument, description));
            }
        }
    }
    return candidates;
}

std::vector<UserEntry> parse_passwd(const std::string& content) {
    std::vector<UserEntry> users;
    for (const auto& line : string_utils::split_lines(content)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto fields = string_utils::split_fields(line, ':');
        unsigned long uid = 0;
        if (fields.size() < 3 || fields[0].empty() || !parse_unsigned(fields[2], uid)) {
            continue;
        }
        UserEntry entry;
        entry.name = fields[0];
        entry.uid = static_cast<uid_t>(uid);
        if (fields.size() > 4) {
            entry.full_name = fields[4].substr(0, fields[4].find(','));
        }
        users.push_back(std::move(entry));
    }
    return users;
}

std::vector<GroupEntry> parse_group(const std::string& content) {
    std::vector<GroupEntry> groups;
    for (const auto& line : string_utils::split_lines(content)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto fields = string_utils::split_fields(line, ':');
        unsigned long gid = 0;
        if (fields.size() < 3 || fields[0].empty() || !parse_unsigned(fields[2], gid)) {
            continue;
        }
        groups.push_back(GroupEntry{fields[0], static_cast<gid_t>(gid)});
    }
    return groups;
}

const char* interface_type_name(InterfaceType type) {
    switch (type) {
        case InterfaceType::Ethernet:
            return "ethernet";
        case InterfaceType::Wireless:
            return "wireless";
        case InterfaceType::Loopback:
            return "loopback";
        case InterfaceType::Other:
        default:
            return "other";
    }
}

int interface_sort_rank(const InterfaceEntry& entry) {
    if (entry.type == InterfaceType::Loopback || entry.name == "lo") {
        return 4;
    }
    if (has_any_prefix(entry.name, {"docker", "br-", "veth", "virbr", "tun", "tap"})) {
        return 3;
    }
    if (entry.type == InterfaceType::Wireless || string_utils::starts_with(entry.name, "wl")) {
        return 1;
    }
    if (has_any_prefix(entry.name, {"eth", "en"})) {
        return 0;
    }
    return 2;
}

SystemTables::SystemTables(fs::path root, completion_cache::ClockFunction clock)
    : root_(std::move(root)),
      user_cache_(completion_cache::kAccountListTtl, clock),
      group_cache_(completion_cache::kAccountListTtl, clock),
      interface_cache_(completion_cache::kInterfaceTtl, clock),
      process_cache_(completion_cache::kProcessListTtl, clock) {
}

Result<std::vector<UserEntry>> SystemTables::users() {
    return user_cache_.get_or_load("passwd", [this]() {
        auto content = tabsh_filesystem::read_file_content((root_ / "etc/passwd").string());
        if (content.is_error()) {
            return Result<std::vector<UserEntry>>::error(content.error());
        }
        return Result<std::vector<UserEntry>>::ok(parse_passwd(content.value()));
    });
}

Result<std::vector<GroupEntry>> SystemTables::groups() {
    return group_cache_.get_or_load("group", [this]() {
        auto content = tabsh_filesystem::read_file_content((root_ / "etc/group").string());
        if (content.is_error()) {
            return Result<std::vector<GroupEntry>>::error(content.error());
        }
        return Result<std::vector<GroupEntry>>::ok(parse_group(content.value()));
    });
}

Result<std::vector<InterfaceEntry>> SystemTables::interfaces() {
    return interface_cache_.get_or_load("net", [this]() {
        const fs::path net_dir = root_ / "sys/class/net";
        auto listing = tabsh_filesystem::list_directory(net_dir);
        if (listing.is_error()) {
            return Result<std::vector<InterfaceEntry>>::error(listing.error());
        }

        std::vector<InterfaceEntry> entries;
        for (const auto& dir_entry : listing.value()) {
            if (dir_entry.kind != tabsh_filesystem::EntryKind::Directory) {
                continue;
            }
            const fs::path interface_dir = net_dir / dir_entry.name;
            InterfaceEntry entry;
            entry.name = dir_entry.name;
            entry.state = read_trimmed(interface_dir / "operstate");
            if (entry.state.empty()) {
                entry.state = "unknown";
            }

            const std::string type = read_trimmed(interface_dir / "type");
            std::error_code ec;
            if (type == "1") {
                entry.type = fs::is_directory(interface_dir / "wireless", ec)
                                 ? InterfaceType::Wireless
                                 : InterfaceType::Ethernet;
            } else if (type == "772") {
                entry.type = InterfaceType::Loopback;
            } else {
                entry.type = InterfaceType::Other;
            }
            entries.push_back(std::move(entry));
        }

        std::stable_sort(entries.begin(), entries.end(),
                         [](const InterfaceEntry& a, const InterfaceEntry& b) {
                             int rank_a = interface_sort_rank(a);
                             int rank_b = interface_sort_rank(b);
                             if (rank_a != rank_b) {
                                 return rank_a < rank_b;
                             }
                             return a.name < b.name;
                         });
        return Result<std::vector<InterfaceEntry>>::ok(std::move(entries));
    });
}

Result<std::vector<ProcessEntry>> SystemTables::processes() {
    return process_cache_.get_or_load("proc", [this]() {
        const fs::path proc_dir = root_ / "proc";
        auto listing = tabsh_filesystem::list_directory(proc_dir);
        if (listing.is_error()) {
            return Result<std::vector<ProcessEntry>>::error(listing.error());
        }

        std::vector<ProcessEntry> entries;
        for (const auto& dir_entry : listing.value()) {
            unsigned long pid = 0;
            if (dir_entry.kind != tabsh_filesystem::EntryKind::Directory ||
                !parse_unsigned(dir_entry.name, pid)) {
                continue;
            }
            // processes can exit between the listing and this read
            std::string command = read_trimmed(proc_dir / dir_entry.name / "comm");
            if (command.empty()) {
                continue;
            }
            entries.push_back(ProcessEntry{static_cast<pid_t>(pid), std::move(command)});
        }
        std::sort(entries.begin(), entries.end(),
                  [](const ProcessEntry& a, const ProcessEntry& b) { return a.pid < b.pid; });
        return Result<std::vector<ProcessEntry>>::ok(std::move(entries));
    });
}

std::vector<Candidate> SystemTables::user_candidates(const std::string& token,
                                                     bool include_system) {
    std::vector<Candidate> candidates;
    auto table = users();
    if (table.is_error()) {
        tabsh_debug_msg("user listing unavailable: %s", table.error().c_str());
        return candidates;
    }

    for (const auto& user : table.value()) {
        if (!include_system && user.uid < 1000 && user.name != "root") {
            continue;
        }
        if (!completion_utils::starts_with_case_insensitive(user.name, token)) {
            continue;
        }
        std::optional<std::string> description;
        if (!user.full_name.empty()) {
            description = user.full_name;
        }
        candidates.push_back(Candidate::make(user.name, CandidateCategory::Argument, description));
    }
    return candidates;
}

std::vector<Candidate> SystemTables::group_candidates(const std::string& token) {
    std::vector<Candidate> candidates;
    auto table = groups();
    if (table.is_error()) {
        tabsh_debug_msg("group listing unavailable: %s", table.error().c_str());
        return candidates;
    }

    for (const auto& group : table.value()) {
        if (completion_utils::starts_with_case_insensitive(group.name, token)) {
            candidates.push_back(Candidate::make(group.name, CandidateCategory::Argument,
                                                 "GID: " + std::to_string(group.gid)));
        }
    }
    return candidates;
}

std::vector<Candidate> SystemTables::interface_candidates(const std::string& token) {
    std::vector<Candidate> candidates;
    auto table = interfaces();
    if (table.is_error()) {
        tabsh_debug_msg("interface listing unavailable: %s", table.error().c_str());
        return candidates;
    }

    for (const auto& entry : table.value()) {
        if (completion_utils::matches_completion_query(entry.name, token)) {
            candidates.push_back(Candidate::make(
                entry.name, CandidateCategory::Argument,
                std::string(interface_type_name(entry.type)) + " (" + entry.state + ")"));
        }
    }
    return candidates;
}

std::vector<Candidate> SystemTables::process_candidates(const std::string& token) {
    std::vector<Candidate> candidates;
    auto table = processes();
    if (table.is_error()) {
        tabsh_debug_msg("process listing unavailable: %s", table.error().c_str());
        return candidates;
    }

    const bool numeric = is_all_digits(token);
    for (const auto& entry : table.value()) {
        const std::string pid = std::to_string(entry.pid);
        bool matches = numeric ? string_utils::starts_with(pid, token)
                               : completion_utils::matches_completion_query(entry.command, token);
        if (matches) {
            candidates.push_back(Candidate::make(pid, CandidateCategory::Process, entry.command));
        }
    }
    return candidates;
}

ExecutableSearch::ExecutableSearch(completion_paths::DirectoryListingCache& listing)
    : listing_(listing) {
}

std::vector<Candidate> ExecutableSearch::search(const std::string& prefix,
                                                const std::vector<std::string>& directories) {
    std::vector<Candidate> candidates;
    std::unordered_set<std::string> seen;

    for (const auto& directory : directories) {
        auto entries = listing_.list(directory);
        if (entries.is_error()) {
            tabsh_debug_msg("skipping PATH entry: %s", entries.error().c_str());
            continue;
        }
        for (const auto& entry : entries.value()) {
            if (entry.kind != tabsh_filesystem::EntryKind::Executable) {
                continue;
            }
            if (!completion_utils::matches_completion_query(entry.name, prefix)) {
                continue;
            }
            if (!seen.insert(entry.name).second) {
                continue;
            }
            candidates.push_back(Candidate::make(entry.name, CandidateCategory::Executable,
                                                 tabsh_filesystem::contract_home(directory)));
        }
    }
    return candidates;
}

std::vector<Candidate> ExecutableSearch::search(const std::string& prefix) {
    return search(prefix, tabsh_filesystem::search_path_directories());
}

}  // namespace completion_metadata
