/*
  completion_metadata.h

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
#include <string>
#include <vector>

#include "completion_cache.h"
#include "completion_candidate.h"
#include "completion_paths.h"

namespace completion_metadata {

using completion_candidate::Candidate;

struct SignalInfo {
    int number;
    const char* name;
    const char* description;
};

const std::vector<SignalInfo>& signal_table();

// Matches "TERM", "SIGTERM", "sigterm" or a numeric prefix such as "1".
std::vector<Candidate> signal_candidates(const std::string& token);

struct UserEntry {
    std::string name;
    uid_t uid = 0;
    std::string full_name;
};

struct GroupEntry {
    std::string name;
    gid_t gid = 0;
};

enum class InterfaceType : std::uint8_t {
    Ethernet,
    Wireless,
    Loopback,
    Other
};

struct InterfaceEntry {
    std::string name;
    InterfaceType type = InterfaceType::Other;
    std::string state;
};

struct ProcessEntry {
    pid_t pid = 0;
    std::string command;
};

std::vector<UserEntry> parse_passwd(const std::string& content);
std::vector<GroupEntry> parse_group(const std::string& content);
const char* interface_type_name(InterfaceType type);
// Lower sorts first: physical, wireless, other, virtual, loopback.
int interface_sort_rank(const InterfaceEntry& entry);

// Account, interface and process tables read from a configurable root so tests can point
// them at a scratch tree. Each table sits behind its own TTL cache.
class SystemTables {
   public:
    explicit SystemTables(std::filesystem::path root = "/",
                          completion_cache::ClockFunction clock = nullptr);

    std::vector<Candidate> user_candidates(const std::string& token, bool include_system);
    std::vector<Candidate> group_candidates(const std::string& token);
    std::vector<Candidate> interface_candidates(const std::string& token);
    std::vector<Candidate> process_candidates(const std::string& token);

   private:
    tabsh_filesystem::Result<std::vector<UserEntry>> users();
    tabsh_filesystem::Result<std::vector<GroupEntry>> groups();
    tabsh_filesystem::Result<std::vector<InterfaceEntry>> interfaces();
    tabsh_filesystem::Result<std::vector<ProcessEntry>> processes();

    std::filesystem::path root_;
    completion_cache::TtlCache<std::vector<UserEntry>> user_cache_;
    completion_cache::TtlCache<std::vector<GroupEntry>> group_cache_;
    completion_cache::TtlCache<std::vector<InterfaceEntry>> interface_cache_;
    completion_cache::TtlCache<std::vector<ProcessEntry>> process_cache_;
};

// Executables on the search path. Each directory listing comes from the shared listing
// cache; a name found in an earlier directory hides later ones.
class ExecutableSearch {
   public:
    explicit ExecutableSearch(completion_paths::DirectoryListingCache& listing);

    std::vector<Candidate> search(const std::string& prefix,
                                  const std::vector<std::string>& directories);
    std::vector<Candidate> search(const std::string& prefix);

   private:
    completion_paths::DirectoryListingCache& listing_;
};

}  // namespace completion_metadata
