/*
  flags.cpp

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

#include "flags.h"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>

#include "error_out.h"
#include "tabsh.h"
#include "usage.h"

namespace flags {

namespace {

constexpr int kOptListCommands = 256;
constexpr int kOptNoDynamic = 257;
constexpr int kOptJson = 258;
constexpr int kUsageExitCode = 2;

bool parse_count(const char* text, long& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0' || value < 0) {
        return false;
    }
    out = value;
    return true;
}

ParseResult usage_error(ParseResult result, const std::string& option, const std::string& message,
                        const std::vector<std::string>& suggestions = {}) {
    print_error({ErrorType::INVALID_ARGUMENT, option, message, suggestions});
    result.exit_code = kUsageExitCode;
    result.should_exit = true;
    return result;
}

}  // namespace

ParseResult parse_arguments(int argc, char* argv[]) {
    ParseResult result;

    static struct option long_options[] = {
        {"cursor", required_argument, nullptr, 'c'},
        {"dir", required_argument, nullptr, 'd'},
        {"max", required_argument, nullptr, 'n'},
        {"fuzzy", no_argument, nullptr, 'f'},
        {"case-sensitive", no_argument, nullptr, 'C'},
        {"history", required_argument, nullptr, 'H'},
        {"schema-dir", required_argument, nullptr, 's'},
        {"path-prefix", no_argument, nullptr, 'p'},
        {"list-commands", no_argument, nullptr, kOptListCommands},
        {"no-dynamic", no_argument, nullptr, kOptNoDynamic},
        {"json", no_argument, nullptr, kOptJson},
        {"version", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    const char* short_options = "+c:d:n:fCH:s:pvh";

    int option_index = 0;
    int c;
    long number = 0;
    optind = 1;
    opterr = 0;

    while ((c = getopt_long(argc, argv, short_options, long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                if (!parse_count(optarg, number)) {
                    return usage_error(result, "--cursor", "cursor must be a byte offset",
                                       {"Pass a non-negative integer"});
                }
                result.cursor = static_cast<size_t>(number);
                break;
            case 'd':
                result.directory = optarg;
                break;
            case 'n':
                if (!parse_count(optarg, number) || number == 0) {
                    return usage_error(result, "--max", "maximum must be a positive integer");
                }
                config::max_results = number;
                break;
            case 'f':
                config::fuzzy_matching = true;
                break;
            case 'C':
                config::case_sensitive = true;
                break;
            case 'H':
                result.history_file = optarg;
                break;
            case 's':
                result.schema_directories.emplace_back(optarg);
                break;
            case 'p':
                result.path_prefix = true;
                break;
            case kOptListCommands:
                result.list_commands = true;
                break;
            case kOptNoDynamic:
                config::dynamic_handlers_enabled = false;
                break;
            case kOptJson:
                result.json_output = true;
                break;
            case 'v':
                result.show_version = true;
                return result;
            case 'h':
                result.show_help = true;
                return result;
            case '?':
            default: {
                std::string offending = optind > 0 && optind <= argc && argv[optind - 1] != nullptr
                                            ? argv[optind - 1]
                                            : "?";
                print_usage();
                return usage_error(result, offending, "Unrecognized option or missing value",
                                   {"Run 'tabsh-complete --help' for usage"});
            }
        }
    }

    if (optind < argc) {
        result.line = argv[optind++];
    } else if (!result.list_commands) {
        return usage_error(result, "tabsh-complete", "missing command line to complete",
                           {"Usage: tabsh-complete [options] <line> [cursor]"});
    }

    if (optind < argc) {
        if (!parse_count(argv[optind], number)) {
            return usage_error(result, argv[optind], "cursor must be a byte offset");
        }
        result.cursor = static_cast<size_t>(number);
        ++optind;
    }

    if (optind < argc) {
        return usage_error(result, argv[optind], "unexpected extra argument");
    }

    if (result.cursor && *result.cursor > result.line.size()) {
        return usage_error(result, "--cursor",
                           "cursor " + std::to_string(*result.cursor) + " is past the end of the line");
    }

    return result;
}

}  // namespace flags
