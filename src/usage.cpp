/*
  usage.cpp

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

#include "usage.h"

#include <iostream>

#include "tabsh.h"

void print_version() {
    std::cout << "tabsh-complete " << tabsh::kVersion << "\n";
}

void print_usage() {
    std::cout << "Usage: tabsh-complete [options] <line> [cursor]\n"
              << "\n"
              << "Prints the completion candidates for <line> with the cursor at byte\n"
              << "offset [cursor] (default: end of line), one per line as TEXT<TAB>DESCRIPTION.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                 Display this help message and exit\n"
              << "  -v, --version              Print version information and exit\n"
              << "  -c, --cursor=N             Cursor byte offset inside <line>\n"
              << "  -d, --dir=DIR              Resolve relative paths against DIR\n"
              << "  -n, --max=N                Return at most N candidates (default "
              << config::kDefaultMaxResults << ")\n"
              << "  -H, --history=FILE         Read history suggestions from FILE\n"
              << "  -s, --schema-dir=DIR       Also load completion schemas from DIR\n"
              << "                             (may be given more than once)\n"
              << "\n"
              << "Matching Options:\n"
              << "  -f, --fuzzy                Accept subsequence matches and rank them\n"
              << "  -C, --case-sensitive       Match prefixes case-sensitively\n"
              << "      --no-dynamic           Do not run external commands for candidates\n"
              << "\n"
              << "Output Options:\n"
              << "      --json                 Print candidates as a JSON array\n"
              << "      --list-commands        Print every command with a schema and exit\n"
              << "  -p, --path-prefix          Print the first path that extends <line>\n"
              << "\n"
              << "Examples:\n"
              << "  tabsh-complete 'git c'                 Subcommands of git starting with c\n"
              << "  tabsh-complete 'git commit --am' 10    Complete the word ending at byte 10\n"
              << "  tabsh-complete -d /tmp -p 'fo'         First entry of /tmp starting with fo\n"
              << "\n"
              << "Configuration is read from $XDG_CONFIG_HOME/tabsh/config.json when present;\n"
              << "command line flags take precedence.\n";
}
