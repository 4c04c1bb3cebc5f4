/*
  bundled_completions.cpp

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

#include "bundled_completions.h"

namespace bundled_completions {

namespace {
const char* const kGit = R"json({
  "command": "git",
  "description": "Distributed version control system",
  "global_options": [
    {"short": "-C", "description": "Run as if started in <path>", "takes_value": true,
     "value_type": {"type": "Directory"}},
    {"short": "-c", "description": "Set a configuration parameter", "takes_value": true},
    {"long": "--no-pager", "description": "Do not pipe output into a pager"},
    {"long": "--version", "description": "Print the git suite version"},
    {"long": "--help", "description": "Print the synopsis and common commands"}
  ],
  "subcommands": [
    {"name": "add", "description": "Add file contents to the index",
     "options": [
       {"short": "-A", "long": "--all", "description": "Add changes from all tracked and untracked files"},
       {"short": "-p", "long": "--patch", "description": "Interactively choose hunks"},
       {"short": "-n", "long": "--dry-run", "description": "Don't actually add the files"},
       {"short": "-u", "long": "--update", "description": "Update tracked files"}
     ],
     "arguments": [{"name": "pathspec", "arg_type": {"type": "File"}, "multiple": true}]},
    {"name": "commit", "description": "Record changes to the repository",
     "options": [
       {"short": "-m", "long": "--message", "description": "Use the given message", "takes_value": true},
       {"short": "-a", "long": "--all", "description": "Stage modified and deleted files"},
       {"long": "--amend", "description": "Replace the tip of the current branch"},
       {"short": "-F", "long": "--file", "description": "Take the message from a file",
        "value_type": {"type": "File"}},
       {"long": "--fixup", "description": "Create a fixup commit", "takes_value": true},
       {"long": "--no-verify", "description": "Bypass pre-commit and commit-msg hooks"}
     ]},
    {"name": "checkout", "description": "Switch branches or restore working tree files",
     "options": [
       {"short": "-b", "description": "Create and checkout a new branch", "takes_value": true},
       {"long": "--track", "description": "Set upstream when creating a branch"}
     ]},
    {"name": "switch", "description": "Switch branches",
     "options": [
       {"short": "-c", "long": "--create", "description": "Create a new branch", "takes_value": true},
       {"long": "--detach", "description": "Switch to a commit for inspection"}
     ]},
    {"name": "merge", "description": "Join two or more development histories together",
     "options": [
       {"long": "--no-ff", "description": "Always create a merge commit"},
       {"long": "--squash", "description": "Squash the merged changes"},
       {"long": "--abort", "description": "Abort the current conflict resolution"}
     ]},
    {"name": "rebase", "description": "Reapply commits on top of another base tip",
     "options": [
       {"short": "-i", "long": "--interactive", "description": "Make a list of commits to edit"},
       {"long": "--continue", "description": "Restart the rebasing process"},
       {"long": "--abort", "description": "Abort the rebase operation"}
     ]},
    {"name": "push", "description": "Update remote refs along with associated objects",
     "options": [
       {"short": "-f", "long": "--force", "description": "Force updates"},
       {"short": "-u", "long": "--set-upstream", "description": "Add upstream tracking reference"},
       {"long": "--tags", "description": "Push all tags"}
     ]},
    {"name": "pull", "description": "Fetch from and integrate with another repository",
     "options": [
       {"long": "--rebase", "description": "Rebase instead of merging"},
       {"long": "--ff-only", "description": "Refuse to merge unless fast-forward"}
     ]},
    {"name": "fetch", "description": "Download objects and refs from another repository",
     "options": [
       {"long": "--all", "description": "Fetch all remotes"},
       {"short": "-p", "long": "--prune", "description": "Remove deleted remote-tracking refs"}
     ]},
    {"name": "status", "description": "Show the working tree status",
     "options": [
       {"short": "-s", "long": "--short", "description": "Give the output in the short format"},
       {"short": "-b", "long": "--branch", "description": "Show branch information"}
     ]},
    {"name": "log", "description": "Show commit logs",
     "options": [
       {"long": "--oneline", "description": "One commit per line"},
       {"long": "--graph", "description": "Draw a text-based graph"},
       {"short": "-n", "long": "--max-count", "description": "Limit the number of commits", "takes_value": true,
        "value_type": {"type": "Number"}}
     ]},
    {"name": "diff", "description": "Show changes between commits",
     "options": [
       {"long": "--staged", "description": "Compare the index with HEAD"},
       {"long": "--stat", "description": "Generate a diffstat"}
     ],
     "arguments": [{"name": "path", "arg_type": {"type": "File"}, "multiple": true}]},
    {"name": "branch", "description": "List, create, or delete branches",
     "options": [
       {"short": "-d", "long": "--delete", "description": "Delete a branch"},
       {"short": "-a", "long": "--all", "description": "List local and remote branches"}
     ]},
    {"name": "remote", "description": "Manage set of tracked repositories",
     "subcommands": [
       {"name": "add", "description": "Add a remote",
        "arguments": [{"name": "name", "arg_type": {"type": "String"}},
                      {"name": "url", "arg_type": {"type": "Url"}}]},
       {"name": "remove", "aliases": ["rm"], "description": "Remove a remote"},
       {"name": "rename", "description": "Rename a remote"},
       {"name": "show", "description": "Show information about a remote"}
     ]},
    {"name": "stash", "description": "Stash the changes in a dirty working directory",
     "subcommands": [
       {"name": "push", "description": "Save local modifications"},
       {"name": "pop", "description": "Apply and remove a stash"},
       {"name": "list", "description": "List stash entries"},
       {"name": "drop", "description": "Remove a stash entry"}
     ]},
    {"name": "clone", "description": "Clone a repository into a new directory",
     "options": [
       {"long": "--depth", "description": "Create a shallow clone", "takes_value": true,
        "value_type": {"type": "Number"}},
       {"short": "-b", "long": "--branch", "description": "Checkout <name> instead of HEAD", "takes_value": true}
     ],
     "arguments": [{"name": "repository", "arg_type": {"type": "Url"}},
                   {"name": "directory", "arg_type": {"type": "Directory"}}]},
    {"name": "restore", "description": "Restore working tree files",
     "options": [{"long": "--staged", "description": "Restore the index"}],
     "arguments": [{"name": "pathspec", "arg_type": {"type": "File"}, "multiple": true}]}
  ]
})json";

const char* const kCargo = R"json({
  "command": "cargo",
  "description": "Rust package manager",
  "global_options": [
    {"short": "-V", "long": "--version", "description": "Print version info"},
    {"short": "-v", "long": "--verbose", "description": "Use verbose output"},
    {"short": "-q", "long": "--quiet", "description": "Do not print cargo log messages"},
    {"long": "--color", "description": "Coloring", "takes_value": true,
     "value_type": {"type": "Choice", "data": ["auto", "always", "never"]}}
  ],
  "subcommands": [
    {"name": "build", "aliases": ["b"], "description": "Compile the current package",
     "options": [
       {"short": "-r", "long": "--release", "description": "Build artifacts in release mode"},
       {"long": "--target", "description": "Build for the target triple", "takes_value": true},
       {"short": "-F", "long": "--features", "description": "Features to activate", "takes_value": true}
     ]},
    {"name": "run", "aliases": ["r"], "description": "Run a binary or example",
     "options": [
       {"short": "-r", "long": "--release", "description": "Build in release mode"},
       {"long": "--bin", "description": "Name of the bin target to run", "takes_value": true},
       {"long": "--example", "description": "Name of the example to run", "takes_value": true}
     ]},
    {"name": "test", "aliases": ["t"], "description": "Run the tests",
     "options": [{"long": "--no-run", "description": "Compile, but don't run tests"}]},
    {"name": "check", "aliases": ["c"], "description": "Analyze the package for errors"},
    {"name": "new", "description": "Create a new cargo package",
     "options": [
       {"long": "--bin", "description": "Use a binary template"},
       {"long": "--lib", "description": "Use a library template"},
       {"long": "--name", "description": "Set the package name", "takes_value": true}
     ],
     "arguments": [{"name": "path", "arg_type": {"type": "Directory"}}]},
    {"name": "add", "description": "Add dependencies to a manifest",
     "options": [
       {"long": "--git", "description": "Git repository location", "takes_value": true,
        "value_type": {"type": "Url"}},
       {"long": "--path", "description": "Filesystem path to local crate", "takes_value": true,
        "value_type": {"type": "Directory"}},
       {"long": "--dev", "description": "Add as development dependency"}
     ]},
    {"name": "fmt", "description": "Format all bin and lib files"},
    {"name": "clippy", "description": "Check for common mistakes"},
    {"name": "doc", "aliases": ["d"], "description": "Build documentation",
     "options": [{"long": "--open", "description": "Open the docs in a browser"}]},
    {"name": "clean", "description": "Remove the target directory"},
    {"name": "update", "description": "Update dependencies in Cargo.lock"}
  ]
})json";

const char* const kDocker = R"json({
  "command": "docker",
  "description": "Container runtime",
  "global_options": [
    {"long": "--context", "description": "Name of the context to use", "takes_value": true},
    {"short": "-H", "long": "--host", "description": "Daemon socket to connect to", "takes_value": true}
  ],
  "subcommands": [
    {"name": "run", "description": "Create and run a new container",
     "options": [
       {"short": "-d", "long": "--detach", "description": "Run container in background"},
       {"short": "-i", "long": "--interactive", "description": "Keep STDIN open"},
       {"short": "-t", "long": "--tty", "description": "Allocate a pseudo-TTY"},
       {"long": "--rm", "description": "Remove the container when it exits"},
       {"short": "-e", "long": "--env", "description": "Set environment variables", "takes_value": true,
        "value_type": {"type": "Environment"}},
       {"short": "-v", "long": "--volume", "description": "Bind mount a volume", "takes_value": true},
       {"long": "--network", "description": "Connect to a network", "takes_value": true,
        "value_type": {"type": "Choice", "data": ["bridge", "host", "none"]}}
     ]},
    {"name": "build", "description": "Build an image from a Dockerfile",
     "options": [
       {"short": "-t", "long": "--tag", "description": "Name and optionally a tag", "takes_value": true},
       {"short": "-f", "long": "--file", "description": "Name of the Dockerfile", "takes_value": true,
        "value_type": {"type": "File"}}
     ],
     "arguments": [{"name": "context", "arg_type": {"type": "Directory"}}]},
    {"name": "ps", "description": "List containers",
     "options": [{"short": "-a", "long": "--all", "description": "Show all containers"}]},
    {"name": "images", "description": "List images"},
    {"name": "exec", "description": "Execute a command in a running container"},
    {"name": "logs", "description": "Fetch the logs of a container",
     "options": [{"short": "-f", "long": "--follow", "description": "Follow log output"}]},
    {"name": "stop", "description": "Stop running containers"},
    {"name": "pull", "description": "Download an image from a registry"},
    {"name": "compose", "description": "Define and run multi-container applications",
     "subcommands": [
       {"name": "up", "description": "Create and start containers",
        "options": [{"short": "-d", "long": "--detach", "description": "Detached mode"}]},
       {"name": "down", "description": "Stop and remove containers"},
       {"name": "logs", "description": "View output from containers"}
     ]}
  ]
})json";

const char* const kKill = R"json({
  "command": "kill",
  "description": "Send a signal to a process",
  "global_options": [
    {"short": "-s", "description": "Signal to send", "value_type": {"type": "Signal"}},
    {"short": "-l", "description": "List signal names"}
  ],
  "arguments": [{"name": "pid", "arg_type": {"type": "String"}, "multiple": true}]
})json";

const char* const kSudo = R"json({
  "command": "sudo",
  "description": "Execute a command as another user",
  "global_options": [
    {"short": "-u", "long": "--user", "description": "Run as the specified user",
     "value_type": {"type": "User"}},
    {"short": "-g", "long": "--group", "description": "Run with the specified group",
     "value_type": {"type": "Group"}},
    {"short": "-E", "long": "--preserve-env", "description": "Preserve user environment"},
    {"short": "-i", "long": "--login", "description": "Run login shell as the target user"},
    {"short": "-k", "long": "--reset-timestamp", "description": "Invalidate cached credentials"}
  ],
  "arguments": [{"name": "command", "arg_type": {"type": "CommandWithArgs"}}]
})json";

const char* const kEnv = R"json({
  "command": "env",
  "description": "Run a program in a modified environment",
  "global_options": [
    {"short": "-i", "long": "--ignore-environment", "description": "Start with an empty environment"},
    {"short": "-u", "long": "--unset", "description": "Remove variable from the environment",
     "value_type": {"type": "Environment"}}
  ],
  "arguments": [{"name": "command", "arg_type": {"type": "CommandWithArgs"}}]
})json";

const char* const kSsh = R"json({
  "command": "ssh",
  "description": "OpenSSH remote login client",
  "global_options": [
    {"short": "-i", "description": "Identity file", "value_type": {"type": "File"}},
    {"short": "-p", "description": "Port to connect to", "value_type": {"type": "Number"}},
    {"short": "-l", "description": "Login name", "value_type": {"type": "User"}},
    {"short": "-v", "description": "Verbose mode"},
    {"short": "-A", "description": "Enable agent forwarding"}
  ],
  "arguments": [{"name": "destination", "arg_type": {"type": "String"}}]
})json";

const char* const kTar = R"json({
  "command": "tar",
  "description": "Archiving utility",
  "global_options": [
    {"short": "-c", "long": "--create", "description": "Create a new archive"},
    {"short": "-x", "long": "--extract", "description": "Extract files from an archive"},
    {"short": "-t", "long": "--list", "description": "List the contents of an archive"},
    {"short": "-v", "long": "--verbose", "description": "Verbosely list files processed"},
    {"short": "-z", "long": "--gzip", "description": "Filter the archive through gzip"},
    {"short": "-f", "long": "--file", "description": "Use archive file",
     "value_type": {"type": "File", "data": {"extensions": [".tar", ".tar.gz", ".tgz", ".tar.xz", ".tar.bz2"]}}},
    {"short": "-C", "long": "--directory", "description": "Change to directory",
     "value_type": {"type": "Directory"}}
  ],
  "arguments": [{"name": "file", "arg_type": {"type": "File"}, "multiple": true}]
})json";

const char* const kIp = R"json({
  "command": "ip",
  "description": "Show and manipulate routing and network devices",
  "global_options": [
    {"short": "-4", "description": "Use IPv4 only"},
    {"short": "-6", "description": "Use IPv6 only"},
    {"short": "-c", "long": "--color", "description": "Color the output"}
  ],
  "subcommands": [
    {"name": "link", "description": "Network device",
     "subcommands": [
       {"name": "show", "description": "Display device attributes",
        "arguments": [{"name": "device", "arg_type": {"type": "Interface"}}]},
       {"name": "set", "description": "Change device attributes",
        "arguments": [{"name": "device", "arg_type": {"type": "Interface"}},
                      {"name": "state", "arg_type": {"type": "Choice", "data": ["up", "down"]}}]}
     ]},
    {"name": "addr", "aliases": ["address"], "description": "Protocol address on a device",
     "subcommands": [
       {"name": "show", "description": "Look at protocol addresses",
        "arguments": [{"name": "device", "arg_type": {"type": "Interface"}}]}
     ]},
    {"name": "route", "description": "Routing table entry"}
  ]
})json";

const char* const kChgrp = R"json({
  "command": "chgrp",
  "description": "Change group ownership",
  "global_options": [
    {"short": "-R", "long": "--recursive", "description": "Operate on files recursively"},
    {"short": "-v", "long": "--verbose", "description": "Output a diagnostic for every file"}
  ],
  "arguments": [
    {"name": "group", "arg_type": {"type": "Group"}, "required": true},
    {"name": "file", "arg_type": {"type": "File"}, "multiple": true}
  ]
})json";

const char* const kChown = R"json({
  "command": "chown",
  "description": "Change file owner and group",
  "global_options": [
    {"short": "-R", "long": "--recursive", "description": "Operate on files recursively"},
    {"long": "--reference", "description": "Use the owner of a reference file",
     "value_type": {"type": "File"}}
  ],
  "arguments": [
    {"name": "owner", "arg_type": {"type": "User"}, "required": true},
    {"name": "file", "arg_type": {"type": "File"}, "multiple": true}
  ]
})json";

const char* const kCd = R"json({
  "command": "cd",
  "description": "Change the working directory",
  "arguments": [{"name": "directory", "arg_type": "Directory"}]
})json";
}  // namespace

const std::vector<Definition>& definitions() {
    static const std::vector<Definition> kDefinitions = {
        {"git", kGit},   {"cargo", kCargo}, {"docker", kDocker}, {"kill", kKill},
        {"sudo", kSudo}, {"env", kEnv},     {"ssh", kSsh},       {"tar", kTar},
        {"ip", kIp},     {"chgrp", kChgrp}, {"chown", kChown},   {"cd", kCd},
    };
    return kDefinitions;
}

}  // namespace bundled_completions
