#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "completion_engine.h"
#include "completion_schema_loader.h"
#include "process_runner.h"
#include "tabsh.h"
#include "test_support.h"

using completion_candidate::CandidateCategory;
using completion_engine::CompletionEngine;
using completion_engine::EngineServices;
using tabsh_filesystem::EntryKind;
using tabsh_filesystem::Result;

namespace {

constexpr std::int64_t kNow = 1700000000;

const char* const kPsOutput =
    "  PID %CPU %MEM COMMAND\n"
    "  420  1.5  0.3 /usr/bin/python3 server.py\n"
    " 4201  0.0  0.0 sleep 100\n";

std::vector<std::string> sorted(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    return values;
}

class CompletionEngineTest : public test_support::ConfigResetTest {
   protected:
    CompletionEngineTest() {
        dirs_.add("/work", "archive.tar.gz", EntryKind::File);
        dirs_.add("/work", "build", EntryKind::Directory);
        dirs_.add("/work", "notes.txt", EntryKind::File);
        dirs_.add("/work", "script.sh", EntryKind::Executable);
        dirs_.add("/fake/bin", "git", EntryKind::Executable);
        dirs_.add("/fake/bin", "gitk", EntryKind::Executable);

        root_.write("etc/passwd",
                    "root:x:0:0:root:/root:/bin/bash\n"
                    "alice:x:1000:1000:Alice Liddell:/home/alice:/bin/sh\n");
        root_.write("etc/group", "wheel:x:10:alice\n");

        EngineServices services;
        services.command_runner = [this](const std::vector<std::string>& argv,
                                         const process_runner::RunOptions&) {
            const std::string command = process_runner::describe_command(argv);
            calls_.push_back(command);
            if (on_call_) {
                on_call_();
            }
            auto it = outputs_.find(command);
            if (it == outputs_.end()) {
                return Result<std::string>::error("'" + command + "' failed with exit code 127");
            }
            return Result<std::string>::ok(it->second);
        };
        services.directory_reader = dirs_.reader();
        services.clock = clock_.function();
        services.system_root = root_.path();
        services.epoch_now = [] { return kNow; };

        engine_ = std::make_unique<CompletionEngine>(
            completion_schema::SchemaLoader(std::vector<std::filesystem::path>{}, true).load(),
            std::move(services));
    }

    completion_engine::CompletionResult request(
        const std::string& input, size_t max_results = 30,
        const completion_history::HistoryStore* history = nullptr) {
        return engine_->complete_request(input, input.size(), "/work", max_results, history);
    }

    std::vector<std::string> complete(const std::string& input) {
        return test_support::texts(request(input).candidates);
    }

    test_support::EnvGuard path_guard_{"PATH", "/fake/bin"};
    test_support::FakeDirectories dirs_;
    test_support::FakeClock clock_;
    test_support::ScratchDir root_;
    std::map<std::string, std::string> outputs_;
    std::vector<std::string> calls_;
    std::function<void()> on_call_;
    std::unique_ptr<CompletionEngine> engine_;
};

}  // namespace

TEST_F(CompletionEngineTest, SubcommandsReplaceTypedWord) {
    auto result = request("git c");
    EXPECT_EQ(test_support::texts(result.candidates),
              (std::vector<std::string>{"commit", "checkout", "clone"}));
    EXPECT_EQ(result.replace_start, 4u);
    EXPECT_EQ(result.replace_end, 5u);
}

TEST_F(CompletionEngineTest, OptionsOfSubcommand) {
    auto candidates = complete("git commit -");
    EXPECT_NE(std::find(candidates.begin(), candidates.end(), "-m"), candidates.end());
    EXPECT_NE(std::find(candidates.begin(), candidates.end(), "--message"), candidates.end());
}

TEST_F(CompletionEngineTest, WrappedCommandIsCompletedInPlace) {
    auto result = request("sudo git c");
    EXPECT_EQ(test_support::texts(result.candidates),
              (std::vector<std::string>{"commit", "checkout", "clone"}));
    EXPECT_EQ(result.replace_start, 9u);
    EXPECT_EQ(result.replace_end, 10u);
}

TEST_F(CompletionEngineTest, SameNameFromSeveralSourcesAppearsOnce) {
    auto candidates = complete("gi");
    EXPECT_EQ(std::count(candidates.begin(), candidates.end(), "git"), 1);
    EXPECT_EQ(std::count(candidates.begin(), candidates.end(), "gitk"), 1);
}

TEST_F(CompletionEngineTest, ArgumentWithoutSuggestionsFallsBackToFiles) {
    EXPECT_EQ(sorted(complete("kill ")),
              (std::vector<std::string>{"archive.tar.gz", "build/", "notes.txt", "script.sh"}));
}

TEST_F(CompletionEngineTest, DynamicHandlerOutputIsUsed) {
    outputs_["ps -xo pid,%cpu,%mem,command"] = kPsOutput;
    auto result = request("kill 42");
    EXPECT_EQ(test_support::texts(result.candidates),
              (std::vector<std::string>{"420", "4201"}));
    EXPECT_EQ(result.candidates[0].category, CandidateCategory::Process);
}

TEST_F(CompletionEngineTest, BranchesSharingLastSegmentAllSurvive) {
    outputs_["git branch --format=%(refname:short) --list *"] =
        "bugfix/login\nfeature/login\nmain\nmain2\n";
    outputs_["git branch -r --format=%(refname:short) --list *"] = "origin/HEAD\norigin/main\n";

    auto candidates = request("git checkout ", 100).candidates;
    for (const char* branch : {"bugfix/login", "feature/login", "main", "main2", "origin/main"}) {
        EXPECT_TRUE(test_support::has_text(candidates, branch)) << branch;
    }
}

TEST_F(CompletionEngineTest, DynamicHandlersCanBeDisabled) {
    config::dynamic_handlers_enabled = false;
    outputs_["ps -xo pid,%cpu,%mem,command"] = kPsOutput;
    complete("kill 42");
    EXPECT_TRUE(calls_.empty());
}

TEST_F(CompletionEngineTest, SignalOptionValue) {
    EXPECT_EQ(complete("kill -s TE"), std::vector<std::string>{"TERM"});
    EXPECT_TRUE(calls_.empty());
}

TEST_F(CompletionEngineTest, UserAndGroupValuesComeFromSystemTables) {
    auto users = request("sudo -u a").candidates;
    ASSERT_EQ(test_support::texts(users), std::vector<std::string>{"alice"});
    EXPECT_EQ(*users[0].description, "Alice Liddell");

    EXPECT_EQ(complete("sudo -g wh"), std::vector<std::string>{"wheel"});
}

TEST_F(CompletionEngineTest, HistoryJoinsStaticCandidates) {
    completion_history::MemoryHistoryStore history;
    history.add("git cherry-pick abc123", kNow);
    history.add("git commit -m wip", kNow);

    auto candidates = request("git c", 30, &history).candidates;
    EXPECT_EQ(test_support::texts(candidates),
              (std::vector<std::string>{"commit", "checkout", "clone", "cherry-pick"}));
    EXPECT_EQ(candidates[0].category, CandidateCategory::SubCommand);
    EXPECT_EQ(candidates[3].category, CandidateCategory::History);

    config::history_suggestions = false;
    EXPECT_EQ(test_support::texts(request("git c", 30, &history).candidates),
              (std::vector<std::string>{"commit", "checkout", "clone"}));
}

TEST_F(CompletionEngineTest, ResultsAreTruncated) {
    EXPECT_EQ(request("kill ", 2).candidates.size(), 2u);
    EXPECT_TRUE(request("kill ", 0).candidates.empty());
}

// A request started while another is still running wins; the older one comes back empty.
TEST_F(CompletionEngineTest, SupersededRequestReturnsNothing) {
    outputs_["ps -xo pid,%cpu,%mem,command"] = kPsOutput;
    std::vector<std::string> newer;
    bool started = false;
    on_call_ = [&]() {
        if (!started) {
            started = true;
            newer = complete("cd ");
        }
    };

    EXPECT_TRUE(request("kill 42").candidates.empty());
    EXPECT_EQ(newer, std::vector<std::string>{"build/"});
}
