#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "flags.h"
#include "tabsh.h"
#include "test_support.h"

namespace {

flags::ParseResult parse(std::vector<std::string> args) {
    args.insert(args.begin(), "tabsh-complete");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    return flags::parse_arguments(static_cast<int>(args.size()), argv.data());
}

class FlagsTest : public test_support::ConfigResetTest {};

}  // namespace

TEST_F(FlagsTest, LineOnly) {
    auto result = parse({"git c"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.line, "git c");
    EXPECT_FALSE(result.cursor.has_value());
}

TEST_F(FlagsTest, OptionsBeforeLine) {
    auto result = parse({"-c", "3", "-d", "/srv", "-n", "5", "-H", "/tmp/hist", "git c"});
    ASSERT_FALSE(result.should_exit);
    EXPECT_EQ(result.cursor, std::optional<size_t>(3));
    EXPECT_EQ(result.directory, "/srv");
    EXPECT_EQ(result.history_file, "/tmp/hist");
    EXPECT_EQ(config::max_results, 5);
}

TEST_F(FlagsTest, PositionalCursor) {
    auto result = parse({"git c", "2"});
    ASSERT_FALSE(result.should_exit);
    EXPECT_EQ(result.cursor, std::optional<size_t>(2));
}

TEST_F(FlagsTest, TuningFlagsSetConfig) {
    auto result = parse({"-f", "-C", "--no-dynamic", "-p", "--json", "ls"});
    ASSERT_FALSE(result.should_exit);
    EXPECT_TRUE(config::fuzzy_matching);
    EXPECT_TRUE(config::case_sensitive);
    EXPECT_FALSE(config::dynamic_handlers_enabled);
    EXPECT_TRUE(result.path_prefix);
    EXPECT_TRUE(result.json_output);
}

TEST_F(FlagsTest, SchemaDirectoriesAccumulate) {
    auto result = parse({"-s", "/a", "--schema-dir", "/b", "ls"});
    ASSERT_FALSE(result.should_exit);
    EXPECT_EQ(result.schema_directories, (std::vector<std::string>{"/a", "/b"}));
}

TEST_F(FlagsTest, ListCommandsNeedsNoLine) {
    auto result = parse({"--list-commands"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_TRUE(result.list_commands);
}

TEST_F(FlagsTest, VersionAndHelp) {
    EXPECT_TRUE(parse({"--version"}).show_version);
    EXPECT_TRUE(parse({"-h"}).show_help);
}

TEST_F(FlagsTest, UsageErrorsExitWithTwo) {
    const std::vector<std::vector<std::string>> bad = {
        {},
        {"-n", "0", "ls"},
        {"-n", "many", "ls"},
        {"-c", "-1", "ls"},
        {"--bogus", "ls"},
        {"ls", "1", "extra"},
        {"ls", "x"},
        {"-c", "10", "git"},
    };
    for (const auto& args : bad) {
        auto result = parse(args);
        EXPECT_TRUE(result.should_exit) << testing::PrintToString(args);
        EXPECT_EQ(result.exit_code, 2) << testing::PrintToString(args);
    }
}

TEST_F(FlagsTest, CursorAtEndIsAccepted) {
    auto result = parse({"-c", "3", "git"});
    EXPECT_FALSE(result.should_exit);
}
