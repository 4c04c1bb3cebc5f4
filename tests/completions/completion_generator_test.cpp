#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "completion_generator.h"
#include "completion_parser.h"
#include "completion_schema_loader.h"
#include "test_support.h"

using completion_candidate::CandidateCategory;
using completion_schema::ArgumentKind;
using completion_schema::ArgumentType;
using tabsh_filesystem::EntryKind;

namespace {

completion_schema::SharedDatabase bundled_database() {
    static const completion_schema::SharedDatabase database =
        completion_schema::SchemaLoader(std::vector<std::filesystem::path>{}, true).load();
    return database;
}

class StaticGeneratorTest : public test_support::ConfigResetTest {
   protected:
    StaticGeneratorTest()
        : listing_(dirs_.reader()),
          executables_(listing_),
          parser_(bundled_database()),
          generator_(bundled_database(), listing_, executables_) {
        dirs_.add("/work", "archive.tar.gz", EntryKind::File);
        dirs_.add("/work", "build", EntryKind::Directory);
        dirs_.add("/work", "notes.txt", EntryKind::File);
        dirs_.add("/work", "script.sh", EntryKind::Executable);
        dirs_.add("/work/build", "out.o", EntryKind::File);
        dirs_.add("/fake/bin", "gitk", EntryKind::Executable);
        dirs_.add("/fake/bin", "grep", EntryKind::Executable);
        dirs_.add("/fake/bin", "zzz", EntryKind::Executable);
    }

    std::vector<completion_candidate::Candidate> generate(const std::string& input) {
        return generator_.generate(parser_.parse(input, input.size()), "/work");
    }

    test_support::EnvGuard path_guard_{"PATH", "/fake/bin"};
    test_support::FakeDirectories dirs_;
    completion_paths::DirectoryListingCache listing_;
    completion_metadata::ExecutableSearch executables_;
    completion_parser::CommandLineParser parser_;
    completion_generator::StaticGenerator generator_;
};

}  // namespace

TEST_F(StaticGeneratorTest, CommandPositionMergesSchemaCommonAndPath) {
    auto candidates = generate("gi");
    EXPECT_EQ(test_support::texts(candidates), (std::vector<std::string>{"git", "git", "gitk"}));
    EXPECT_EQ(candidates[0].category, CandidateCategory::Command);
    EXPECT_TRUE(candidates[0].description.has_value());
    EXPECT_EQ(candidates[2].category, CandidateCategory::Executable);
    EXPECT_EQ(*candidates[2].description, "/fake/bin");
}

TEST_F(StaticGeneratorTest, CommandWithSlashCompletesExecutablePaths) {
    EXPECT_EQ(test_support::texts(generate("./s")), std::vector<std::string>{"./script.sh"});
}

TEST_F(StaticGeneratorTest, SubcommandsOfKnownCommand) {
    auto candidates = generate("git c");
    EXPECT_EQ(test_support::texts(candidates),
              (std::vector<std::string>{"commit", "checkout", "clone"}));
    for (const auto& candidate : candidates) {
        EXPECT_EQ(candidate.category, CandidateCategory::SubCommand);
        EXPECT_TRUE(candidate.description.has_value());
    }
}

TEST_F(StaticGeneratorTest, UnmatchedSubcommandFallsBackToFiles) {
    EXPECT_EQ(test_support::texts(generate("git n")), std::vector<std::string>{"notes.txt"});
}

TEST_F(StaticGeneratorTest, OptionsOfSubcommandAndCommand) {
    auto all = generate("git commit -");
    EXPECT_TRUE(test_support::has_text(all, "-m"));
    EXPECT_TRUE(test_support::has_text(all, "--message"));
    EXPECT_TRUE(test_support::has_text(all, "--no-pager"));
    EXPECT_EQ(test_support::find_text(all, "-m")->category, CandidateCategory::ShortOption);
    EXPECT_EQ(test_support::find_text(all, "--message")->category, CandidateCategory::LongOption);

    EXPECT_EQ(test_support::texts(generate("git commit --m")),
              std::vector<std::string>{"--message"});
}

TEST_F(StaticGeneratorTest, GivenOptionIsSpentUnderBothSpellings) {
    auto candidates = generate("git commit -m msg --");
    EXPECT_FALSE(test_support::has_text(candidates, "--message"));
    EXPECT_TRUE(test_support::has_text(candidates, "--all"));
}

TEST_F(StaticGeneratorTest, ChoiceValues) {
    EXPECT_EQ(test_support::texts(generate("cargo --color a")),
              (std::vector<std::string>{"auto", "always"}));
    EXPECT_EQ(test_support::texts(generate("cargo --color \"n")),
              std::vector<std::string>{"never"});
}

TEST_F(StaticGeneratorTest, FileValueHonorsExtensions) {
    EXPECT_EQ(test_support::texts(generate("tar -f ")),
              (std::vector<std::string>{"archive.tar.gz", "build/"}));
}

TEST_F(StaticGeneratorTest, DirectoryArgument) {
    EXPECT_EQ(test_support::texts(generate("cd ")), std::vector<std::string>{"build/"});
    EXPECT_EQ(test_support::texts(generate("cd build/")), std::vector<std::string>{});
}

TEST_F(StaticGeneratorTest, FileArgumentListsEverything) {
    EXPECT_EQ(test_support::texts(generate("git add ")),
              (std::vector<std::string>{"archive.tar.gz", "build/", "notes.txt", "script.sh"}));
    EXPECT_EQ(test_support::texts(generate("git add build/")),
              std::vector<std::string>{"build/out.o"});
}

TEST_F(StaticGeneratorTest, CommandArgumentSearchesPath) {
    EXPECT_EQ(test_support::texts(generate("sudo ")),
              (std::vector<std::string>{"gitk", "grep", "zzz"}));
}

TEST_F(StaticGeneratorTest, EnvironmentNames) {
    test_support::EnvGuard variable("TABSH_GENERATOR_TEST_VAR", "1");
    EXPECT_TRUE(test_support::has_text(generate("docker run -e "), "TABSH_GENERATOR_TEST_VAR"));
    EXPECT_EQ(test_support::texts(generate("docker run -e $TABSH_GENERATOR_TEST")),
              std::vector<std::string>{"$TABSH_GENERATOR_TEST_VAR"});
}

TEST_F(StaticGeneratorTest, MetadataKindsAreLeftToTheEngine) {
    EXPECT_TRUE(generator_.argument_candidates(ArgumentType::of(ArgumentKind::Signal), "", "/work",
                                               true)
                    .empty());
    EXPECT_TRUE(generator_.argument_candidates(ArgumentType::of(ArgumentKind::Url), "", "/work",
                                               true)
                    .empty());
    EXPECT_TRUE(generator_.argument_candidates(std::nullopt, "", "/work", false).empty());
    EXPECT_EQ(generator_.argument_candidates(std::nullopt, "n", "/work", true).size(), 1u);
}

TEST_F(StaticGeneratorTest, UnknownCommandHasNoOptions) {
    EXPECT_TRUE(generate("frobnicate --").empty());
}
