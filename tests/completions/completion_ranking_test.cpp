#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "completion_candidate.h"
#include "completion_ranking.h"
#include "test_support.h"

using completion_candidate::Candidate;
using completion_candidate::CandidateCategory;
using completion_ranking::MatchTier;

class CompletionRankingTest : public test_support::ConfigResetTest {};

TEST_F(CompletionRankingTest, FuzzyScoreRewardsStructure) {
    EXPECT_EQ(completion_ranking::fuzzy_score("", "git"), 0);
    EXPECT_EQ(completion_ranking::fuzzy_score("xyz", "abc"), 0);
    EXPECT_GT(completion_ranking::fuzzy_score("cko", "checkout"), 0);

    // boundary hit and leading match beat a scattered match in the middle
    EXPECT_GT(completion_ranking::fuzzy_score("gc", "git-commit"),
              completion_ranking::fuzzy_score("gc", "magic"));
    // consecutive beats spread out
    EXPECT_GT(completion_ranking::fuzzy_score("com", "commit"),
              completion_ranking::fuzzy_score("com", "c-o-m"));
}

TEST_F(CompletionRankingTest, ClassifyMatch) {
    EXPECT_EQ(completion_ranking::classify_match("git", "git"), MatchTier::Exact);
    EXPECT_EQ(completion_ranking::classify_match("src", "src/"), MatchTier::Exact);
    EXPECT_EQ(completion_ranking::classify_match("gi", "git"), MatchTier::Prefix);
    EXPECT_EQ(completion_ranking::classify_match("my", "\"my file\""), MatchTier::Prefix);
    EXPECT_EQ(completion_ranking::classify_match("gt", "git"), MatchTier::Fuzzy);
    EXPECT_EQ(completion_ranking::classify_match("zz", "git"), MatchTier::None);
}

TEST_F(CompletionRankingTest, ExecutableReplacesFileOfSameName) {
    std::vector<Candidate> candidates = {
        Candidate::make("tool", CandidateCategory::File),
        Candidate::make("notes", CandidateCategory::File),
        Candidate::make("tool", CandidateCategory::Executable, std::string("/usr/bin")),
    };
    completion_ranking::deduplicate(candidates);

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].text, "tool");
    EXPECT_EQ(candidates[0].category, CandidateCategory::Executable);
    EXPECT_EQ(candidates[1].text, "notes");
}

TEST_F(CompletionRankingTest, FirstSeenWinsOtherwise) {
    std::vector<Candidate> candidates = {
        Candidate::make("build/", CandidateCategory::Directory),
        Candidate::make("build", CandidateCategory::SubCommand),
        Candidate::make("./bin/build", CandidateCategory::File),
    };
    completion_ranking::deduplicate(candidates);

    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].category, CandidateCategory::Directory);
}

TEST_F(CompletionRankingTest, NonPathCandidatesKeepDistinctTexts) {
    std::vector<Candidate> candidates = {
        Candidate::make("a/x", CandidateCategory::Argument),
        Candidate::make("b/x", CandidateCategory::Argument),
        Candidate::make("main", CandidateCategory::Argument, std::string("local branch")),
        Candidate::make("origin/main", CandidateCategory::Argument, std::string("remote branch")),
        Candidate::make("cd /usr/local", CandidateCategory::History),
        Candidate::make("ls /opt/local", CandidateCategory::History),
        Candidate::make("a/x", CandidateCategory::Argument),
    };
    completion_ranking::deduplicate(candidates);

    EXPECT_EQ(test_support::texts(candidates),
              (std::vector<std::string>{"a/x", "b/x", "main", "origin/main", "cd /usr/local",
                                        "ls /opt/local"}));
}

TEST_F(CompletionRankingTest, PathInArgumentDoesNotHideCommand) {
    std::vector<Candidate> candidates = {
        Candidate::make("git", CandidateCategory::Command),
        Candidate::make("vim /etc/git", CandidateCategory::History),
    };
    completion_ranking::deduplicate(candidates);
    EXPECT_EQ(candidates.size(), 2u);
}

TEST_F(CompletionRankingTest, SortByPriorityIsStable) {
    std::vector<Candidate> candidates = {
        Candidate::make("b.txt", CandidateCategory::File),
        Candidate::make("--all", CandidateCategory::LongOption),
        Candidate::make("a.txt", CandidateCategory::File),
        Candidate::make("add", CandidateCategory::SubCommand),
    };
    completion_ranking::sort_by_priority(candidates);
    EXPECT_EQ(test_support::texts(candidates),
              (std::vector<std::string>{"add", "--all", "b.txt", "a.txt"}));
}

TEST_F(CompletionRankingTest, SmartRankOrdersByTierThenPriority) {
    std::vector<Candidate> candidates = {
        Candidate::make("xco", CandidateCategory::File),
        Candidate::make("config", CandidateCategory::Argument),
        Candidate::make("zz", CandidateCategory::Generic),
        Candidate::make("commit", CandidateCategory::SubCommand),
        Candidate::make("co", CandidateCategory::Argument),
    };
    completion_ranking::smart_rank(candidates, "co");
    EXPECT_EQ(test_support::texts(candidates),
              (std::vector<std::string>{"co", "commit", "config", "xco", "zz"}));
}

TEST_F(CompletionRankingTest, Truncate) {
    std::vector<Candidate> candidates(5, Candidate::make("x", CandidateCategory::Generic));
    completion_ranking::truncate(candidates, 10);
    EXPECT_EQ(candidates.size(), 5u);
    completion_ranking::truncate(candidates, 2);
    EXPECT_EQ(candidates.size(), 2u);
}
