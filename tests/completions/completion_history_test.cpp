#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "completion_history.h"
#include "completion_parser.h"
#include "test_support.h"

using completion_candidate::CandidateCategory;
using completion_history::HistoryEntry;
using completion_history::MemoryHistoryStore;

namespace {

constexpr std::int64_t kNow = 1700000000;
constexpr std::int64_t kHour = 3600;

std::vector<completion_candidate::Candidate> suggest(const completion_history::HistoryStore& store,
                                                     const std::string& input) {
    return completion_history::history_candidates(
        store, input, completion_parser::parse(input, input.size()), kNow);
}

class HistoryTest : public test_support::ConfigResetTest {};

}  // namespace

TEST(ParseHistory, TimestampsAndMultiLineEntries) {
    const std::string content =
        "ls -la\n"
        "# 1700000000\n"
        "git status\n"
        "# 1700000100\n"
        "for f in *; do\n"
        "  echo $f\n"
        "done\n"
        "# 1700000200\n"
        "git status\n";

    auto entries = completion_history::parse_history(content);
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].command, "ls -la");
    EXPECT_EQ(entries[0].last_used, 0);

    EXPECT_EQ(entries[1].command, "git status");
    EXPECT_EQ(entries[1].frequency, 2u);
    EXPECT_EQ(entries[1].last_used, 1700000200);

    EXPECT_EQ(entries[2].command, "for f in *; do\n  echo $f\ndone");
}

TEST(ParseHistory, BlankAndMalformedHeaders) {
    auto entries = completion_history::parse_history("#\nmake\n# soon\nmake test\n\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].last_used, 0);
    EXPECT_EQ(entries[1].command, "make test");
    EXPECT_EQ(entries[1].last_used, 0);
}

TEST(Frecency, RecentUseWeighsMore) {
    HistoryEntry entry{"make", 3, kNow - 10};
    EXPECT_DOUBLE_EQ(completion_history::frecency(entry, kNow), 12.0);
    entry.last_used = kNow - 2 * kHour;
    EXPECT_DOUBLE_EQ(completion_history::frecency(entry, kNow), 6.0);
    entry.last_used = kNow - 48 * kHour;
    EXPECT_DOUBLE_EQ(completion_history::frecency(entry, kNow), 3.0);
    entry.last_used = kNow - 30 * 24 * kHour;
    EXPECT_DOUBLE_EQ(completion_history::frecency(entry, kNow), 1.5);
    entry.last_used = 0;
    EXPECT_DOUBLE_EQ(completion_history::frecency(entry, kNow), 1.5);
}

TEST(MemoryHistoryStore, AggregatesRepeats) {
    MemoryHistoryStore store;
    store.add("ls", 10);
    store.add("ls", 5);
    store.add("pwd", 7);

    auto entries = store.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].frequency, 2u);
    EXPECT_EQ(entries[0].last_used, 10);
}

TEST(FileHistoryStore, LoadsFileAndToleratesMissingOne) {
    test_support::ScratchDir dir;
    auto path = dir.write("history.txt", "# 1700000000\ncargo build\n");

    completion_history::FileHistoryStore store(path);
    ASSERT_TRUE(store.load().is_ok());
    ASSERT_EQ(store.entries().size(), 1u);
    EXPECT_EQ(store.entries()[0].command, "cargo build");

    completion_history::FileHistoryStore missing(dir.path() / "nope.txt");
    EXPECT_TRUE(missing.load().is_ok());
    EXPECT_TRUE(missing.entries().empty());
}

TEST_F(HistoryTest, NextWordAfterSameLeadingWords) {
    MemoryHistoryStore store;
    store.add("git commit -m wip", kNow - 10);
    store.add("git checkout main", kNow - 30 * 24 * kHour);
    store.add("git checkout dev", kNow - 30 * 24 * kHour);
    store.add("cargo build", kNow);

    auto candidates = suggest(store, "git c");
    EXPECT_EQ(test_support::texts(candidates),
              (std::vector<std::string>{"commit", "checkout"}));
    EXPECT_EQ(candidates[0].category, CandidateCategory::History);
    EXPECT_EQ(*candidates[0].description, "history");

    EXPECT_EQ(test_support::texts(suggest(store, "git checkout ")),
              (std::vector<std::string>{"main", "dev"}));
    EXPECT_TRUE(suggest(store, "svn ").empty());
}

TEST_F(HistoryTest, FrecencyIsSummedPerWord) {
    MemoryHistoryStore store;
    store.add("make build", kNow - 10);
    store.add("make test", kNow - 40 * 24 * kHour);
    store.add("make test --verbose", kNow - 40 * 24 * kHour);
    store.add("make test --quiet", kNow - 40 * 24 * kHour);
    store.add("make test -j4", kNow - 40 * 24 * kHour);
    store.add("make test -j8", kNow - 40 * 24 * kHour);
    store.add("make test -k", kNow - 40 * 24 * kHour);
    store.add("make test -n", kNow - 40 * 24 * kHour);
    store.add("make test -s", kNow - 40 * 24 * kHour);
    store.add("make test -q", kNow - 40 * 24 * kHour);

    // nine old uses at 0.5 outweigh one fresh use at 4
    EXPECT_EQ(test_support::texts(suggest(store, "make ")),
              (std::vector<std::string>{"test", "build"}));
}

TEST_F(HistoryTest, EmptyLineOffersRecentCommands) {
    MemoryHistoryStore store;
    store.add("older", kNow - 100);
    store.add("newest", kNow);
    store.add("multi\nline", kNow - 1);

    auto candidates = suggest(store, "");
    EXPECT_EQ(test_support::texts(candidates), (std::vector<std::string>{"newest", "older"}));
    EXPECT_EQ(*candidates[0].description, "recent command");
}

TEST_F(HistoryTest, RecentCommandsAreCapped) {
    MemoryHistoryStore store;
    for (int i = 0; i < 15; ++i) {
        store.add("cmd" + std::to_string(i), kNow - i);
    }
    EXPECT_EQ(suggest(store, "  ").size(), 10u);
}
