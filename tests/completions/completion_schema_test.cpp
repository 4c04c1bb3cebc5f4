#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "bundled_completions.h"
#include "completion_schema.h"
#include "completion_schema_loader.h"
#include "test_support.h"

using completion_schema::ArgumentKind;
using completion_schema::CommandCompletion;
using completion_schema::CommandCompletionDatabase;
using completion_schema::CommandOption;
using completion_schema::SchemaLoader;

namespace {

CommandOption option(std::optional<std::string> short_form, std::optional<std::string> long_form) {
    CommandOption result;
    result.short_form = std::move(short_form);
    result.long_form = std::move(long_form);
    return result;
}

const char* const kFooSchema = R"json({
  "command": "foo",
  "description": "Test tool",
  "global_options": [{"short": "-v", "long": "--verbose"}],
  "subcommands": [
    {"name": "serve", "aliases": ["s"],
     "options": [{"long": "--port", "value_type": "Number"}],
     "subcommands": [{"name": "web"}]}
  ],
  "arguments": [{"name": "target", "arg_type": {"type": "Choice", "data": ["a", "b"]}}]
})json";

}  // namespace

TEST(ValidateOption, FormShapes) {
    EXPECT_TRUE(completion_schema::validate_option(option("-v", std::nullopt)).is_ok());
    EXPECT_TRUE(completion_schema::validate_option(option("-1", std::nullopt)).is_ok());
    EXPECT_TRUE(completion_schema::validate_option(option(std::nullopt, "--all")).is_ok());

    EXPECT_TRUE(completion_schema::validate_option(option("--x", std::nullopt)).is_error());
    EXPECT_TRUE(completion_schema::validate_option(option("v", std::nullopt)).is_error());
    EXPECT_TRUE(completion_schema::validate_option(option(std::nullopt, "--")).is_error());
    EXPECT_TRUE(completion_schema::validate_option(option(std::nullopt, "-all")).is_error());
    EXPECT_TRUE(completion_schema::validate_option(option(std::nullopt, "--a b")).is_error());
    EXPECT_TRUE(completion_schema::validate_option(option(std::nullopt, std::nullopt)).is_error());
}

TEST(ParseCompletionDocument, ReadsNestedDefinition) {
    auto parsed = completion_schema::parse_completion_document(kFooSchema, "foo.json");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();

    const CommandCompletion& foo = parsed.value();
    EXPECT_EQ(foo.command, "foo");
    ASSERT_EQ(foo.subcommands.size(), 1u);
    EXPECT_EQ(foo.subcommands[0].aliases, std::vector<std::string>{"s"});
    ASSERT_EQ(foo.subcommands[0].options.size(), 1u);

    const CommandOption& port = foo.subcommands[0].options[0];
    EXPECT_TRUE(port.takes_value);
    ASSERT_TRUE(port.value_type.has_value());
    EXPECT_EQ(port.value_type->kind, ArgumentKind::Number);

    ASSERT_EQ(foo.arguments.size(), 1u);
    ASSERT_TRUE(foo.arguments[0].arg_type.has_value());
    EXPECT_EQ(foo.arguments[0].arg_type->choices, (std::vector<std::string>{"a", "b"}));
}

TEST(ParseCompletionDocument, ErrorsNameTheSource) {
    auto malformed = completion_schema::parse_completion_document("{ not json", "broken.json");
    ASSERT_TRUE(malformed.is_error());
    EXPECT_NE(malformed.error().find("broken.json"), std::string::npos);

    auto unknown_type = completion_schema::parse_completion_document(
        R"({"command": "x", "arguments": [{"name": "a", "arg_type": "Colour"}]})", "x.json");
    ASSERT_TRUE(unknown_type.is_error());
    EXPECT_NE(unknown_type.error().find("Colour"), std::string::npos);

    auto bad_name = completion_schema::parse_completion_document(
        R"({"command": "x", "subcommands": [{"name": "two words"}]})", "x.json");
    EXPECT_TRUE(bad_name.is_error());

    auto bad_option = completion_schema::parse_completion_document(
        R"({"command": "x", "global_options": [{"short": "--long"}]})", "x.json");
    EXPECT_TRUE(bad_option.is_error());

    auto missing_command = completion_schema::parse_completion_document(R"({"subcommands": []})",
                                                                        "x.json");
    EXPECT_TRUE(missing_command.is_error());
}

TEST(CommandCompletionDatabase, FirstRegistrationWins) {
    CommandCompletionDatabase database;
    CommandCompletion first;
    first.command = "tool";
    first.description = "first";
    CommandCompletion second = first;
    second.description = "second";

    EXPECT_TRUE(database.add_command(first));
    EXPECT_FALSE(database.add_command(second));
    ASSERT_NE(database.get_command("tool"), nullptr);
    EXPECT_EQ(*database.get_command("tool")->description, "first");
    EXPECT_EQ(database.get_command("other"), nullptr);
    EXPECT_EQ(database.size(), 1u);
}

TEST(CommandCompletionDatabase, ResolvesPathThroughAliases) {
    auto parsed = completion_schema::parse_completion_document(kFooSchema, "foo.json");
    ASSERT_TRUE(parsed.is_ok());
    const CommandCompletion& foo = parsed.value();

    const auto* web = completion_schema::resolve_subcommand_path(foo, {"s", "web"});
    ASSERT_NE(web, nullptr);
    EXPECT_EQ(web->name, "web");

    const auto* partial = completion_schema::resolve_subcommand_path(foo, {"serve", "nope", "web"});
    ASSERT_NE(partial, nullptr);
    EXPECT_EQ(partial->name, "serve");

    EXPECT_EQ(completion_schema::resolve_subcommand_path(foo, {"nope"}), nullptr);
    EXPECT_EQ(completion_schema::resolve_subcommand_path(foo, {}), nullptr);
}

TEST(BundledCompletions, EveryDefinitionIsValid) {
    for (const auto& definition : bundled_completions::definitions()) {
        auto parsed = completion_schema::parse_completion_document(definition.document,
                                                                   definition.name);
        EXPECT_TRUE(parsed.is_ok()) << definition.name << ": "
                                    << (parsed.is_error() ? parsed.error() : "");
        if (parsed.is_ok()) {
            EXPECT_EQ(parsed.value().command, definition.name);
        }
    }
}

TEST(SchemaLoader, LoadsDirectoryAndReportsBadFiles) {
    test_support::ScratchDir dir;
    dir.write("foo.json", kFooSchema);
    dir.write("broken.json", "{");
    dir.write("notes.txt", "not a schema");

    SchemaLoader loader({dir.path()}, false);
    auto database = loader.load();

    EXPECT_TRUE(database->has_command("foo"));
    EXPECT_EQ(database->size(), 1u);
    EXPECT_EQ(loader.report().loaded, 1u);
    EXPECT_EQ(loader.report().rejected, 1u);
    ASSERT_EQ(loader.report().errors.size(), 1u);
    EXPECT_NE(loader.report().errors[0].find("broken.json"), std::string::npos);
}

TEST(SchemaLoader, EarlierSourcesShadowLaterOnes) {
    test_support::ScratchDir first;
    test_support::ScratchDir second;
    first.write("foo.json", kFooSchema);
    second.write("foo.json", R"({"command": "foo", "description": "shadowed"})");
    second.write("git.json", R"({"command": "git", "description": "user git"})");

    SchemaLoader loader({first.path()}, true);
    loader.add_directory(second.path());
    auto database = loader.load();

    EXPECT_EQ(*database->get_command("foo")->description, "Test tool");
    EXPECT_NE(*database->get_command("git")->description, "user git");
    EXPECT_EQ(loader.report().shadowed, 2u);
    EXPECT_EQ(loader.report().loaded, bundled_completions::definitions().size() + 1);
}

TEST(SchemaLoader, MissingDirectoryIsSkipped) {
    SchemaLoader loader({"/nonexistent/tabsh/completions"}, false);
    auto database = loader.load();
    EXPECT_EQ(database->size(), 0u);
    EXPECT_TRUE(loader.report().errors.empty());
}

TEST(SchemaLoader, CommandNamesAreSorted) {
    SchemaLoader loader(std::vector<std::filesystem::path>{}, true);
    auto names = loader.load()->command_names();
    ASSERT_FALSE(names.empty());
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_NE(std::find(names.begin(), names.end(), "git"), names.end());
}
