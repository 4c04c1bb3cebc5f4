/*
  completion_schema_loader.cpp

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

#include "completion_schema_loader.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "bundled_completions.h"
#include "debug.h"
#include "string_utils.h"
#include "tabsh.h"

namespace fs = std::filesystem;

namespace completion_schema {

using tabsh_filesystem::Result;

void from_json(const nlohmann::json& j, ArgumentType& type);
void from_json(const nlohmann::json& j, CommandOption& option);
void from_json(const nlohmann::json& j, Argument& argument);
void from_json(const nlohmann::json& j, SubCommand& sub);
void from_json(const nlohmann::json& j, CommandCompletion& completion);

namespace {
std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

template <typename T>
std::vector<T> optional_list(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return {};
    }
    return j.at(key).get<std::vector<T>>();
}

bool optional_bool(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return false;
    }
    return j.at(key).get<bool>();
}

Result<void> validate_arguments(const std::vector<Argument>& arguments, const std::string& owner) {
    for (const auto& argument : arguments) {
        if (argument.name.empty()) {
            return Result<void>::error("argument of '" + owner + "' has an empty name");
        }
    }
    return Result<void>::ok();
}

Result<void> validate_options(const std::vector<CommandOption>& options, const std::string& owner) {
    for (const auto& option : options) {
        auto result = validate_option(option);
        if (result.is_error()) {
            return Result<void>::error("option of '" + owner + "': " + result.error());
        }
    }
    return Result<void>::ok();
}

Result<void> validate_subcommands(const std::vector<SubCommand>& subcommands,
                                  const std::string& owner) {
    for (const auto& sub : subcommands) {
        if (!is_valid_name(sub.name)) {
            return Result<void>::error("subcommand of '" + owner + "' has invalid name '" +
                                       sub.name + "'");
        }
        for (const auto& alias : sub.aliases) {
            if (!is_valid_name(alias)) {
                return Result<void>::error("subcommand '" + sub.name + "' has invalid alias '" +
                                           alias + "'");
            }
        }

        std::string path = owner + " " + sub.name;
        auto options = validate_options(sub.options, path);
        if (options.is_error()) {
            return options;
        }
        auto arguments = validate_arguments(sub.arguments, path);
        if (arguments.is_error()) {
            return arguments;
        }
        auto nested = validate_subcommands(sub.subcommands, path);
        if (nested.is_error()) {
            return nested;
        }
    }
    return Result<void>::ok();
}
}  // namespace

void from_json(const nlohmann::json& j, ArgumentType& type) {
    if (j.is_string()) {
        auto kind = argument_kind_from_name(j.get<std::string>());
        if (!kind) {
            throw std::invalid_argument("unknown argument type '" + j.get<std::string>() + "'");
        }
        type = ArgumentType::of(*kind);
        return;
    }

    std::string name = j.at("type").get<std::string>();
    auto kind = argument_kind_from_name(name);
    if (!kind) {
        throw std::invalid_argument("unknown argument type '" + name + "'");
    }
    type = ArgumentType::of(*kind);

    if (!j.contains("data") || j.at("data").is_null()) {
        return;
    }
    const auto& data = j.at("data");
    if (*kind == ArgumentKind::File) {
        type.extensions = optional_list<std::string>(data, "extensions");
    } else if (*kind == ArgumentKind::Choice) {
        type.choices = data.get<std::vector<std::string>>();
    }
}

void from_json(const nlohmann::json& j, CommandOption& option) {
    option.short_form = optional_string(j, "short");
    option.long_form = optional_string(j, "long");
    option.description = optional_string(j, "description");
    option.takes_value = optional_bool(j, "takes_value");
    if (j.contains("value_type") && !j.at("value_type").is_null()) {
        option.value_type = j.at("value_type").get<ArgumentType>();
        option.takes_value = true;
    }
}

void from_json(const nlohmann::json& j, Argument& argument) {
    argument.name = j.at("name").get<std::string>();
    argument.description = optional_string(j, "description");
    if (j.contains("arg_type") && !j.at("arg_type").is_null()) {
        argument.arg_type = j.at("arg_type").get<ArgumentType>();
    }
    argument.required = optional_bool(j, "required");
    argument.multiple = optional_bool(j, "multiple");
}

void from_json(const nlohmann::json& j, SubCommand& sub) {
    sub.name = j.at("name").get<std::string>();
    sub.description = optional_string(j, "description");
    sub.aliases = optional_list<std::string>(j, "aliases");
    sub.options = optional_list<CommandOption>(j, "options");
    sub.arguments = optional_list<Argument>(j, "arguments");
    sub.subcommands = optional_list<SubCommand>(j, "subcommands");
}

void from_json(const nlohmann::json& j, CommandCompletion& completion) {
    completion.command = j.at("command").get<std::string>();
    completion.description = optional_string(j, "description");
    completion.global_options = optional_list<CommandOption>(j, "global_options");
    completion.subcommands = optional_list<SubCommand>(j, "subcommands");
    completion.arguments = optional_list<Argument>(j, "arguments");
}

bool is_valid_name(const std::string& name) {
    return !name.empty() && !string_utils::contains_whitespace(name);
}

Result<void> validate_option(const CommandOption& option) {
    if (!option.short_form && !option.long_form) {
        return Result<void>::error("option has neither a short nor a long form");
    }

    if (option.short_form) {
        const std::string& form = *option.short_form;
        if (form.size() < 2 || form[0] != '-' || form[1] == '-' ||
            string_utils::contains_whitespace(form)) {
            return Result<void>::error("malformed short form '" + form + "'");
        }
    }

    if (option.long_form) {
        const std::string& form = *option.long_form;
        if (form.size() <= 2 || !string_utils::starts_with(form, "--") ||
            string_utils::contains_whitespace(form)) {
            return Result<void>::error("malformed long form '" + form + "'");
        }
    }

    return Result<void>::ok();
}

Result<void> validate_completion(const CommandCompletion& completion) {
    if (!is_valid_name(completion.command)) {
        return Result<void>::error("invalid command name '" + completion.command + "'");
    }

    auto options = validate_options(completion.global_options, completion.command);
    if (options.is_error()) {
        return options;
    }
    auto arguments = validate_arguments(completion.arguments, completion.command);
    if (arguments.is_error()) {
        return arguments;
    }
    return validate_subcommands(completion.subcommands, completion.command);
}

Result<CommandCompletion> parse_completion_document(const std::string& content,
                                                    const std::string& source) {
    CommandCompletion completion;
    try {
        nlohmann::json document = nlohmann::json::parse(content);
        completion = document.get<CommandCompletion>();
    } catch (const std::exception& e) {
        return Result<CommandCompletion>::error(source + ": " + e.what());
    }

    auto validation = validate_completion(completion);
    if (validation.is_error()) {
        return Result<CommandCompletion>::error(source + ": " + validation.error());
    }
    return Result<CommandCompletion>::ok(std::move(completion));
}

SchemaLoader::SchemaLoader() : directories_(default_directories()) {
}

SchemaLoader::SchemaLoader(std::vector<fs::path> directories, bool include_bundled)
    : directories_(std::move(directories)), include_bundled_(include_bundled) {
}

std::vector<fs::path> SchemaLoader::default_directories() {
    std::vector<fs::path> directories;
    auto push_unique = [&directories](const fs::path& dir) {
        if (std::find(directories.begin(), directories.end(), dir) == directories.end()) {
            directories.push_back(dir);
        }
    };

    push_unique(tabsh_filesystem::g_tabsh_config_path() / "completions");
    push_unique(tabsh_filesystem::g_user_home_path() / ".config" / "tabsh" / "completions");
    for (const auto& extra : config::extra_schema_directories) {
        push_unique(fs::path(extra));
    }
    push_unique(fs::path(tabsh_filesystem::safe_current_directory()) / "completions");
    return directories;
}

void SchemaLoader::add_directory(const fs::path& directory) {
    directories_.push_back(directory);
}

void SchemaLoader::register_document(CommandCompletionDatabase& database,
                                     const std::string& content, const std::string& source) {
    auto parsed = parse_completion_document(content, source);
    if (parsed.is_error()) {
        ++report_.rejected;
        report_.errors.push_back(parsed.error());
        tabsh_debug_msg("rejected completion definition %s", parsed.error().c_str());
        return;
    }

    std::string command = parsed.value().command;
    if (!database.add_command(std::move(parsed.value()))) {
        ++report_.shadowed;
        tabsh_debug_msg("completion for '%s' from %s shadowed by an earlier definition",
                        command.c_str(), source.c_str());
        return;
    }
    ++report_.loaded;
}

void SchemaLoader::load_directory(CommandCompletionDatabase& database, const fs::path& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".json") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        report_.errors.push_back(directory.string() + ": " + ec.message());
        tabsh_debug_msg("failed to scan %s: %s", directory.c_str(), ec.message().c_str());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        auto content = tabsh_filesystem::read_file_content(file.string());
        if (content.is_error()) {
            ++report_.rejected;
            report_.errors.push_back(content.error());
            tabsh_debug_msg("%s", content.error().c_str());
            continue;
        }
        register_document(database, content.value(), file.string());
    }
}

void SchemaLoader::load_into(CommandCompletionDatabase& database) {
    PerformanceTracker tracker("schema load");
    report_ = LoadReport{};

    if (include_bundled_) {
        for (const auto& bundled : bundled_completions::definitions()) {
            register_document(database, bundled.document,
                              std::string("<bundled:") + bundled.name + ">");
        }
    }

    for (const auto& directory : directories_) {
        load_directory(database, directory);
    }

    tabsh_debug_msg("loaded %zu completion definitions (%zu rejected, %zu shadowed)",
                    report_.loaded, report_.rejected, report_.shadowed);
}

SharedDatabase SchemaLoader::load() {
    auto database = std::make_shared<CommandCompletionDatabase>();
    load_into(*database);
    return database;
}

}  // namespace completion_schema
