#include "toolchain.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace labjudge {
using namespace std;

bool toolchain_profile::needs_compilation() const {
    return !compile_command.empty();
}

vector<string> toolchain_profile::compile_args() const {
    return expand_command(compile_command, *this);
}

vector<string> toolchain_profile::run_args() const {
    return expand_command(run_command, *this);
}

vector<string> expand_command(const vector<string> &tmpl, const toolchain_profile &profile) {
    vector<string> args;
    for (string arg : tmpl) {
        boost::algorithm::replace_all(arg, "{source}", profile.source_name);
        boost::algorithm::replace_all(arg, "{output}", profile.output_name);
        boost::algorithm::replace_all(arg, "{dir}", ".");
        args.push_back(arg);
    }
    return args;
}

static string normalize_language(const string &language) {
    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(language));
}

toolchain_registry::toolchain_registry() {}

toolchain_registry toolchain_registry::builtin() {
    toolchain_registry registry;

    // clang-format off
    registry.add({"python", "python:3.11-slim", ".py", "main.py", "",
                  {},
                  {"python3", "{source}"},
                  1.0, 1.0});
    registry.add({"java", "openjdk:17-slim", ".java", "Main.java", "Main",
                  {"javac", "-encoding", "UTF-8", "{source}"},
                  {"java", "-cp", "{dir}", "{output}"},
                  1.5, 1.5});
    registry.add({"c", "gcc:latest", ".c", "main.c", "main",
                  {"gcc", "-O2", "-std=c11", "-o", "{output}", "{source}", "-lm"},
                  {"./{output}"},
                  1.2, 1.0});
    registry.add({"cpp", "gcc:latest", ".cpp", "main.cpp", "main",
                  {"g++", "-O2", "-std=c++17", "-o", "{output}", "{source}"},
                  {"./{output}"},
                  1.2, 1.0});
    registry.add({"javascript", "node:18-slim", ".js", "main.js", "",
                  {},
                  {"node", "{source}"},
                  1.0, 1.0});
    // clang-format on

    registry.add_alias("py", "python");
    registry.add_alias("python3", "python");
    registry.add_alias("c++", "cpp");
    registry.add_alias("js", "javascript");
    registry.add_alias("node", "javascript");
    return registry;
}

void toolchain_registry::add(const toolchain_profile &profile) {
    if (profile.run_command.empty())
        throw invalid_argument(fmt::format("Language {} has no run command", profile.language));
    if (profile.time_multiplier <= 0 || profile.memory_multiplier <= 0)
        throw invalid_argument(fmt::format("Language {} has non-positive limit multiplier", profile.language));
    assert_safe_path(profile.source_name);
    profiles[normalize_language(profile.language)] = profile;
}

void toolchain_registry::add_alias(const string &alias, const string &language) {
    aliases[normalize_language(alias)] = normalize_language(language);
}

void toolchain_registry::load(const nlohmann::json &config) {
    if (nlohmann::exists(config, "languages")) {
        for (auto &item : nlohmann::access(config, "languages")) {
            add(item.get<toolchain_profile>());
        }
    }
    if (nlohmann::exists(config, "aliases")) {
        for (auto &[alias, language] : nlohmann::access(config, "aliases").items()) {
            add_alias(alias, language.get<string>());
        }
    }
}

void toolchain_registry::load_file(const filesystem::path &config_path) {
    nlohmann::json config;
    try {
        config = nlohmann::json::parse(read_file_content(config_path));
    } catch (nlohmann::json::exception &ex) {
        throw invalid_argument(fmt::format("Toolchain configuration {} is malformed: {}", config_path, ex.what()));
    }
    load(config);
}

const toolchain_profile *toolchain_registry::find(const string &language) const {
    string key = normalize_language(language);
    if (aliases.count(key)) key = aliases.at(key);
    auto it = profiles.find(key);
    return it == profiles.end() ? nullptr : &it->second;
}

const toolchain_profile &toolchain_registry::lookup(const string &language) const {
    const toolchain_profile *profile = find(language);
    if (!profile) throw unsupported_language(language);
    return *profile;
}

bool toolchain_registry::supports(const string &language) const {
    return find(language) != nullptr;
}

vector<string> toolchain_registry::languages() const {
    vector<string> result;
    for (auto &[language, profile] : profiles)
        result.push_back(language);
    return result;
}

void from_json(const nlohmann::json &j, toolchain_profile &profile) {
    profile.language = nlohmann::get_value<string>(j, "language");
    profile.image = nlohmann::get_value_def<string>(j, "", "image");
    profile.extension = nlohmann::get_value_def<string>(j, "", "extension");
    profile.source_name = nlohmann::get_value_def<string>(j, "main" + profile.extension, "source_name");
    profile.output_name = nlohmann::get_value_def<string>(j, "", "output_name");
    profile.compile_command = nlohmann::get_value_def<vector<string>>(j, {}, "compile_command");
    profile.run_command = nlohmann::get_value<vector<string>>(j, "run_command");
    profile.time_multiplier = nlohmann::get_value_def<double>(j, 1, "time_multiplier");
    profile.memory_multiplier = nlohmann::get_value_def<double>(j, 1, "memory_multiplier");
}

void to_json(nlohmann::json &j, const toolchain_profile &profile) {
    j = {{"language", profile.language},
         {"image", profile.image},
         {"extension", profile.extension},
         {"source_name", profile.source_name},
         {"output_name", profile.output_name},
         {"compile_command", profile.compile_command},
         {"run_command", profile.run_command},
         {"time_multiplier", profile.time_multiplier},
         {"memory_multiplier", profile.memory_multiplier}};
}

}  // namespace labjudge
