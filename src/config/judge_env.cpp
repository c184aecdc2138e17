#include <bridgegrader/config/judge_env.hpp>

#include <bridgegrader/config/json_fields.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace bridgegrader {

std::map<std::string, LanguageConfig> JudgeEnv::default_languages() {
    return {
        {"CPP17",
         {.extension = ".cpp",
          .compile = {"g++", "-std=c++17", "-O2", "-pipe", "-o", "{binary}", "{flags}", "{sources}"},
          .run = {"{binary}"},
          .unbuffered_run = {}}},
        {"C",
         {.extension = ".c",
          .compile = {"gcc", "-std=c11", "-O2", "-pipe", "-o", "{binary}", "{flags}", "{sources}", "-lm"},
          .run = {"{binary}"},
          .unbuffered_run = {}}},
        {"PY3",
         {.extension = ".py", .compile = {}, .run = {"python3", "{binary}"}, .unbuffered_run = {"python3", "-u", "{binary}"}}},
        {"SH", {.extension = ".sh", .compile = {}, .run = {"/bin/sh", "{binary}"}, .unbuffered_run = {}}},
    };
}

const LanguageConfig& JudgeEnv::get_language(const std::string& key) const {
    auto it = languages.find(key);

    if (it == languages.end()) {
        throw ConfigError(fmt::format("unknown language {:?}", key));
    }

    return it->second;
}

JudgeEnv JudgeEnv::load(const std::filesystem::path& path) {
    auto env = config::load_json_file(path).get<JudgeEnv>();

    LOG_DEBUG("Loaded judge environment from {} ({} languages, {} storage namespaces)", path, env.languages.size(),
              env.problem_storage.size());

    return env;
}

void from_json(const nlohmann::json& json, LanguageConfig& lang) {
    lang.extension = config::get_or<std::string>(json, "extension", "");
    lang.compile = config::get_or<std::vector<std::string>>(json, "compile", {});
    lang.run = config::get_required<std::vector<std::string>>(json, "run");
    lang.unbuffered_run = config::get_or<std::vector<std::string>>(json, "unbuffered_run", {});

    if (lang.run.empty()) {
        throw ConfigError("a language's run command must not be empty");
    }
}

void from_json(const nlohmann::json& json, JudgeEnv& env) {
    env = JudgeEnv{};

    if (auto storage = config::get_optional<std::map<std::string, std::vector<std::string>>>(json, "problem_storage")) {
        for (const auto& [name, roots] : *storage) {
            env.problem_storage[name] = {roots.begin(), roots.end()};
        }
    }

    env.generator_memory_limit = config::get_or<std::int64_t>(json, "generator_memory_limit", env.generator_memory_limit);
    env.compiler_time_limit = std::chrono::duration<double>{
        config::get_or<double>(json, "compiler_time_limit", env.compiler_time_limit.count())};

    if (auto tempdir = config::get_optional<std::string>(json, "tempdir")) {
        env.tempdir = *tempdir;
    }

    if (auto it = json.find("languages"); it != json.end()) {
        if (!it->is_object()) {
            throw ConfigError("\"languages\" must be an object");
        }

        // Configured languages extend (and override) the built-in ones
        for (const auto& [key, value] : it->items()) {
            LanguageConfig lang;
            from_json(value, lang);
            env.languages[key] = std::move(lang);
        }
    }

    if (env.generator_memory_limit <= 0) {
        throw ConfigError("generator_memory_limit must be positive");
    }

    if (env.compiler_time_limit.count() <= 0) {
        throw ConfigError("compiler_time_limit must be positive");
    }
}

} // namespace bridgegrader
