#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace bridgegrader {

/// How to build and run programs of one language.
///
/// Argument templates may contain the placeholders
///   {binary}  - path of the build output (or of the main source, for interpreted languages)
///   {sources} - every source file (expands into one argument each)
///   {flags}   - extra compiler flags (expands into one argument each)
/// An empty `compile` template means the language is interpreted.
struct LanguageConfig
{
    std::string extension;
    std::vector<std::string> compile;
    std::vector<std::string> run;
    /// Used instead of `run` when unbuffered I/O is requested. Empty -> same as `run`.
    std::vector<std::string> unbuffered_run;

    bool is_interpreted() const { return compile.empty(); }
};

/// Judge-wide settings
struct JudgeEnv
{
    /// storage namespace -> problem root directories, searched in order
    std::map<std::string, std::vector<std::filesystem::path>> problem_storage;

    /// Default interactor / generator memory limit, in KiB
    std::int64_t generator_memory_limit = 524288;

    std::chrono::duration<double> compiler_time_limit{10};

    std::filesystem::path tempdir = std::filesystem::temp_directory_path();

    std::map<std::string, LanguageConfig> languages = default_languages();

    /// Throws ConfigError for unknown keys
    const LanguageConfig& get_language(const std::string& key) const;

    static std::map<std::string, LanguageConfig> default_languages();

    /// Read settings from a JSON file. Throws ConfigError.
    static JudgeEnv load(const std::filesystem::path& path);
};

void from_json(const nlohmann::json& json, LanguageConfig& lang);
void from_json(const nlohmann::json& json, JudgeEnv& env);

} // namespace bridgegrader
