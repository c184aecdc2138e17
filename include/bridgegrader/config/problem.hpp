#pragma once

#include <bridgegrader/config/handler_data.hpp>
#include <bridgegrader/config/judge_env.hpp>

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bridgegrader {

struct TestCase
{
    /// 1-based position within the problem
    std::size_t position = 0;

    std::filesystem::path input_file;
    std::filesystem::path output_file;

    double points = 1;

    /// name -> target links made visible to the submission
    std::map<std::string, std::string> symlinks;

    /// Secondary checker run over the output
    std::string checker = "standard";

    /// The wall-clock limit is this multiple of the time limit
    double wall_time_factor = 3;

    /// Contents of the input / expected output. Throws ConfigError if unreadable.
    std::string input_data() const;
    std::string output_data() const;
};

struct Problem
{
    std::string id;
    std::string storage_namespace;
    std::filesystem::path root;

    std::chrono::duration<double> time_limit{1};
    /// KiB
    std::int64_t memory_limit = 262144;

    /// Present for problems graded through an interactor
    std::optional<HandlerData> interactive;

    std::vector<TestCase> cases;

    double total_points() const;
};

/// Locates problem directories. A problem is a sub-directory of one of the roots of its storage
/// namespace, named after the problem id, that contains an `init.json`.
class ProblemStorage
{
public:
    ProblemStorage() = default;

    explicit ProblemStorage(std::map<std::string, std::vector<std::filesystem::path>> roots)
        : roots_{std::move(roots)} {}

    void add_root(const std::string& storage_namespace, std::filesystem::path root);

    std::optional<std::filesystem::path> get_problem_root(const std::string& problem_id,
                                                          const std::string& storage_namespace) const;

private:
    std::map<std::string, std::vector<std::filesystem::path>> roots_;
};

/// Problem configuration file name inside a problem root
inline constexpr const char* PROBLEM_CONFIG_NAME = "init.json";

/// Parse a problem configuration. Paths in `json` are taken relative to `root`.
/// Throws ConfigError.
Problem parse_problem(const nlohmann::json& json, const std::filesystem::path& root, const JudgeEnv& env);

/// Locate and parse a problem. Throws ConfigError, also when the problem doesn't exist.
Problem load_problem(const ProblemStorage& storage, const std::string& problem_id,
                     const std::string& storage_namespace, const JudgeEnv& env);

} // namespace bridgegrader
