#include <bridgegrader/config/problem.hpp>

#include <bridgegrader/config/handler_data.hpp>
#include <bridgegrader/config/json_fields.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <range/v3/numeric/accumulate.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bridgegrader {

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::binary};

    if (!file) {
        throw ConfigError(fmt::format("could not read test data {}", path));
    }

    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

/// Problem ids name a single directory, nothing above or below it
bool is_valid_problem_id(const std::string& problem_id) {
    return !problem_id.empty() && problem_id != "." && problem_id != ".." &&
           problem_id.find('/') == std::string::npos;
}

TestCase parse_test_case(const nlohmann::json& json, const std::filesystem::path& root,
                         const std::string& default_checker) {
    TestCase test_case;

    test_case.input_file = root / config::get_required<std::string>(json, "in");
    test_case.output_file = root / config::get_required<std::string>(json, "out");
    test_case.points = config::get_or<double>(json, "points", 1);
    test_case.symlinks = config::get_or<std::map<std::string, std::string>>(json, "symlinks", {});
    test_case.checker = config::get_or<std::string>(json, "checker", default_checker);
    test_case.wall_time_factor = config::get_or<double>(json, "wall_time_factor", 3);

    if (test_case.points < 0) {
        throw ConfigError("test case points must not be negative");
    }

    if (test_case.wall_time_factor <= 0) {
        throw ConfigError("wall_time_factor must be positive");
    }

    return test_case;
}

} // namespace

std::string TestCase::input_data() const {
    return read_file(input_file);
}

std::string TestCase::output_data() const {
    return read_file(output_file);
}

double Problem::total_points() const {
    return ranges::accumulate(cases, 0.0, std::plus<>{}, &TestCase::points);
}

void ProblemStorage::add_root(const std::string& storage_namespace, std::filesystem::path root) {
    roots_[storage_namespace].push_back(std::move(root));
}

std::optional<std::filesystem::path> ProblemStorage::get_problem_root(const std::string& problem_id,
                                                                       const std::string& storage_namespace) const {
    if (!is_valid_problem_id(problem_id)) {
        LOG_DEBUG("Rejecting problem id {:?}", problem_id);
        return std::nullopt;
    }

    auto it = roots_.find(storage_namespace);
    if (it == roots_.end()) {
        return std::nullopt;
    }

    for (const auto& root : it->second) {
        auto candidate = root / problem_id;
        std::error_code err;

        if (std::filesystem::is_regular_file(candidate / PROBLEM_CONFIG_NAME, err)) {
            return std::filesystem::absolute(candidate, err);
        }
    }

    return std::nullopt;
}

Problem parse_problem(const nlohmann::json& json, const std::filesystem::path& root, const JudgeEnv& env) {
    Problem problem;
    problem.root = root;

    problem.time_limit = std::chrono::duration<double>{config::get_required<double>(json, "time_limit")};
    problem.memory_limit = config::get_required<std::int64_t>(json, "memory_limit");

    if (problem.time_limit.count() <= 0 || problem.memory_limit <= 0) {
        throw ConfigError("time_limit and memory_limit must be positive");
    }

    if (auto it = json.find("interactive"); it != json.end() && !it->is_null()) {
        problem.interactive = HandlerData::parse(*it, env);
    }

    const auto default_checker = config::get_or<std::string>(json, "checker", "standard");
    const auto cases = config::get_required<std::vector<nlohmann::json>>(json, "test_cases");

    for (const auto& case_json : cases) {
        auto& test_case = problem.cases.emplace_back(parse_test_case(case_json, root, default_checker));
        test_case.position = problem.cases.size();
    }

    return problem;
}

Problem load_problem(const ProblemStorage& storage, const std::string& problem_id,
                     const std::string& storage_namespace, const JudgeEnv& env) {
    auto root = storage.get_problem_root(problem_id, storage_namespace);

    if (!root) {
        throw ConfigError(fmt::format("problem {:?} not found in storage namespace {:?}", problem_id, storage_namespace));
    }

    auto problem = parse_problem(config::load_json_file(*root / PROBLEM_CONFIG_NAME), *root, env);
    problem.id = problem_id;
    problem.storage_namespace = storage_namespace;

    LOG_INFO("Loaded problem {:?} from {} ({} cases, {}interactive)", problem_id, *root, problem.cases.size(),
             problem.interactive ? "" : "not ");

    return problem;
}

} // namespace bridgegrader
