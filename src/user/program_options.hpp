#pragma once

#include "output/verbosity.hpp"

#include <bridgegrader/common/error_types.hpp>
#include <bridgegrader/common/expected.hpp>
#include <bridgegrader/common/extra_formatters.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/base.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridgegrader {

struct ProgramOptions
{

    // ###### Argument fields

    /// Level of verbosity for cli output.
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    std::string problem_id;
    std::filesystem::path source_path;

    /// Language key, as in the judge environment's `languages`
    std::string language;
    std::string storage_namespace = std::string{DEFAULT_NAMESPACE};

    /// Judge environment JSON; the built-in defaults are used without one
    std::optional<std::filesystem::path> config_path;

    /// Extra problem roots added to `storage_namespace`
    std::vector<std::filesystem::path> problem_roots;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    BOOST_DESCRIBE_NESTED_ENUM(ColorizeOpt, Auto, Always, Never);

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_NAMESPACE = "default";
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        // Assume that all enumerators have valid values except for verbosity
        // which we will just clamp to [MIN, MAX]

        constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
        constexpr auto MIN_VERBOSITY = VerbosityLevel{};

        verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

        if (problem_id.empty()) {
            return std::string{"Problem id must not be empty"};
        }

        if (language.empty()) {
            return std::string{"Language must not be empty"};
        }

        TRY(ensure_is_regular_file(source_path, "Source file {:?}"));

        if (config_path) {
            TRY(ensure_is_regular_file(*config_path, "Judge config {:?}"));
        }

        for (const auto& root : problem_roots) {
            TRY(ensure_is_directory(root, "Problem root {:?}"));
        }

        return {};
    }
};

} // namespace bridgegrader

template <>
struct fmt::formatter<::bridgegrader::ProgramOptions> : ::bridgegrader::DebugFormatter
{
    auto format(const ::bridgegrader::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, problem={}, source={}, language={}, namespace={}, config={}, "
                              "roots={}, color_opt={}}}",
                              fmt::underlying(from.verbosity), from.problem_id, from.source_path.string(),
                              from.language, from.storage_namespace, from.config_path, from.problem_roots,
                              from.colorize_option);
    }
};
