#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <bridgegrader/common/error_types.hpp>
#include <bridgegrader/common/expected.hpp>
#include <bridgegrader/logging.hpp>

#include <argparse/argparse.hpp>
#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bridgegrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ BRIDGEGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout); term_sz && term_sz->ws_col > 0) {
        arg_parser_.set_usage_max_line_width(std::size_t{term_sz->ws_col} * 3 / 4);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("BridgeGrader v{}\nGrades a submission against a problem from the "
                                            "judge's problem storage, running interactive problems against their "
                                            "interactor.",
                                            BRIDGEGRADER_VERSION_STRING));

    // FIXME: argparse is kind of annoying. Behavior is dependant upon ORDER of chained fn calls.

    // clang-format off
    arg_parser_.add_argument("problem")
        .store_into(opts_buffer_.problem_id)
        .help("Id of the problem to grade against");

    arg_parser_.add_argument("source")
        .action([this] (const std::string& opt) {
                opts_buffer_.source_path = opt;
        })
        .help("The submission's source file");

    arg_parser_.add_argument("-l", "--language")
        .required()
        .metavar("LANG")
        .store_into(opts_buffer_.language)
        .help("Language key of the submission (e.g., CPP17, C, PY3, SH)");

    arg_parser_.add_argument("-n", "--namespace")
        .default_value(std::string{ProgramOptions::DEFAULT_NAMESPACE})
        .metavar("NAME")
        .nargs(1)
        .store_into(opts_buffer_.storage_namespace)
        .help("Problem storage namespace to look the problem up in");

    arg_parser_.add_argument("-c", "--config")
        .metavar("FILE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.config_path = opt;
        })
        .help("Judge environment JSON. Built-in defaults are used if not given.");

    arg_parser_.add_argument("-r", "--problem-root")
        .metavar("DIR")
        .nargs(1)
        .append()
        .action([this] (const std::string& opt) {
                opts_buffer_.problem_roots.emplace_back(opt);
        })
        .help("Add a problem root directory to the selected namespace. May be repeated.");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::println(BRIDGEGRADER_VERSION_STRING);
            std::exit(0); // NOLINT(concurrency-mt-unsafe)
        })
        .help("prints version information and exits");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE =
            static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (value > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (value < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

        arg_parser_.add_argument("--silent")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    opts_buffer_.verbosity = Silent;
                })
            .help("Sets verbosity level to 'Silent', suppressing all output except for the return code. Useful for scripting.");

        opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    }

    arg_parser_.add_argument("--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println(stderr, "{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code); // NOLINT(concurrency-mt-unsafe)
    }

    return opts_res.value();
}

} // namespace bridgegrader
