#pragma once

#include "output/reporter.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <bridgegrader/judge.hpp>
#include <bridgegrader/result.hpp>

#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bridgegrader {

class PlainTextReporter : public Reporter
{
public:
    PlainTextReporter(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_submission_begin(std::string_view problem_id, std::string_view language) override;
    void on_case_result(std::size_t position, const CaseResult& result) override;
    void on_compile_error(std::string_view output) override;
    void on_internal_error(std::string_view what) override;
    void on_summary(const SubmissionReport& report) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

    /// "512 KiB" below a MiB, "1.2 MiB" otherwise
    static std::string format_memory(std::int64_t kib);

    /// Points without trailing zeros, e.g. "10" or "2.5"
    static std::string format_points(double points);

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    /// Conditionally make a word singular or plural based on `count`
    /// Plural if and only if `count != 1`
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    template <fmt::formattable T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    template <fmt::formattable T>
    std::string style_str(const T& arg, fmt::text_style style, fmt::format_string<T> fmt = "{}") const;

    /// Indent every line of `text` by `width` spaces
    static std::string indent(std::string_view text, std::size_t width);

    // Basic styles for different kinds of output:
    //   error    - failed verdicts, fatal errors, etc.
    //   success  - AC verdicts
    //   header   - section header (like "Compilation Error")
    //   value    - feedback text and limits
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto POP_OUT_STYLE =
        fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::golden_rod);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');

    bool do_colorize_;
    std::size_t terminal_width_;
};

template <fmt::formattable T>
auto PlainTextReporter::style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style)) {
    if (!do_colorize_) {
        return fmt::styled(arg, {});
    }
    return fmt::styled(arg, style);
}

template <fmt::formattable T>
std::string PlainTextReporter::style_str(const T& arg, fmt::text_style style, fmt::format_string<T> fmt) const {
    if (!do_colorize_) {
        return fmt::vformat(fmt.str, fmt::vargs<T>{arg});
    }

    return fmt::vformat(style, fmt.str, fmt::vargs<T>{arg});
}

} // namespace bridgegrader
