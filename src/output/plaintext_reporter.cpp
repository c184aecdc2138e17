#include "output/plaintext_reporter.hpp"

#include "common/terminal_checks.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <bridgegrader/judge.hpp>
#include <bridgegrader/logging.hpp>
#include <bridgegrader/result.hpp>

#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace bridgegrader {

PlainTextReporter::PlainTextReporter(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                     VerbosityLevel verbosity)
    : Reporter{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextReporter::on_submission_begin(std::string_view problem_id, std::string_view language) {
    if (!should_output_case(verbosity_)) {
        return;
    }

    std::string header = fmt::format("Problem: {} ({})", style_str(problem_id, POP_OUT_STYLE), language);

    sink_.write(fmt::format("{0}\n{1}\n{0}\n", LINE_DIVIDER_EM(terminal_width_), header));
}

void PlainTextReporter::on_case_result(std::size_t position, const CaseResult& result) {
    if (!should_output_case(verbosity_)) {
        return;
    }

    const auto code = result.get_main_code();
    std::string verdict = result.passed() ? style_str(code, SUCCESS_STYLE) : style_str(code, ERROR_STYLE);

    std::string out =
        fmt::format("Case #{}: {} [{:.3f}s, {}] ({}/{})\n", position, verdict, result.execution_time.count(),
                    format_memory(result.max_memory), format_points(result.points),
                    format_points(result.total_points));

    if (should_output_feedback(verbosity_, result.passed()) && !result.feedback.empty()) {
        out += indent(style_str(result.feedback, VALUE_STYLE), 2);
    }

    if (should_output_extended_feedback(verbosity_) && !result.extended_feedback.empty()) {
        out += indent(result.extended_feedback, 4);
    }

    sink_.write(out);
}

void PlainTextReporter::on_compile_error(std::string_view output) {
    if (!should_output_errors(verbosity_)) {
        return;
    }

    std::string out = fmt::format("{}\n", style_str("Compilation Error", ERROR_STYLE));
    out += LINE_DIVIDER(terminal_width_) + "\n";
    out += output;

    if (!output.empty() && output.back() != '\n') {
        out += '\n';
    }

    out += LINE_DIVIDER(terminal_width_) + "\n";

    sink_.write(out);
}

void PlainTextReporter::on_internal_error(std::string_view what) {
    if (!should_output_errors(verbosity_)) {
        return;
    }

    sink_.write(fmt::format("{} {}\n", style_str("Internal Error:", ERROR_STYLE), what));
}

void PlainTextReporter::on_summary(const SubmissionReport& report) {
    if (!should_output_summary(verbosity_)) {
        return;
    }

    std::string out;

    if (should_output_case(verbosity_)) {
        out += LINE_DIVIDER(terminal_width_) + "\n";
    }

    if (report.compile_error) {
        out += fmt::format("{}: {}\n", report.problem_id, style_str("Compilation Error", ERROR_STYLE));
        sink_.write(out);
        return;
    }

    const auto num_passed = static_cast<std::size_t>(ranges::count_if(report.cases, &CaseResult::passed));

    std::string score = fmt::format("{}/{} points", format_points(report.points()),
                                    format_points(report.total_points()));

    if (report.all_passed()) {
        out += fmt::format("{} ({}, {} {})\n", style_str("All cases passed", SUCCESS_STYLE), score,
                           report.total_cases, pluralize("case", report.total_cases));
    } else {
        out += fmt::format("{} ({} of {} {} passed)\n", style(score, report.internal_error ? ERROR_STYLE : VALUE_STYLE),
                           num_passed, report.total_cases, pluralize("case", report.total_cases));
    }

    sink_.write(out);
}

void PlainTextReporter::on_warning(std::string_view what) {
    std::string out = style_str(what, WARNING_STYLE, "{}\n");
    sink_.write(out);
}

void PlainTextReporter::on_error(std::string_view what) {
    std::string out = style_str(what, ERROR_STYLE, "{}\n");
    sink_.write(out);
}

void PlainTextReporter::finalize() {
    sink_.flush();
}

std::string PlainTextReporter::format_memory(std::int64_t kib) {
    constexpr std::int64_t KIB_PER_MIB = 1024;

    if (kib < KIB_PER_MIB) {
        return fmt::format("{} KiB", kib);
    }

    return fmt::format("{:.1f} MiB", static_cast<double>(kib) / KIB_PER_MIB);
}

std::string PlainTextReporter::format_points(double points) {
    return fmt::format("{:g}", points);
}

bool PlainTextReporter::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::size_t PlainTextReporter::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    // Output redirected to a file has no width
    if (width.has_error() || width.value() == 0) {
        LOG_DEBUG("Could not obtain terminal width. Defaulting to {}", DEFAULT_WIDTH);
        return DEFAULT_WIDTH;
    }

    return width.value();
}

std::string PlainTextReporter::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::string PlainTextReporter::indent(std::string_view text, std::size_t width) {
    std::string res;
    const std::string pad(width, ' ');

    while (!text.empty()) {
        auto eol = text.find('\n');
        auto line = text.substr(0, eol);

        res += pad;
        res += line;
        res += '\n';

        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
    }

    return res;
}

} // namespace bridgegrader
