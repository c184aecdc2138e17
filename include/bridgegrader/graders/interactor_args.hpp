/// \file
/// Building an interactor's argv from an argument template
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bridgegrader {

/// Quote `str` so that a POSIX shell reads it back as a single word
std::string shell_quote(std::string_view str);

/// Split `str` into words using POSIX shell quoting rules (no expansions).
/// Throws ConfigError on unterminated quotes.
std::vector<std::string> shell_split(std::string_view str);

/// Substitute {input_file}, {output_file} and {answer_file} in `format` with the shell-quoted
/// paths and split the result into arguments. `{{` and `}}` stand for literal braces.
/// Throws ConfigError for unknown placeholders.
std::vector<std::string> format_interactor_args(std::string_view format, const std::string& input_file,
                                                const std::string& output_file, const std::string& answer_file);

} // namespace bridgegrader
