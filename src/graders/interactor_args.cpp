#include <bridgegrader/graders/interactor_args.hpp>

#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/all_of.hpp>

#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridgegrader {

namespace {

constexpr std::string_view SHELL_SAFE_PUNCTUATION = "_@%+=:,./-";

bool is_shell_safe(char chr) {
    return std::isalnum(static_cast<unsigned char>(chr)) != 0 ||
           SHELL_SAFE_PUNCTUATION.find(chr) != std::string_view::npos;
}

bool is_blank(char chr) {
    return chr == ' ' || chr == '\t' || chr == '\n';
}

} // namespace

std::string shell_quote(std::string_view str) {
    if (str.empty()) {
        return "''";
    }

    if (ranges::all_of(str, is_shell_safe)) {
        return std::string{str};
    }

    // Single quotes can't be escaped inside single quotes: close, emit "'", reopen
    std::string res = "'";
    for (char chr : str) {
        if (chr == '\'') {
            res += R"('"'"')";
        } else {
            res += chr;
        }
    }
    res += '\'';

    return res;
}

std::vector<std::string> shell_split(std::string_view str) {
    std::vector<std::string> words;
    std::optional<std::string> current;

    for (std::size_t i = 0; i < str.size(); ++i) {
        char chr = str[i];

        if (is_blank(chr)) {
            if (current) {
                words.push_back(std::move(*current));
                current.reset();
            }
            continue;
        }

        if (!current) {
            current.emplace();
        }

        if (chr == '\'') {
            auto end = str.find('\'', i + 1);
            if (end == std::string_view::npos) {
                throw ConfigError(fmt::format("unterminated single quote in {:?}", str));
            }

            *current += str.substr(i + 1, end - i - 1);
            i = end;
        } else if (chr == '"') {
            ++i;
            for (; i < str.size() && str[i] != '"'; ++i) {
                // Inside double quotes, a backslash only escapes these
                if (str[i] == '\\' && i + 1 < str.size() &&
                    std::string_view{"\\\"$`"}.find(str[i + 1]) != std::string_view::npos) {
                    ++i;
                }
                *current += str[i];
            }

            if (i >= str.size()) {
                throw ConfigError(fmt::format("unterminated double quote in {:?}", str));
            }
        } else if (chr == '\\') {
            if (i + 1 >= str.size()) {
                throw ConfigError(fmt::format("trailing backslash in {:?}", str));
            }

            *current += str[++i];
        } else {
            *current += chr;
        }
    }

    if (current) {
        words.push_back(std::move(*current));
    }

    return words;
}

std::vector<std::string> format_interactor_args(std::string_view format, const std::string& input_file,
                                                const std::string& output_file, const std::string& answer_file) {
    std::string expanded;

    for (std::size_t i = 0; i < format.size(); ++i) {
        char chr = format[i];

        if (chr == '}') {
            if (i + 1 >= format.size() || format[i + 1] != '}') {
                throw ConfigError(fmt::format("single '}}' encountered in interactor arguments {:?}", format));
            }
            expanded += '}';
            ++i;
            continue;
        }

        if (chr != '{') {
            expanded += chr;
            continue;
        }

        if (i + 1 < format.size() && format[i + 1] == '{') {
            expanded += '{';
            ++i;
            continue;
        }

        auto end = format.find('}', i);
        if (end == std::string_view::npos) {
            throw ConfigError(fmt::format("unterminated placeholder in interactor arguments {:?}", format));
        }

        auto name = format.substr(i + 1, end - i - 1);

        if (name == "input_file") {
            expanded += shell_quote(input_file);
        } else if (name == "output_file") {
            expanded += shell_quote(output_file);
        } else if (name == "answer_file") {
            expanded += shell_quote(answer_file);
        } else {
            throw ConfigError(fmt::format("unknown placeholder {{{}}} in interactor arguments {:?}", name, format));
        }

        i = end;
    }

    auto args = shell_split(expanded);

    LOG_TRACE("Interactor arguments {:?} -> {}", format, args);

    return args;
}

} // namespace bridgegrader
