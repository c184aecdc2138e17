#include <bridgegrader/config/handler_data.hpp>

#include <bridgegrader/config/json_fields.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridgegrader {

namespace {

using Seconds = std::chrono::duration<double>;

/// `files` may be given as a single path or as a list of them
std::vector<std::string> parse_files(const nlohmann::json& json) {
    auto it = json.find("files");

    if (it == json.end()) {
        throw ConfigError("interactive: missing required field \"files\"");
    }

    if (it->is_string()) {
        return {it->get<std::string>()};
    }

    const auto is_string = [](const nlohmann::json& elem) { return elem.is_string(); };

    if (it->is_array() && std::all_of(it->begin(), it->end(), is_string)) {
        auto files = it->get<std::vector<std::string>>();

        if (!files.empty()) {
            return files;
        }
    }

    throw ConfigError(fmt::format("interactive: invalid files {}", it->dump()));
}

std::optional<Seconds> get_seconds(const nlohmann::json& json, std::string_view key) {
    auto res = config::get_optional<double>(json, key);

    if (res && *res < 0) {
        throw ConfigError(fmt::format("interactive: {:?} must not be negative", key));
    }

    if (!res) {
        return std::nullopt;
    }

    return Seconds{*res};
}

} // namespace

HandlerData HandlerData::parse(const nlohmann::json& json, const JudgeEnv& env) {
    if (!json.is_object()) {
        throw ConfigError("interactive section must be an object");
    }

    HandlerData data;

    data.files = parse_files(json);
    data.flags = config::get_or<std::vector<std::string>>(json, "flags", {});
    data.lang = config::get_required<std::string>(json, "lang");
    data.compiler_time_limit = get_seconds(json, "compiler_time_limit").value_or(env.compiler_time_limit);
    data.unbuffered = config::get_or<bool>(json, "unbuffered", true);
    data.args_format_string = config::get_optional<std::string>(json, "args_format_string");
    data.preprocessing_time = get_seconds(json, "preprocessing_time").value_or(Seconds{2});
    data.time_limit = get_seconds(json, "time_limit");
    data.memory_limit = config::get_optional<std::int64_t>(json, "memory_limit");
    data.type = config::get_or<std::string>(json, "type", "default");

    if (data.memory_limit && *data.memory_limit <= 0) {
        throw ConfigError("interactive: memory_limit must be positive");
    }

    // Unknown languages are a configuration fault
    env.get_language(data.lang);

    LOG_DEBUG("Interactor config: files={} lang={} type={}", data.files, data.lang, data.type);

    return data;
}

} // namespace bridgegrader
