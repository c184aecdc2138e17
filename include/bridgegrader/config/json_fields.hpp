/// \file
/// Typed access to optional JSON object members, raising ``ConfigError`` on malformed values
#pragma once

#include <bridgegrader/exceptions.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <utility>
#include <string>
#include <string_view>

namespace bridgegrader::config {

/// Value of `key` in `obj` if present (and not null). Throws ConfigError if it doesn't convert to T.
template <typename T>
std::optional<T> get_optional(const nlohmann::json& obj, std::string_view key) {
    if (!obj.is_object()) {
        throw ConfigError(fmt::format("expected an object while looking up {:?}, got {}", key, obj.type_name()));
    }

    auto it = obj.find(std::string{key});
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }

    try {
        return it->template get<T>();
    } catch (const nlohmann::json::exception& err) {
        throw ConfigError(fmt::format("invalid value for {:?}: {}", key, err.what()));
    }
}

template <typename T>
T get_or(const nlohmann::json& obj, std::string_view key, T default_value) {
    return get_optional<T>(obj, key).value_or(std::move(default_value));
}

template <typename T>
T get_required(const nlohmann::json& obj, std::string_view key) {
    auto res = get_optional<T>(obj, key);

    if (!res) {
        throw ConfigError(fmt::format("missing required field {:?}", key));
    }

    return *std::move(res);
}

/// Parse a whole JSON file
nlohmann::json load_json_file(const std::filesystem::path& path);

} // namespace bridgegrader::config
