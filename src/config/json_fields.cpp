#include <bridgegrader/config/json_fields.hpp>

#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace bridgegrader::config {

nlohmann::json load_json_file(const std::filesystem::path& path) {
    std::ifstream file{path};

    if (!file) {
        throw ConfigError(fmt::format("could not open {}", path));
    }

    try {
        nlohmann::json json;
        file >> json;
        LOG_TRACE("Loaded {}", path);
        return json;
    } catch (const nlohmann::json::exception& err) {
        throw ConfigError(fmt::format("malformed JSON in {}: {}", path, err.what()));
    }
}

} // namespace bridgegrader::config
