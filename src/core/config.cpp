#include "peerlink/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace peerlink {
namespace {

using json = nlohmann::json;

Result<PeerConfig> config_error(const std::string& message) {
    return Err<PeerConfig>(ErrorCode::ConfigError, message);
}

bool is_known_level(const std::string& level) {
    static const char* const levels[] = {"trace", "debug", "info", "warn", "warning",
                                         "error", "err", "critical", "off"};
    for (const char* known : levels) {
        if (level == known) {
            return true;
        }
    }
    return false;
}

} // namespace

Result<PeerConfig> parse_config(const std::string& json_text) {
    const auto document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return config_error("Invalid JSON");
    }
    if (!document.is_object()) {
        return config_error("Configuration root must be an object");
    }

    PeerConfig config;

    if (auto it = document.find("ice_servers"); it != document.end()) {
        if (!it->is_array()) {
            return config_error("ice_servers must be an array of strings");
        }
        config.ice_servers.clear();
        for (const auto& server : *it) {
            if (!server.is_string()) {
                return config_error("ice_servers must be an array of strings");
            }
            config.ice_servers.push_back(server.get<std::string>());
        }
    }

    if (auto it = document.find("channel_label"); it != document.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) {
            return config_error("channel_label must be a non-empty string");
        }
        config.channel_label = it->get<std::string>();
    }

    if (auto it = document.find("max_chunk_size"); it != document.end()) {
        if (!it->is_number_unsigned()) {
            return config_error("max_chunk_size must be a positive integer");
        }
        const auto size = it->get<std::size_t>();
        if (size == 0 || size > PeerConfig::kMaxChunkSize) {
            return config_error("max_chunk_size must be in (0, " +
                                std::to_string(PeerConfig::kMaxChunkSize) + "]");
        }
        config.max_chunk_size = size;
    }

    if (auto it = document.find("max_file_size_mb"); it != document.end()) {
        if (!it->is_number_unsigned() || it->get<std::size_t>() == 0) {
            return config_error("max_file_size_mb must be a positive integer");
        }
        config.max_file_size_mb = it->get<std::size_t>();
    }

    if (auto it = document.find("log_level"); it != document.end()) {
        if (!it->is_string() || !is_known_level(it->get<std::string>())) {
            return config_error("log_level must be one of trace, debug, info, warn, error, critical, off");
        }
        config.log_level = it->get<std::string>();
    }

    return Ok(config);
}

Result<PeerConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return config_error("Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace peerlink
