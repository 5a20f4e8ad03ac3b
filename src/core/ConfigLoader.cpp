#include "meshstate/core/ConfigLoader.hpp"

#include "meshstate/daemon/StructuredLogger.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace meshstate::config {

namespace {

using protocol::JsonValue;

std::string join_path(const std::vector<std::string>& path) {
    std::string joined;
    for (const auto& part : path) {
        if (!joined.empty()) {
            joined.push_back('.');
        }
        joined += part;
    }
    return joined;
}

const JsonValue* find_path(const JsonValue& root, const std::vector<std::string>& path) {
    const JsonValue* node = &root;
    for (const auto& key : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        node = node->find(key);
        if (!node) {
            return nullptr;
        }
    }
    return node->is_null() ? nullptr : node;
}

std::optional<std::string> get_string(const JsonValue& root, const std::vector<std::string>& path) {
    const JsonValue* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const JsonValue& root, const std::vector<std::string>& path) {
    const JsonValue* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->bool_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const JsonValue& root, const std::vector<std::string>& path) {
    const JsonValue* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_number()) {
        const double value = node->number_value;
        const double rounded = std::floor(value + 0.5);
        if (std::abs(value - rounded) < 1e-9 && std::abs(rounded) < 9007199254740992.0) {
            return static_cast<std::int64_t>(rounded);
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

std::int64_t in_range(std::int64_t value, std::int64_t min, std::int64_t max, const std::vector<std::string>& path) {
    if (value < min || value > max) {
        throw ConfigError("E_CONFIG_VALUE",
                          join_path(path) + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return value;
}

bool valid_ice_url(const std::string& url) {
    for (const std::string_view scheme : {"stun:", "turn:", "turns:"}) {
        if (url.size() > scheme.size() && url.compare(0, scheme.size(), scheme) == 0) {
            return true;
        }
    }
    return false;
}

IceServer parse_ice_server(const JsonValue& entry, std::size_t index) {
    const std::vector<std::string> path{"mesh", "ice_servers", std::to_string(index)};
    IceServer server{};
    if (entry.is_string()) {
        server.urls.push_back(entry.string_value);
    } else if (entry.is_object()) {
        const auto* urls = entry.find("urls");
        if (urls && urls->is_string()) {
            server.urls.push_back(urls->string_value);
        } else if (urls && urls->is_array()) {
            for (const auto& url : urls->array_value) {
                if (!url.is_string()) {
                    throw ConfigError("E_CONFIG_TYPE", "Expected string urls at config path " + join_path(path));
                }
                server.urls.push_back(url.string_value);
            }
        } else {
            throw ConfigError("E_CONFIG_STRUCTURE", join_path(path) + " requires 'urls'");
        }
        server.username = get_string(entry, {"username"});
        server.credential = get_string(entry, {"credential"});
    } else {
        throw ConfigError("E_CONFIG_TYPE", "Expected string or object at config path " + join_path(path));
    }

    if (server.urls.empty()) {
        throw ConfigError("E_CONFIG_VALUE", join_path(path) + " lists no urls");
    }
    for (const auto& url : server.urls) {
        if (!valid_ice_url(url)) {
            throw ConfigError("E_CONFIG_VALUE",
                              "Unsupported ICE server url: " + url,
                              "Use a stun:, turn: or turns: url");
        }
    }
    return server;
}

void require_section(const JsonValue& document, const char* name) {
    const auto* section = document.find(name);
    if (section && !section->is_null() && !section->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", std::string("'") + name + "' section must be a mapping");
    }
}

}  // namespace

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    if (!code.empty()) {
        formatted = "[" + code + "] " + message;
    } else {
        formatted = message;
    }
}

void apply_config(const JsonValue& document, Config& config) {
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }
    for (const char* section : {"mesh", "history", "relay", "logging"}) {
        require_section(document, section);
    }

    if (auto local_id = get_string(document, {"mesh", "local_id"})) {
        if (!is_valid_peer_id(*local_id)) {
            throw ConfigError("E_CONFIG_VALUE",
                              "mesh.local_id is not a valid peer id: " + *local_id,
                              "Use a lowercase UUID such as 3f2b8c1e-9a4d-4c2e-8f1a-0b6d2e7c9a51");
        }
        config.local_id = *local_id;
    }
    if (auto delay = get_int64(document, {"mesh", "negotiation_batch_delay_ms"})) {
        config.negotiation_batch_delay =
            std::chrono::milliseconds(in_range(*delay, 0, 60000, {"mesh", "negotiation_batch_delay_ms"}));
    }
    if (auto label = get_string(document, {"mesh", "data_channel_label"})) {
        if (label->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "mesh.data_channel_label must not be empty");
        }
        config.transport.data_channel_label = *label;
    }
    if (const auto* servers = find_path(document, {"mesh", "ice_servers"})) {
        if (!servers->is_array()) {
            throw ConfigError("E_CONFIG_TYPE", "Expected array at config path mesh.ice_servers");
        }
        std::vector<IceServer> parsed;
        for (std::size_t i = 0; i < servers->array_value.size(); ++i) {
            parsed.push_back(parse_ice_server(servers->array_value[i], i));
        }
        config.transport.ice_servers = std::move(parsed);
    }

    if (auto max_size = get_int64(document, {"history", "max_size"})) {
        config.history_max_size = static_cast<std::size_t>(
            in_range(*max_size, 1, std::numeric_limits<std::int32_t>::max(), {"history", "max_size"}));
    }

    if (auto host = get_string(document, {"relay", "host"})) {
        if (host->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "relay.host must not be empty");
        }
        config.relay_host = *host;
    }
    if (auto port = get_int64(document, {"relay", "port"})) {
        config.relay_port = static_cast<std::uint16_t>(in_range(*port, 1, 65535, {"relay", "port"}));
    }
    if (auto channel = get_string(document, {"relay", "channel"})) {
        if (channel->empty() || channel->find(' ') != std::string::npos) {
            throw ConfigError("E_CONFIG_VALUE", "relay.channel must be a non-empty name without spaces");
        }
        config.relay_channel = *channel;
    }
    if (auto interval = get_int64(document, {"relay", "ping_interval_seconds"})) {
        config.relay_ping_interval =
            std::chrono::seconds(in_range(*interval, 0, 86400, {"relay", "ping_interval_seconds"}));
    }
    if (auto max_line = get_int64(document, {"relay", "max_line_bytes"})) {
        config.relay_max_line_bytes = static_cast<std::size_t>(
            in_range(*max_line, 1024, 64 * 1024 * 1024, {"relay", "max_line_bytes"}));
    }
    if (auto members = get_int64(document, {"relay", "max_channel_members"})) {
        config.relay_max_channel_members =
            static_cast<std::size_t>(in_range(*members, 0, 4096, {"relay", "max_channel_members"}));
    }

    if (auto enabled = get_bool(document, {"logging", "enabled"})) {
        config.logging_enabled = *enabled;
    }
    if (auto level = get_string(document, {"logging", "level"})) {
        if (!daemon::StructuredLogger::parse_level(*level)) {
            throw ConfigError("E_CONFIG_VALUE",
                              "Unknown logging.level: " + *level,
                              "Use one of debug, info, warning, error");
        }
        config.logging_level = *level;
    }
}

void load_config_text(std::string_view text, Config& config) {
    protocol::JsonValue document;
    try {
        document = protocol::parse_json(text);
    } catch (const protocol::JsonError& error) {
        throw ConfigError("E_CONFIG_PARSE", error.what());
    }
    apply_config(document, config);
}

void load_config_file(const std::filesystem::path& path, Config& config) {
    const auto absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND",
                          "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    load_config_text(buffer.str(), config);
}

}  // namespace meshstate::config
