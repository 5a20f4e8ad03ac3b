#include "meshstate/Config.hpp"
#include "meshstate/core/ConfigLoader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace {

using meshstate::config::ConfigError;

std::string error_code(const std::string& text) {
    meshstate::Config config{};
    try {
        meshstate::config::load_config_text(text, config);
    } catch (const ConfigError& error) {
        assert(std::string(error.what()).find(error.code) != std::string::npos);
        return error.code;
    }
    return {};
}

}  // namespace

int main() {
    using namespace std::chrono_literals;

    {
        const meshstate::Config defaults{};
        assert(!defaults.local_id.has_value());
        assert(defaults.negotiation_batch_delay == 100ms);
        assert(defaults.history_max_size == 256);
        assert(defaults.transport.ice_servers.size() == 1);
        assert(defaults.transport.data_channel_label == "meshstate");
        assert(defaults.relay_port == 9750);
    }

    {
        meshstate::Config config{};
        meshstate::config::load_config_text(R"({
            "mesh": {
                "local_id": "3f2b8c1e-9a4d-4c2e-8f1a-0b6d2e7c9a51",
                "negotiation_batch_delay_ms": 25,
                "data_channel_label": "state",
                "ice_servers": [
                    "stun:stun.example.org:3478",
                    {"urls": ["turn:turn.example.org:3478", "turns:turn.example.org:5349"],
                     "username": "user", "credential": "secret"}
                ]
            },
            "history": {"max_size": 64},
            "relay": {"host": "relay.example.org", "port": 7000, "channel": "lab",
                      "ping_interval_seconds": 0, "max_line_bytes": 4096,
                      "max_channel_members": 8},
            "logging": {"enabled": false, "level": "debug"}
        })", config);

        assert(config.local_id == std::optional<std::string>("3f2b8c1e-9a4d-4c2e-8f1a-0b6d2e7c9a51"));
        assert(config.negotiation_batch_delay == 25ms);
        assert(config.transport.data_channel_label == "state");
        assert(config.transport.ice_servers.size() == 2);
        assert(config.transport.ice_servers[1].urls.size() == 2);
        assert(config.transport.ice_servers[1].username == std::optional<std::string>("user"));
        assert(config.transport.ice_servers[1].credential == std::optional<std::string>("secret"));
        assert(config.history_max_size == 64);
        assert(config.relay_host == "relay.example.org");
        assert(config.relay_port == 7000);
        assert(config.relay_channel == "lab");
        assert(config.relay_ping_interval == 0s);
        assert(config.relay_max_line_bytes == 4096);
        assert(config.relay_max_channel_members == 8);
        assert(!config.logging_enabled);
        assert(config.logging_level == "debug");
    }

    // Absent keys keep their current values.
    {
        meshstate::Config config{};
        config.relay_channel = "kept";
        meshstate::config::load_config_text(R"({"history": {"max_size": 5}})", config);
        assert(config.relay_channel == "kept");
        assert(config.history_max_size == 5);
    }

    assert(error_code("{") == "E_CONFIG_PARSE");
    assert(error_code("[]") == "E_CONFIG_STRUCTURE");
    assert(error_code(R"({"mesh": 3})") == "E_CONFIG_STRUCTURE");
    assert(error_code(R"({"mesh": {"local_id": "ABC"}})") == "E_CONFIG_VALUE");
    assert(error_code(R"({"mesh": {"negotiation_batch_delay_ms": "fast"}})") == "E_CONFIG_TYPE");
    assert(error_code(R"({"mesh": {"negotiation_batch_delay_ms": 120000}})") == "E_CONFIG_VALUE");
    assert(error_code(R"({"mesh": {"ice_servers": ["http://example.org"]}})") == "E_CONFIG_VALUE");
    assert(error_code(R"({"mesh": {"ice_servers": [{"username": "u"}]}})") == "E_CONFIG_STRUCTURE");
    assert(error_code(R"({"history": {"max_size": 0}})") == "E_CONFIG_VALUE");
    assert(error_code(R"({"relay": {"port": 70000}})") == "E_CONFIG_VALUE");
    assert(error_code(R"({"relay": {"channel": "a b"}})") == "E_CONFIG_VALUE");
    assert(error_code(R"({"relay": {"max_channel_members": -1}})") == "E_CONFIG_VALUE");
    assert(error_code(R"({"logging": {"enabled": "yes"}})") == "E_CONFIG_TYPE");
    assert(error_code(R"({"logging": {"level": "verbose"}})") == "E_CONFIG_VALUE");

    // Files.
    {
        const auto directory = std::filesystem::temp_directory_path() / "meshstate_config_test";
        std::filesystem::create_directories(directory);
        const auto path = directory / "meshstate.json";
        {
            std::ofstream out(path);
            out << R"({"relay": {"port": 8123}})";
        }
        meshstate::Config config{};
        meshstate::config::load_config_file(path, config);
        assert(config.relay_port == 8123);

        bool missing = false;
        try {
            meshstate::config::load_config_file(directory / "absent.json", config);
        } catch (const ConfigError& error) {
            missing = error.code == "E_CONFIG_NOT_FOUND" && !error.hint.empty();
        }
        assert(missing);

        std::filesystem::remove_all(directory);
    }

    return 0;
}
