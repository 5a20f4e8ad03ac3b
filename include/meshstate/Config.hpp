#pragma once

#include "meshstate/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshstate {

struct IceServer {
    std::vector<std::string> urls;
    std::optional<std::string> username{};
    std::optional<std::string> credential{};
};

struct TransportConfig {
    std::vector<IceServer> ice_servers{IceServer{{"stun:stunserver.stunprotocol.org:3478"}}};
    std::string data_channel_label{"meshstate"};
};

struct Config {
    std::optional<PeerId> local_id{};
    std::chrono::milliseconds negotiation_batch_delay{100};
    TransportConfig transport{};
    std::size_t history_max_size{256};
    std::string relay_host{"127.0.0.1"};
    std::uint16_t relay_port{9750};
    std::string relay_channel{"lobby"};
    std::chrono::seconds relay_ping_interval{std::chrono::seconds(30)};
    std::size_t relay_max_line_bytes{256u * 1024u};
    std::size_t relay_max_channel_members{0};
    bool logging_enabled{true};
    std::string logging_level{"info"};
};

}  // namespace meshstate
