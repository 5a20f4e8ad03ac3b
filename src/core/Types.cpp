#include "meshstate/Types.hpp"

#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace meshstate {

namespace {

constexpr std::array<std::size_t, 4> kDashPositions{8, 13, 18, 23};
constexpr std::size_t kPeerIdLength = 36;

bool is_dash_position(std::size_t index) {
    for (const auto position : kDashPositions) {
        if (position == index) {
            return true;
        }
    }
    return false;
}

std::string to_hex(const std::uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return oss.str();
}

}  // namespace

bool is_valid_peer_id(std::string_view text) {
    if (text.size() != kPeerIdLength) {
        return false;
    }
    for (std::size_t index = 0; index < text.size(); ++index) {
        const char ch = text[index];
        if (is_dash_position(index)) {
            if (ch != '-') {
                return false;
            }
            continue;
        }
        const bool digit = ch >= '0' && ch <= '9';
        const bool lower_hex = ch >= 'a' && ch <= 'f';
        if (!digit && !lower_hex) {
            return false;
        }
    }
    return true;
}

PeerId random_peer_id() {
    std::random_device device;
    std::mt19937_64 generator{(static_cast<std::uint64_t>(device()) << 32) ^ device()};
    return random_peer_id(generator);
}

PeerId random_peer_id(std::mt19937_64& generator) {
    std::uniform_int_distribution<int> distribution(0, 0xFF);
    std::array<std::uint8_t, 16> bytes{};
    for (auto& byte : bytes) {
        byte = static_cast<std::uint8_t>(distribution(generator));
    }
    // Version 4, RFC 4122 variant.
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string text;
    text.reserve(kPeerIdLength);
    for (std::size_t index = 0; index < bytes.size(); ++index) {
        if (index == 4 || index == 6 || index == 8 || index == 10) {
            text.push_back('-');
        }
        text.append(to_hex(bytes[index]));
    }
    return text;
}

}
