#pragma once

#include "meshstate/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meshstate::protocol {

struct SessionDescription {
    enum class Type {
        Offer,
        Answer,
        Pranswer,
        Rollback
    };

    Type type{Type::Offer};
    std::string sdp;

    bool operator==(const SessionDescription& other) const = default;
};

struct IceCandidate {
    std::string candidate;
    std::optional<std::string> sdp_mid{};
    std::optional<std::uint32_t> sdp_mline_index{};

    bool operator==(const IceCandidate& other) const = default;
};

// Connection parameters handed from a peer link to the relay. Both members
// empty means "announce presence".
struct NegotiationParams {
    std::optional<IceCandidate> candidate{};
    std::optional<SessionDescription> description{};
};

struct NegotiationEnvelope {
    PeerId from;
    std::optional<PeerId> to{};
    NegotiationParams params{};
};

std::string_view to_string(SessionDescription::Type type);
std::optional<SessionDescription::Type> parse_description_type(std::string_view text);

// One relay message carries a JSON array of envelopes:
// [{"from": id, "to"?: id, "candidate"?: {...}, "description"?: {...}}, ...]
std::string encode_batch(const std::vector<NegotiationEnvelope>& envelopes);
// Fails only when the payload is not a JSON array. Envelopes with a wrongly
// typed member are left out and described in `skipped` when it is given.
bool decode_batch(std::string_view payload,
                  std::vector<NegotiationEnvelope>& envelopes,
                  std::string& error_message,
                  std::vector<std::string>* skipped = nullptr);

}  // namespace meshstate::protocol
