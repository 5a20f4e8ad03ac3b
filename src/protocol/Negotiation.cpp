#include "meshstate/protocol/Negotiation.hpp"

#include "meshstate/protocol/Json.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace meshstate::protocol {

namespace {

JsonValue candidate_to_json(const IceCandidate& candidate) {
    auto object = JsonValue::make_object();
    object.set("candidate", JsonValue::make_string(candidate.candidate));
    if (candidate.sdp_mid) {
        object.set("sdpMid", JsonValue::make_string(*candidate.sdp_mid));
    }
    if (candidate.sdp_mline_index) {
        object.set("sdpMLineIndex", JsonValue::make_number(static_cast<double>(*candidate.sdp_mline_index)));
    }
    return object;
}

JsonValue description_to_json(const SessionDescription& description) {
    auto object = JsonValue::make_object();
    object.set("type", JsonValue::make_string(std::string(to_string(description.type))));
    object.set("sdp", JsonValue::make_string(description.sdp));
    return object;
}

bool is_absent(const JsonValue* value) {
    return value == nullptr || value->is_null();
}

bool candidate_from_json(const JsonValue& value, IceCandidate& out, std::string& error_message) {
    if (!value.is_object()) {
        error_message = "candidate must be an object";
        return false;
    }
    const auto text = string_field(value, "candidate");
    if (!text) {
        error_message = "candidate.candidate must be a string";
        return false;
    }
    out.candidate = *text;

    const auto* mid = value.find("sdpMid");
    if (!is_absent(mid)) {
        if (!mid->is_string()) {
            error_message = "candidate.sdpMid must be a string";
            return false;
        }
        out.sdp_mid = mid->string_value;
    }

    const auto* index = value.find("sdpMLineIndex");
    if (!is_absent(index)) {
        constexpr double kMaxIndex = static_cast<double>(std::numeric_limits<std::uint32_t>::max());
        if (!index->is_number() || index->number_value < 0 || index->number_value > kMaxIndex ||
            std::floor(index->number_value) != index->number_value) {
            error_message = "candidate.sdpMLineIndex must be an integer between 0 and 4294967295";
            return false;
        }
        out.sdp_mline_index = static_cast<std::uint32_t>(index->number_value);
    }
    return true;
}

bool description_from_json(const JsonValue& value, SessionDescription& out, std::string& error_message) {
    if (!value.is_object()) {
        error_message = "description must be an object";
        return false;
    }
    const auto type_text = string_field(value, "type");
    const auto type = type_text ? parse_description_type(*type_text) : std::nullopt;
    if (!type) {
        error_message = "description.type must be offer, answer, pranswer or rollback";
        return false;
    }
    out.type = *type;

    const auto* sdp = value.find("sdp");
    if (!is_absent(sdp)) {
        if (!sdp->is_string()) {
            error_message = "description.sdp must be a string";
            return false;
        }
        out.sdp = sdp->string_value;
    }
    return true;
}

}  // namespace

std::string_view to_string(SessionDescription::Type type) {
    switch (type) {
        case SessionDescription::Type::Offer:
            return "offer";
        case SessionDescription::Type::Answer:
            return "answer";
        case SessionDescription::Type::Pranswer:
            return "pranswer";
        case SessionDescription::Type::Rollback:
            return "rollback";
    }
    return "offer";
}

std::optional<SessionDescription::Type> parse_description_type(std::string_view text) {
    if (text == "offer") {
        return SessionDescription::Type::Offer;
    }
    if (text == "answer") {
        return SessionDescription::Type::Answer;
    }
    if (text == "pranswer") {
        return SessionDescription::Type::Pranswer;
    }
    if (text == "rollback") {
        return SessionDescription::Type::Rollback;
    }
    return std::nullopt;
}

std::string encode_batch(const std::vector<NegotiationEnvelope>& envelopes) {
    auto batch = JsonValue::make_array();
    for (const auto& envelope : envelopes) {
        auto object = JsonValue::make_object();
        object.set("from", JsonValue::make_string(envelope.from));
        if (envelope.to) {
            object.set("to", JsonValue::make_string(*envelope.to));
        }
        if (envelope.params.candidate) {
            object.set("candidate", candidate_to_json(*envelope.params.candidate));
        }
        if (envelope.params.description) {
            object.set("description", description_to_json(*envelope.params.description));
        }
        batch.push_back(std::move(object));
    }
    return serialize_json(batch);
}

namespace {

bool envelope_from_json(const JsonValue& item, NegotiationEnvelope& envelope, std::string& error_message) {
    if (!item.is_object()) {
        error_message = "negotiation envelope must be an object";
        return false;
    }
    if (const auto from = string_field(item, "from")) {
        envelope.from = *from;
    }

    const auto* to = item.find("to");
    if (!is_absent(to)) {
        if (!to->is_string()) {
            error_message = "envelope.to must be a string";
            return false;
        }
        envelope.to = to->string_value;
    }

    const auto* candidate = item.find("candidate");
    if (!is_absent(candidate)) {
        IceCandidate parsed{};
        if (!candidate_from_json(*candidate, parsed, error_message)) {
            return false;
        }
        envelope.params.candidate = std::move(parsed);
    }

    const auto* description = item.find("description");
    if (!is_absent(description)) {
        SessionDescription parsed{};
        if (!description_from_json(*description, parsed, error_message)) {
            return false;
        }
        envelope.params.description = std::move(parsed);
    }
    return true;
}

}  // namespace

bool decode_batch(std::string_view payload,
                  std::vector<NegotiationEnvelope>& envelopes,
                  std::string& error_message,
                  std::vector<std::string>* skipped) {
    JsonValue root;
    try {
        root = parse_json(payload);
    } catch (const JsonError& error) {
        error_message = error.what();
        return false;
    }

    if (!root.is_array()) {
        error_message = "negotiation batch must be a JSON array";
        return false;
    }

    std::vector<NegotiationEnvelope> decoded;
    decoded.reserve(root.array_value.size());
    for (std::size_t i = 0; i < root.array_value.size(); ++i) {
        NegotiationEnvelope envelope{};
        std::string reason;
        if (!envelope_from_json(root.array_value[i], envelope, reason)) {
            if (skipped) {
                skipped->push_back("envelope " + std::to_string(i) + ": " + reason);
            }
            continue;
        }
        decoded.push_back(std::move(envelope));
    }

    envelopes = std::move(decoded);
    return true;
}

}  // namespace meshstate::protocol
