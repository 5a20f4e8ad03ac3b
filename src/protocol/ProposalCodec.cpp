#include "meshstate/protocol/ProposalCodec.hpp"

#include "meshstate/protocol/Json.hpp"

#include <cmath>

namespace meshstate::protocol {

std::string encode_proposal(const consensus::Proposal& proposal) {
    auto object = JsonValue::make_object();
    object.set("next", JsonValue::make_string(proposal.next));
    object.set("state", JsonValue::make_string(proposal.state));
    object.set("time", JsonValue::make_number(static_cast<double>(proposal.time)));
    object.set("lottery", JsonValue::make_number(proposal.lottery));
    return serialize_json(object);
}

bool decode_proposal(std::string_view payload, consensus::Proposal& out, std::string& error_message) {
    JsonValue root;
    try {
        root = parse_json(payload);
    } catch (const JsonError& error) {
        error_message = error.what();
        return false;
    }
    if (!root.is_object()) {
        error_message = "proposal must be a JSON object";
        return false;
    }

    const auto next = string_field(root, "next");
    const auto state = string_field(root, "state");
    if (!next || !state) {
        error_message = "proposal requires string fields next and state";
        return false;
    }

    const auto time = number_field(root, "time");
    constexpr double kMaxExactInteger = 9007199254740992.0;
    if (!time || *time < 0 || *time > kMaxExactInteger || std::floor(*time) != *time) {
        error_message = "proposal time must be a non-negative integer";
        return false;
    }

    const auto lottery = number_field(root, "lottery");
    if (!lottery || !std::isfinite(*lottery)) {
        error_message = "proposal lottery must be a number";
        return false;
    }

    out.next = *next;
    out.state = *state;
    out.time = static_cast<std::uint64_t>(*time);
    out.lottery = *lottery;
    return true;
}

}  // namespace meshstate::protocol
