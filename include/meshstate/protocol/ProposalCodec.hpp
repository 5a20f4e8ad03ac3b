#pragma once

#include "meshstate/consensus/NextState.hpp"

#include <string>
#include <string_view>

namespace meshstate::protocol {

// {"next": "...", "state": "...", "time": 3, "lottery": 0.42}
std::string encode_proposal(const consensus::Proposal& proposal);
bool decode_proposal(std::string_view payload, consensus::Proposal& out, std::string& error_message);

}  // namespace meshstate::protocol
