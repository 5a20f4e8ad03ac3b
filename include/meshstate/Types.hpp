#pragma once

#include <random>
#include <string>
#include <string_view>

namespace meshstate {

// Lowercase UUID text, e.g. "3f2b8c1e-9a4d-4c2e-8f1a-0b6d2e7c9a51".
using PeerId = std::string;

bool is_valid_peer_id(std::string_view text);
PeerId random_peer_id();
PeerId random_peer_id(std::mt19937_64& generator);

}  // namespace meshstate
