#include "meshstate/mesh/Transport.hpp"

namespace meshstate::mesh {

std::string to_string(SignalingState state) {
    switch (state) {
        case SignalingState::Stable:
            return "stable";
        case SignalingState::HaveLocalOffer:
            return "have-local-offer";
        case SignalingState::HaveRemoteOffer:
            return "have-remote-offer";
        case SignalingState::Closed:
            return "closed";
    }
    return "closed";
}

std::string to_string(IceConnectionState state) {
    switch (state) {
        case IceConnectionState::New:
            return "new";
        case IceConnectionState::Checking:
            return "checking";
        case IceConnectionState::Connected:
            return "connected";
        case IceConnectionState::Disconnected:
            return "disconnected";
        case IceConnectionState::Failed:
            return "failed";
        case IceConnectionState::Closed:
            return "closed";
    }
    return "closed";
}

std::string to_string(ChannelState state) {
    switch (state) {
        case ChannelState::Connecting:
            return "connecting";
        case ChannelState::Open:
            return "open";
        case ChannelState::Closing:
            return "closing";
        case ChannelState::Closed:
            return "closed";
    }
    return "closed";
}

}  // namespace meshstate::mesh
