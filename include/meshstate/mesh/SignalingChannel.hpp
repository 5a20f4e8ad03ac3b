#pragma once

#include <functional>
#include <string>

namespace meshstate::mesh {

// Out-of-band broadcast channel used only to exchange negotiation parameters.
class SignalingChannel {
public:
    enum class State {
        Connecting,
        Open,
        Closing,
        Closed
    };

    using MessageHandler = std::function<void(const std::string& payload)>;
    using StateHandler = std::function<void(State state)>;

    virtual ~SignalingChannel() = default;

    virtual State ready_state() const = 0;
    // Throws mesh::TransportError when the channel is not open.
    virtual void send(const std::string& payload) = 0;

    // Passing an empty handler detaches.
    virtual void set_message_handler(MessageHandler handler) = 0;
    virtual void set_state_handler(StateHandler handler) = 0;
};

}  // namespace meshstate::mesh
