#pragma once

#include "meshstate/Config.hpp"
#include "meshstate/protocol/Negotiation.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace meshstate::mesh {

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SignalingState {
    Stable,
    HaveLocalOffer,
    HaveRemoteOffer,
    Closed
};

enum class IceConnectionState {
    New,
    Checking,
    Connected,
    Disconnected,
    Failed,
    Closed
};

enum class ChannelState {
    Connecting,
    Open,
    Closing,
    Closed
};

std::string to_string(SignalingState state);
std::string to_string(IceConnectionState state);
std::string to_string(ChannelState state);

// Message channel riding on a peer transport.
class DataChannel {
public:
    using StateHandler = std::function<void()>;
    using MessageHandler = std::function<void(const std::string&)>;

    virtual ~DataChannel() = default;

    virtual const std::string& label() const = 0;
    virtual ChannelState ready_state() const = 0;

    // Throws TransportError unless the channel is open.
    virtual void send(const std::string& message) = 0;
    virtual void close() = 0;

    virtual void set_open_handler(StateHandler handler) = 0;
    virtual void set_closing_handler(StateHandler handler) = 0;
    virtual void set_message_handler(MessageHandler handler) = 0;
};

/**
 * Peer-to-peer connection establishment primitive: session descriptions,
 * ICE candidates, and data channels. Completions are delivered asynchronously;
 * an empty error means success.
 */
class PeerTransport {
public:
    using Completion = std::function<void(std::optional<std::string> error)>;
    using IceCandidateHandler = std::function<void(const protocol::IceCandidate&)>;
    using NegotiationNeededHandler = std::function<void()>;
    using IceStateHandler = std::function<void(IceConnectionState)>;
    using DataChannelHandler = std::function<void(std::shared_ptr<DataChannel>)>;

    virtual ~PeerTransport() = default;

    virtual void set_ice_candidate_handler(IceCandidateHandler handler) = 0;
    virtual void set_negotiation_needed_handler(NegotiationNeededHandler handler) = 0;
    virtual void set_ice_state_handler(IceStateHandler handler) = 0;
    virtual void set_data_channel_handler(DataChannelHandler handler) = 0;

    virtual SignalingState signaling_state() const = 0;
    virtual IceConnectionState ice_connection_state() const = 0;
    virtual std::optional<protocol::SessionDescription> local_description() const = 0;

    // Creates an offer or answer depending on the signaling state.
    virtual void set_local_description(Completion done) = 0;
    virtual void set_remote_description(const protocol::SessionDescription& description, Completion done) = 0;
    virtual void add_ice_candidate(const protocol::IceCandidate& candidate, Completion done) = 0;

    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label) = 0;
    // Returns false when the restart cannot be performed.
    virtual bool restart_ice() = 0;
    virtual void close() = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;
    virtual std::unique_ptr<PeerTransport> create(const TransportConfig& config) = 0;
};

}  // namespace meshstate::mesh
