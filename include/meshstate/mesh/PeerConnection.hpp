#pragma once

#include "meshstate/Types.hpp"
#include "meshstate/mesh/Transport.hpp"
#include "meshstate/protocol/Negotiation.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace meshstate::mesh {

/**
 * Data channel between the local peer and one remote peer. Negotiation
 * parameters produced here must be carried to the remote out of band; the
 * `negotiate` handler hands them to the owner for delivery.
 *
 * Collisions are resolved with perfect negotiation: the side whose id sorts
 * higher is polite and yields, the other ignores colliding offers.
 */
class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
    using EventHandler = std::function<void(PeerConnection&)>;
    using MessageHandler = std::function<void(PeerConnection&, const std::string&)>;
    using NegotiateHandler = std::function<void(PeerConnection&, const protocol::NegotiationParams&)>;
    using ErrorHandler = std::function<void(PeerConnection&, const std::string&)>;

    PeerConnection(PeerId local_id,
                   PeerId remote_id,
                   std::unique_ptr<PeerTransport> transport,
                   std::string channel_label);
    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    // Call once the instance is owned by a shared_ptr. Without an initial
    // description this side creates the data channel; with one it applies the
    // description and waits for the remote's channel.
    void start(std::optional<protocol::SessionDescription> initial_description = std::nullopt);

    void negotiate(const protocol::NegotiationParams& params);

    // Throws TransportError when there is no open data channel.
    void send(const std::string& message);

    // Releases channel and transport. Raises no events; safe to call twice.
    void close();

    const PeerId& local_id() const noexcept { return local_id_; }
    const PeerId& remote_id() const noexcept { return remote_id_; }
    bool polite() const noexcept { return polite_; }
    bool making_offer() const noexcept { return making_offer_; }
    bool ignore_offer() const noexcept { return ignore_offer_; }
    bool closed() const noexcept { return !transport_; }
    std::optional<ChannelState> ready_state() const;
    std::optional<SignalingState> signaling_state() const;

    void set_open_handler(EventHandler handler);
    void set_close_handler(EventHandler handler);
    void set_message_handler(MessageHandler handler);
    void set_negotiate_handler(NegotiateHandler handler);
    void set_error_handler(ErrorHandler handler);
    void clear_handlers();

private:
    void adopt_channel(std::shared_ptr<DataChannel> channel);
    void close_channel();
    void close_transport();

    void handle_negotiation_needed();
    void handle_ice_state(IceConnectionState state);
    void handle_channel_open();
    void handle_channel_closing();
    void handle_channel_message(const std::string& message);

    void send_out_of_band(protocol::NegotiationParams params);
    void report_error(const std::string& operation, const std::string& detail);

    PeerId local_id_;
    PeerId remote_id_;
    bool polite_{false};
    bool making_offer_{false};
    bool ignore_offer_{false};
    std::string channel_label_;

    std::unique_ptr<PeerTransport> transport_;
    std::shared_ptr<DataChannel> channel_;

    EventHandler open_handler_;
    EventHandler close_handler_;
    MessageHandler message_handler_;
    NegotiateHandler negotiate_handler_;
    ErrorHandler error_handler_;
};

}  // namespace meshstate::mesh
