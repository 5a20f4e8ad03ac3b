#pragma once

#include "meshstate/Config.hpp"
#include "meshstate/Types.hpp"
#include "meshstate/core/Scheduler.hpp"
#include "meshstate/mesh/PeerConnection.hpp"
#include "meshstate/mesh/SignalingChannel.hpp"
#include "meshstate/mesh/Transport.hpp"
#include "meshstate/protocol/Negotiation.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshstate::mesh {

struct GroupError {
    enum class Kind {
        MalformedRelayMessage,
        Negotiation,
        RelaySend
    };

    Kind kind{Kind::MalformedRelayMessage};
    std::optional<PeerId> peer{};
    std::string detail;
};

std::string to_string(GroupError::Kind kind);

/**
 * Fully connected group of peers. Presence announcements and connection
 * parameters travel over a signaling channel in batches; application data
 * flows over the peer links.
 *
 * Losing the signaling channel detaches from it but leaves established links
 * running. Use leave() to drop the whole group.
 */
class PeerGroup {
public:
    using PeerHandler = std::function<void(PeerConnection&)>;
    using MessageHandler = std::function<void(PeerConnection&, const std::string&)>;
    using ErrorHandler = std::function<void(const GroupError&)>;

    PeerGroup(core::Scheduler& scheduler, TransportFactory& transports, const Config& config = {});
    ~PeerGroup();

    PeerGroup(const PeerGroup&) = delete;
    PeerGroup& operator=(const PeerGroup&) = delete;

    const PeerId& local_id() const noexcept { return local_id_; }

    // Attaches to the channel and announces presence once it is open.
    void join(SignalingChannel& channel);
    void leave();
    bool attached() const noexcept { return channel_ != nullptr; }

    // Queues parameters for `remote` (broadcast when empty). The first queued
    // item arms the flush timer; the whole queue goes out as one message.
    void negotiate(std::optional<PeerId> remote, protocol::NegotiationParams params = {});
    std::size_t pending_negotiations() const noexcept { return outbox_.size(); }

    void handle_relay_message(const std::string& payload);

    std::shared_ptr<PeerConnection> add_peer(const PeerId& remote,
                                             std::optional<protocol::SessionDescription> description = std::nullopt);
    std::shared_ptr<PeerConnection> get_peer(const PeerId& remote) const;
    void remove_peer(const PeerId& remote);
    const std::vector<std::shared_ptr<PeerConnection>>& peers() const noexcept { return peers_; }

    // Peers whose channel is not open yet are skipped.
    void send(const std::string& message);

    void set_peer_join_handler(PeerHandler handler);
    void set_peer_leave_handler(PeerHandler handler);
    void set_message_handler(MessageHandler handler);
    void set_error_handler(ErrorHandler handler);

private:
    void detach();
    void handle_channel_state(SignalingChannel::State state);
    void handle_peer(const PeerId& remote, const protocol::NegotiationParams& params);
    void handle_peer_open(PeerConnection& peer);
    void handle_peer_close(PeerConnection& peer);
    void flush_outbox();
    void report(GroupError error);

    core::Scheduler& scheduler_;
    TransportFactory& transports_;
    PeerId local_id_;
    TransportConfig transport_config_;
    std::chrono::milliseconds batch_delay_;

    SignalingChannel* channel_{nullptr};
    std::vector<std::shared_ptr<PeerConnection>> peers_;
    std::vector<protocol::NegotiationEnvelope> outbox_;
    std::optional<core::Scheduler::TimerId> flush_timer_;

    PeerHandler peer_join_handler_;
    PeerHandler peer_leave_handler_;
    MessageHandler message_handler_;
    ErrorHandler error_handler_;
};

}  // namespace meshstate::mesh
