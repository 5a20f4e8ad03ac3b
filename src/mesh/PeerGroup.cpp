#include "meshstate/mesh/PeerGroup.hpp"

#include "meshstate/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace meshstate::mesh {

namespace {

using daemon::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace

std::string to_string(GroupError::Kind kind) {
    switch (kind) {
        case GroupError::Kind::MalformedRelayMessage:
            return "malformed_relay_message";
        case GroupError::Kind::Negotiation:
            return "negotiation";
        case GroupError::Kind::RelaySend:
            return "relay_send";
    }
    return "unknown";
}

PeerGroup::PeerGroup(core::Scheduler& scheduler, TransportFactory& transports, const Config& config)
    : scheduler_(scheduler),
      transports_(transports),
      local_id_(config.local_id.value_or(random_peer_id())),
      transport_config_(config.transport),
      batch_delay_(config.negotiation_batch_delay) {}

PeerGroup::~PeerGroup() {
    leave();
}

void PeerGroup::join(SignalingChannel& channel) {
    detach();
    channel_ = &channel;
    channel.set_message_handler([this](const std::string& payload) {
        handle_relay_message(payload);
    });
    channel.set_state_handler([this](SignalingChannel::State state) {
        handle_channel_state(state);
    });

    if (channel.ready_state() == SignalingChannel::State::Open) {
        handle_channel_state(SignalingChannel::State::Open);
    }
}

void PeerGroup::leave() {
    auto peers = std::move(peers_);
    peers_.clear();
    for (const auto& peer : peers) {
        peer->clear_handlers();
        peer->close();
    }

    if (flush_timer_) {
        scheduler_.cancel(*flush_timer_);
        flush_timer_.reset();
    }
    outbox_.clear();
    detach();
}

void PeerGroup::detach() {
    if (!channel_) {
        return;
    }
    auto* channel = channel_;
    channel_ = nullptr;
    channel->set_message_handler(nullptr);
    channel->set_state_handler(nullptr);
}

void PeerGroup::handle_channel_state(SignalingChannel::State state) {
    switch (state) {
        case SignalingChannel::State::Open:
            log_event(StructuredLogger::Level::Info, "mesh.relay.open", {{"local", local_id_}});
            negotiate(std::nullopt);
            break;
        case SignalingChannel::State::Closing:
        case SignalingChannel::State::Closed:
            log_event(StructuredLogger::Level::Info, "mesh.relay.detached", {{"local", local_id_}});
            detach();
            break;
        case SignalingChannel::State::Connecting:
            break;
    }
}

void PeerGroup::negotiate(std::optional<PeerId> remote, protocol::NegotiationParams params) {
    protocol::NegotiationEnvelope envelope{};
    envelope.from = local_id_;
    envelope.to = std::move(remote);
    envelope.params = std::move(params);
    outbox_.push_back(std::move(envelope));

    if (outbox_.size() == 1) {
        flush_timer_ = scheduler_.schedule_after(batch_delay_, [this]() {
            flush_timer_.reset();
            flush_outbox();
        });
    }
}

void PeerGroup::flush_outbox() {
    auto batch = std::move(outbox_);
    outbox_.clear();
    if (batch.empty()) {
        return;
    }

    const auto payload = protocol::encode_batch(batch);
    if (!channel_) {
        log_event(StructuredLogger::Level::Warning,
                  "mesh.relay.send_failed",
                  {{"reason", "not attached"}, {"envelopes", std::to_string(batch.size())}});
        report(GroupError{GroupError::Kind::RelaySend, std::nullopt, "Signaling channel not attached"});
        return;
    }

    try {
        channel_->send(payload);
    } catch (const TransportError& error) {
        log_event(StructuredLogger::Level::Warning,
                  "mesh.relay.send_failed",
                  {{"reason", error.what()}, {"envelopes", std::to_string(batch.size())}});
        report(GroupError{GroupError::Kind::RelaySend, std::nullopt, error.what()});
    }
}

void PeerGroup::handle_relay_message(const std::string& payload) {
    std::vector<protocol::NegotiationEnvelope> envelopes;
    std::string error_message;
    std::vector<std::string> skipped;
    if (!protocol::decode_batch(payload, envelopes, error_message, &skipped)) {
        log_event(StructuredLogger::Level::Warning,
                  "mesh.relay.malformed",
                  {{"error", error_message}, {"bytes", std::to_string(payload.size())}});
        report(GroupError{GroupError::Kind::MalformedRelayMessage, std::nullopt, error_message});
        return;
    }
    for (const auto& reason : skipped) {
        log_event(StructuredLogger::Level::Warning, "mesh.relay.envelope_skipped", {{"error", reason}});
    }

    for (const auto& envelope : envelopes) {
        const bool addressed = !envelope.to || *envelope.to == local_id_;
        if (!addressed || !is_valid_peer_id(envelope.from) || envelope.from == local_id_) {
            continue;
        }
        handle_peer(envelope.from, envelope.params);
    }
}

void PeerGroup::handle_peer(const PeerId& remote, const protocol::NegotiationParams& params) {
    if (auto peer = get_peer(remote)) {
        peer->negotiate(params);
        return;
    }
    add_peer(remote, params.description);
}

std::shared_ptr<PeerConnection> PeerGroup::add_peer(const PeerId& remote,
                                                    std::optional<protocol::SessionDescription> description) {
    if (auto existing = get_peer(remote)) {
        log_event(StructuredLogger::Level::Warning, "mesh.peer.duplicate", {{"remote", remote}});
        return existing;
    }

    auto peer = std::make_shared<PeerConnection>(local_id_,
                                                 remote,
                                                 transports_.create(transport_config_),
                                                 transport_config_.data_channel_label);
    peer->set_open_handler([this](PeerConnection& link) {
        handle_peer_open(link);
    });
    peer->set_close_handler([this](PeerConnection& link) {
        handle_peer_close(link);
    });
    peer->set_message_handler([this](PeerConnection& link, const std::string& message) {
        if (auto handler = message_handler_) {
            handler(link, message);
        }
    });
    peer->set_negotiate_handler([this](PeerConnection& link, const protocol::NegotiationParams& params) {
        negotiate(link.remote_id(), params);
    });
    peer->set_error_handler([this](PeerConnection& link, const std::string& detail) {
        report(GroupError{GroupError::Kind::Negotiation, link.remote_id(), detail});
    });

    peers_.push_back(peer);
    log_event(StructuredLogger::Level::Debug,
              "mesh.peer.added",
              {{"remote", remote}, {"initiator", description ? "remote" : "local"}});
    peer->start(std::move(description));
    return peer;
}

std::shared_ptr<PeerConnection> PeerGroup::get_peer(const PeerId& remote) const {
    const auto it = std::find_if(peers_.begin(), peers_.end(), [&](const auto& peer) {
        return peer->remote_id() == remote;
    });
    return it == peers_.end() ? nullptr : *it;
}

void PeerGroup::remove_peer(const PeerId& remote) {
    const auto it = std::find_if(peers_.begin(), peers_.end(), [&](const auto& peer) {
        return peer->remote_id() == remote;
    });
    if (it == peers_.end()) {
        return;
    }
    auto peer = *it;
    peers_.erase(it);
    peer->clear_handlers();
    peer->close();
}

void PeerGroup::send(const std::string& message) {
    const auto peers = peers_;
    for (const auto& peer : peers) {
        try {
            peer->send(message);
        } catch (const TransportError& error) {
            log_event(StructuredLogger::Level::Info,
                      "mesh.peer.send_skipped",
                      {{"remote", peer->remote_id()}, {"reason", error.what()}});
        }
    }
}

void PeerGroup::set_peer_join_handler(PeerHandler handler) {
    peer_join_handler_ = std::move(handler);
}

void PeerGroup::set_peer_leave_handler(PeerHandler handler) {
    peer_leave_handler_ = std::move(handler);
}

void PeerGroup::set_message_handler(MessageHandler handler) {
    message_handler_ = std::move(handler);
}

void PeerGroup::set_error_handler(ErrorHandler handler) {
    error_handler_ = std::move(handler);
}

void PeerGroup::handle_peer_open(PeerConnection& peer) {
    log_event(StructuredLogger::Level::Info, "mesh.peer.join", {{"remote", peer.remote_id()}});
    if (auto handler = peer_join_handler_) {
        handler(peer);
    }
}

void PeerGroup::handle_peer_close(PeerConnection& peer) {
    auto keep_alive = peer.shared_from_this();
    remove_peer(peer.remote_id());
    log_event(StructuredLogger::Level::Info, "mesh.peer.leave", {{"remote", peer.remote_id()}});
    if (auto handler = peer_leave_handler_) {
        handler(peer);
    }
}

void PeerGroup::report(GroupError error) {
    if (auto handler = error_handler_) {
        handler(error);
    }
}

}  // namespace meshstate::mesh
