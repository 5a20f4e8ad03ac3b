#include "meshstate/mesh/PeerConnection.hpp"

#include "meshstate/daemon/StructuredLogger.hpp"

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

PeerConnection::PeerConnection(PeerId local_id,
                               PeerId remote_id,
                               std::unique_ptr<PeerTransport> transport,
                               std::string channel_label)
    : local_id_(std::move(local_id)),
      remote_id_(std::move(remote_id)),
      polite_(local_id_ > remote_id_),
      channel_label_(std::move(channel_label)),
      transport_(std::move(transport)) {
    if (!transport_) {
        throw TransportError("PeerConnection requires a transport");
    }
}

PeerConnection::~PeerConnection() {
    close();
}

void PeerConnection::start(std::optional<protocol::SessionDescription> initial_description) {
    if (!transport_) {
        return;
    }
    std::weak_ptr<PeerConnection> weak = weak_from_this();

    transport_->set_ice_candidate_handler([weak](const protocol::IceCandidate& candidate) {
        if (auto self = weak.lock()) {
            protocol::NegotiationParams params{};
            params.candidate = candidate;
            self->send_out_of_band(std::move(params));
        }
    });
    transport_->set_negotiation_needed_handler([weak]() {
        if (auto self = weak.lock()) {
            self->handle_negotiation_needed();
        }
    });
    transport_->set_ice_state_handler([weak](IceConnectionState state) {
        if (auto self = weak.lock()) {
            self->handle_ice_state(state);
        }
    });

    if (initial_description) {
        transport_->set_data_channel_handler([weak](std::shared_ptr<DataChannel> channel) {
            if (auto self = weak.lock()) {
                self->adopt_channel(std::move(channel));
            }
        });
        protocol::NegotiationParams params{};
        params.description = std::move(*initial_description);
        negotiate(params);
    } else {
        adopt_channel(transport_->create_data_channel(channel_label_));
    }
}

void PeerConnection::negotiate(const protocol::NegotiationParams& params) {
    if (!transport_) {
        return;
    }
    std::weak_ptr<PeerConnection> weak = weak_from_this();

    if (params.description) {
        const auto& description = *params.description;
        const bool is_offer = description.type == protocol::SessionDescription::Type::Offer;
        const bool offer_collision =
            is_offer && (making_offer_ || transport_->signaling_state() != SignalingState::Stable);

        ignore_offer_ = !polite_ && offer_collision;
        if (ignore_offer_) {
            log_event(StructuredLogger::Level::Info,
                      "mesh.negotiation.offer_ignored",
                      {{"local", local_id_}, {"remote", remote_id_}});
            return;
        }

        transport_->set_remote_description(description, [weak, is_offer](std::optional<std::string> error) {
            auto self = weak.lock();
            if (!self || !self->transport_) {
                return;
            }
            if (error) {
                self->report_error("set_remote_description", *error);
                return;
            }
            if (!is_offer) {
                return;
            }
            self->transport_->set_local_description([weak](std::optional<std::string> answer_error) {
                auto inner = weak.lock();
                if (!inner || !inner->transport_) {
                    return;
                }
                if (answer_error) {
                    inner->report_error("set_local_description", *answer_error);
                    return;
                }
                if (auto local = inner->transport_->local_description()) {
                    protocol::NegotiationParams answer{};
                    answer.description = std::move(*local);
                    inner->send_out_of_band(std::move(answer));
                }
            });
        });
        return;
    }

    if (params.candidate) {
        const bool ignoring = ignore_offer_;
        transport_->add_ice_candidate(*params.candidate, [weak, ignoring](std::optional<std::string> error) {
            auto self = weak.lock();
            if (!self || !error) {
                return;
            }
            if (ignoring) {
                log_event(StructuredLogger::Level::Debug,
                          "mesh.negotiation.candidate_dropped",
                          {{"remote", self->remote_id_}, {"error", *error}});
                return;
            }
            self->report_error("add_ice_candidate", *error);
        });
    }
}

void PeerConnection::send(const std::string& message) {
    if (!channel_) {
        throw TransportError("No data channel to " + remote_id_);
    }
    channel_->send(message);
}

void PeerConnection::close() {
    close_channel();
    close_transport();
}

std::optional<ChannelState> PeerConnection::ready_state() const {
    if (!channel_) {
        return std::nullopt;
    }
    return channel_->ready_state();
}

std::optional<SignalingState> PeerConnection::signaling_state() const {
    if (!transport_) {
        return std::nullopt;
    }
    return transport_->signaling_state();
}

void PeerConnection::set_open_handler(EventHandler handler) {
    open_handler_ = std::move(handler);
}

void PeerConnection::set_close_handler(EventHandler handler) {
    close_handler_ = std::move(handler);
}

void PeerConnection::set_message_handler(MessageHandler handler) {
    message_handler_ = std::move(handler);
}

void PeerConnection::set_negotiate_handler(NegotiateHandler handler) {
    negotiate_handler_ = std::move(handler);
}

void PeerConnection::set_error_handler(ErrorHandler handler) {
    error_handler_ = std::move(handler);
}

void PeerConnection::clear_handlers() {
    open_handler_ = nullptr;
    close_handler_ = nullptr;
    message_handler_ = nullptr;
    negotiate_handler_ = nullptr;
    error_handler_ = nullptr;
}

void PeerConnection::adopt_channel(std::shared_ptr<DataChannel> channel) {
    if (!channel) {
        return;
    }
    if (channel_) {
        log_event(StructuredLogger::Level::Warning,
                  "mesh.peer.extra_channel",
                  {{"remote", remote_id_}, {"label", channel->label()}});
        return;
    }

    channel_ = std::move(channel);
    std::weak_ptr<PeerConnection> weak = weak_from_this();
    channel_->set_open_handler([weak]() {
        if (auto self = weak.lock()) {
            self->handle_channel_open();
        }
    });
    channel_->set_closing_handler([weak]() {
        if (auto self = weak.lock()) {
            self->handle_channel_closing();
        }
    });
    channel_->set_message_handler([weak](const std::string& message) {
        if (auto self = weak.lock()) {
            self->handle_channel_message(message);
        }
    });
}

void PeerConnection::close_channel() {
    if (!channel_) {
        return;
    }
    auto channel = std::move(channel_);
    channel_.reset();
    channel->set_open_handler(nullptr);
    channel->set_closing_handler(nullptr);
    channel->set_message_handler(nullptr);
    channel->close();
}

void PeerConnection::close_transport() {
    if (!transport_) {
        return;
    }
    auto transport = std::move(transport_);
    transport_.reset();
    transport->set_ice_candidate_handler(nullptr);
    transport->set_negotiation_needed_handler(nullptr);
    transport->set_ice_state_handler(nullptr);
    transport->set_data_channel_handler(nullptr);
    transport->close();
}

void PeerConnection::handle_negotiation_needed() {
    if (!transport_) {
        return;
    }
    making_offer_ = true;
    std::weak_ptr<PeerConnection> weak = weak_from_this();
    transport_->set_local_description([weak](std::optional<std::string> error) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        if (!error && self->transport_) {
            if (auto local = self->transport_->local_description()) {
                protocol::NegotiationParams params{};
                params.description = std::move(*local);
                self->send_out_of_band(std::move(params));
            }
        } else if (error) {
            self->report_error("set_local_description", *error);
        }
        self->making_offer_ = false;
    });
}

void PeerConnection::handle_ice_state(IceConnectionState state) {
    if (state != IceConnectionState::Failed || !transport_) {
        return;
    }
    log_event(StructuredLogger::Level::Warning,
              "mesh.peer.ice_failed",
              {{"remote", remote_id_}});
    if (transport_->restart_ice()) {
        return;
    }

    auto self = shared_from_this();
    close();
    if (auto handler = close_handler_) {
        handler(*this);
    }
}

void PeerConnection::handle_channel_open() {
    if (auto handler = open_handler_) {
        handler(*this);
    }
}

void PeerConnection::handle_channel_closing() {
    auto self = shared_from_this();
    close();
    if (auto handler = close_handler_) {
        handler(*this);
    }
}

void PeerConnection::handle_channel_message(const std::string& message) {
    if (auto handler = message_handler_) {
        handler(*this, message);
    }
}

void PeerConnection::send_out_of_band(protocol::NegotiationParams params) {
    if (auto handler = negotiate_handler_) {
        handler(*this, params);
    }
}

void PeerConnection::report_error(const std::string& operation, const std::string& detail) {
    log_event(StructuredLogger::Level::Warning,
              "mesh.negotiation.error",
              {{"remote", remote_id_}, {"operation", operation}, {"error", detail}});
    if (auto handler = error_handler_) {
        handler(*this, operation + ": " + detail);
    }
}

}  // namespace meshstate::mesh
