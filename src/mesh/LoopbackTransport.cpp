#include "meshstate/mesh/LoopbackTransport.hpp"

#include "meshstate/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace meshstate::mesh {

namespace {

constexpr std::string_view kSdpTag = "loopback";
constexpr std::string_view kCandidateTag = "candidate:loopback";

std::string make_token(std::string_view tag, std::uint64_t endpoint, std::uint64_t session) {
    std::ostringstream out;
    out << tag << ' ' << endpoint << ' ' << session;
    return out.str();
}

bool parse_token(const std::string& text, std::string_view tag, std::uint64_t& endpoint, std::uint64_t& session) {
    std::istringstream in(text);
    std::string word;
    in >> word;
    if (word != tag) {
        return false;
    }
    in >> endpoint >> session;
    return !in.fail();
}

bool valid_ice_url(const std::string& url) {
    for (const std::string_view scheme : {"stun:", "turn:", "turns:"}) {
        if (url.size() > scheme.size() && url.compare(0, scheme.size(), scheme) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace

struct LoopbackNetwork::Registry {
    explicit Registry(core::Scheduler& owner) : scheduler(owner) {}

    LoopbackTransport* find(std::uint64_t endpoint) const {
        const auto it = transports.find(endpoint);
        return it == transports.end() ? nullptr : it->second;
    }

    core::Scheduler& scheduler;
    std::unordered_map<std::uint64_t, LoopbackTransport*> transports;
    std::uint64_t next_endpoint{1};
    bool restart_supported{true};
};

class LoopbackChannel : public DataChannel, public std::enable_shared_from_this<LoopbackChannel> {
public:
    LoopbackChannel(core::Scheduler& scheduler, std::string label)
        : scheduler_(scheduler),
          label_(std::move(label)) {}

    const std::string& label() const override { return label_; }
    ChannelState ready_state() const override { return state_; }

    void send(const std::string& message) override {
        if (state_ != ChannelState::Open) {
            throw TransportError("Data channel '" + label_ + "' is " + to_string(state_));
        }
        if (!link_up_) {
            return;
        }
        std::weak_ptr<LoopbackChannel> peer = peer_;
        scheduler_.post([peer, message]() {
            if (auto target = peer.lock()) {
                target->deliver(message);
            }
        });
    }

    void close() override {
        if (state_ == ChannelState::Closed) {
            return;
        }
        state_ = ChannelState::Closed;
        link_up_ = false;
        std::weak_ptr<LoopbackChannel> peer = peer_;
        peer_.reset();
        scheduler_.post([peer]() {
            if (auto target = peer.lock()) {
                target->remote_closed();
            }
        });
    }

    void set_open_handler(StateHandler handler) override { open_handler_ = std::move(handler); }
    void set_closing_handler(StateHandler handler) override { closing_handler_ = std::move(handler); }
    void set_message_handler(MessageHandler handler) override { message_handler_ = std::move(handler); }

    bool bound() const noexcept { return bound_; }
    void set_link_up(bool up) noexcept { link_up_ = up && bound_; }

    void bind(const std::shared_ptr<LoopbackChannel>& peer) {
        peer_ = peer;
        bound_ = true;
        link_up_ = true;
    }

    void open() {
        std::weak_ptr<LoopbackChannel> weak = weak_from_this();
        scheduler_.post([weak]() {
            auto self = weak.lock();
            if (!self || self->state_ != ChannelState::Connecting) {
                return;
            }
            self->state_ = ChannelState::Open;
            if (auto handler = self->open_handler_) {
                handler();
            }
        });
    }

private:
    void deliver(const std::string& message) {
        if (state_ != ChannelState::Open) {
            return;
        }
        if (auto handler = message_handler_) {
            handler(message);
        }
    }

    void remote_closed() {
        if (state_ == ChannelState::Closing || state_ == ChannelState::Closed) {
            return;
        }
        state_ = ChannelState::Closing;
        link_up_ = false;
        peer_.reset();
        if (auto handler = closing_handler_) {
            handler();
        }
        state_ = ChannelState::Closed;
    }

    core::Scheduler& scheduler_;
    std::string label_;
    ChannelState state_{ChannelState::Connecting};
    std::weak_ptr<LoopbackChannel> peer_;
    bool bound_{false};
    bool link_up_{false};
    StateHandler open_handler_;
    StateHandler closing_handler_;
    MessageHandler message_handler_;
};

class LoopbackTransport : public PeerTransport {
public:
    using Registry = LoopbackNetwork::Registry;

    LoopbackTransport(std::shared_ptr<Registry> registry, std::uint64_t endpoint)
        : registry_(std::move(registry)),
          endpoint_(endpoint) {}

    ~LoopbackTransport() override {
        close();
    }

    void set_ice_candidate_handler(IceCandidateHandler handler) override {
        ice_candidate_handler_ = std::move(handler);
    }
    void set_negotiation_needed_handler(NegotiationNeededHandler handler) override {
        negotiation_needed_handler_ = std::move(handler);
    }
    void set_ice_state_handler(IceStateHandler handler) override {
        ice_state_handler_ = std::move(handler);
    }
    void set_data_channel_handler(DataChannelHandler handler) override {
        data_channel_handler_ = std::move(handler);
    }

    SignalingState signaling_state() const override { return signaling_; }
    IceConnectionState ice_connection_state() const override { return ice_; }
    std::optional<protocol::SessionDescription> local_description() const override { return local_; }

    void set_local_description(Completion done) override {
        defer([done](LoopbackTransport* self) {
            if (!self) {
                done(std::string("Transport is closed"));
                return;
            }
            self->apply_local_description(done);
        });
    }

    void set_remote_description(const protocol::SessionDescription& description, Completion done) override {
        defer([description, done](LoopbackTransport* self) {
            if (!self) {
                done(std::string("Transport is closed"));
                return;
            }
            self->apply_remote_description(description, done);
        });
    }

    void add_ice_candidate(const protocol::IceCandidate& candidate, Completion done) override {
        defer([candidate, done](LoopbackTransport* self) {
            if (!self) {
                done(std::string("Transport is closed"));
                return;
            }
            self->apply_candidate(candidate, done);
        });
    }

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override {
        if (signaling_ == SignalingState::Closed) {
            throw TransportError("Transport is closed");
        }
        auto channel = std::make_shared<LoopbackChannel>(registry_->scheduler, label);
        channels_.push_back(channel);
        if (ice_ == IceConnectionState::Connected && paired_) {
            if (auto* other = registry_->find(*paired_)) {
                attach(channel, *other);
                return channel;
            }
        }
        request_negotiation();
        return channel;
    }

    bool restart_ice() override {
        if (signaling_ == SignalingState::Closed || !registry_->restart_supported) {
            return false;
        }
        ++session_;
        remote_candidate_ok_ = false;
        ice_ = IceConnectionState::Checking;
        request_negotiation();
        return true;
    }

    void close() override {
        if (signaling_ == SignalingState::Closed) {
            return;
        }
        signaling_ = SignalingState::Closed;
        ice_ = IceConnectionState::Closed;
        paired_.reset();
        auto channels = std::move(channels_);
        channels_.clear();
        for (const auto& channel : channels) {
            channel->close();
        }
        registry_->transports.erase(endpoint_);
    }

    bool link_established() const noexcept {
        return ice_ == IceConnectionState::Connected && paired_.has_value();
    }
    std::optional<std::uint64_t> paired_with() const noexcept { return paired_; }

    void link_failed() {
        paired_.reset();
        ice_ = IceConnectionState::Failed;
        for (const auto& channel : channels_) {
            channel->set_link_up(false);
        }
        post_ice_state(IceConnectionState::Failed);
    }

private:
    void defer(std::function<void(LoopbackTransport*)> task) {
        std::weak_ptr<Registry> registry = registry_;
        const auto endpoint = endpoint_;
        registry_->scheduler.post([registry, endpoint, task = std::move(task)]() {
            auto shared = registry.lock();
            task(shared ? shared->find(endpoint) : nullptr);
        });
    }

    void request_negotiation() {
        if (negotiation_pending_) {
            return;
        }
        negotiation_pending_ = true;
        defer([](LoopbackTransport* self) {
            if (!self) {
                return;
            }
            self->negotiation_pending_ = false;
            if (auto handler = self->negotiation_needed_handler_) {
                handler();
            }
        });
    }

    void after_local_description() {
        defer([](LoopbackTransport* self) {
            if (!self) {
                return;
            }
            self->try_connect();
            self->emit_candidate();
        });
    }

    void apply_local_description(const Completion& done) {
        switch (signaling_) {
            case SignalingState::Stable:
                local_ = protocol::SessionDescription{protocol::SessionDescription::Type::Offer,
                                                      make_token(kSdpTag, endpoint_, session_)};
                signaling_ = SignalingState::HaveLocalOffer;
                break;
            case SignalingState::HaveRemoteOffer:
                local_ = protocol::SessionDescription{protocol::SessionDescription::Type::Answer,
                                                      make_token(kSdpTag, endpoint_, session_)};
                signaling_ = SignalingState::Stable;
                break;
            case SignalingState::HaveLocalOffer:
                break;
            case SignalingState::Closed:
                done(std::string("Transport is closed"));
                return;
        }
        after_local_description();
        done(std::nullopt);
    }

    void apply_remote_description(const protocol::SessionDescription& description, const Completion& done) {
        using Type = protocol::SessionDescription::Type;

        if (signaling_ == SignalingState::Closed) {
            done(std::string("Transport is closed"));
            return;
        }
        if (description.type == Type::Rollback) {
            if (signaling_ == SignalingState::HaveLocalOffer) {
                local_.reset();
                signaling_ = SignalingState::Stable;
            }
            done(std::nullopt);
            return;
        }
        if (description.type == Type::Pranswer) {
            done(std::string("Provisional answers are not supported"));
            return;
        }

        std::uint64_t endpoint = 0;
        std::uint64_t session = 0;
        if (!parse_token(description.sdp, kSdpTag, endpoint, session)) {
            done(std::string("Malformed session description"));
            return;
        }

        if (description.type == Type::Offer) {
            if (signaling_ == SignalingState::HaveLocalOffer) {
                local_.reset();
                signaling_ = SignalingState::Stable;
            }
            remember_remote(description, endpoint, session);
            signaling_ = SignalingState::HaveRemoteOffer;
            done(std::nullopt);
            return;
        }

        if (signaling_ != SignalingState::HaveLocalOffer) {
            done("Cannot apply answer in state " + to_string(signaling_));
            return;
        }
        remember_remote(description, endpoint, session);
        signaling_ = SignalingState::Stable;
        defer([](LoopbackTransport* self) {
            if (self) {
                self->try_connect();
            }
        });
        done(std::nullopt);
    }

    void apply_candidate(const protocol::IceCandidate& candidate, const Completion& done) {
        if (signaling_ == SignalingState::Closed) {
            done(std::string("Transport is closed"));
            return;
        }
        if (!remote_) {
            done(std::string("No remote description"));
            return;
        }
        std::uint64_t endpoint = 0;
        std::uint64_t session = 0;
        if (!parse_token(candidate.candidate, kCandidateTag, endpoint, session)) {
            done(std::string("Malformed candidate"));
            return;
        }
        if (endpoint != remote_endpoint_ || session != remote_session_) {
            done("Unknown ICE session " + candidate.candidate);
            return;
        }
        remote_candidate_ok_ = true;
        defer([](LoopbackTransport* self) {
            if (self) {
                self->try_connect();
            }
        });
        done(std::nullopt);
    }

    void remember_remote(const protocol::SessionDescription& description, std::uint64_t endpoint, std::uint64_t session) {
        if (endpoint != remote_endpoint_ || session != remote_session_) {
            remote_candidate_ok_ = false;
        }
        remote_ = description;
        remote_endpoint_ = endpoint;
        remote_session_ = session;
    }

    void emit_candidate() {
        if (signaling_ == SignalingState::Closed) {
            return;
        }
        protocol::IceCandidate candidate{};
        candidate.candidate = make_token(kCandidateTag, endpoint_, session_);
        candidate.sdp_mid = "0";
        candidate.sdp_mline_index = 0;
        if (auto handler = ice_candidate_handler_) {
            handler(candidate);
        }
    }

    bool ready_for_link() const noexcept {
        return signaling_ == SignalingState::Stable && local_ && remote_ && remote_candidate_ok_ &&
               ice_ != IceConnectionState::Connected;
    }

    void try_connect() {
        if (!ready_for_link()) {
            return;
        }
        auto* other = registry_->find(remote_endpoint_);
        if (!other || !other->ready_for_link()) {
            return;
        }
        if (other->remote_endpoint_ != endpoint_ || other->remote_session_ != session_ ||
            remote_session_ != other->session_) {
            return;
        }
        link_up(*other);
        other->link_up(*this);
    }

    void link_up(LoopbackTransport& other) {
        paired_ = other.endpoint_;
        ice_ = IceConnectionState::Connected;
        post_ice_state(IceConnectionState::Connected);

        const auto channels = channels_;
        for (const auto& channel : channels) {
            if (channel->bound()) {
                channel->set_link_up(true);
                continue;
            }
            if (channel->ready_state() == ChannelState::Connecting) {
                attach(channel, other);
            }
        }
    }

    // Joins `channel` with the same-label channel on `other`, or creates the
    // remote end and hands it to the other side's data channel handler.
    void attach(const std::shared_ptr<LoopbackChannel>& channel, LoopbackTransport& other) {
        const auto match = std::find_if(other.channels_.begin(), other.channels_.end(), [&](const auto& candidate) {
            return !candidate->bound() && candidate->ready_state() == ChannelState::Connecting &&
                   candidate->label() == channel->label();
        });
        if (match != other.channels_.end()) {
            channel->bind(*match);
            (*match)->bind(channel);
            channel->open();
            (*match)->open();
            return;
        }

        auto remote_end = std::make_shared<LoopbackChannel>(registry_->scheduler, channel->label());
        channel->bind(remote_end);
        remote_end->bind(channel);
        other.channels_.push_back(remote_end);
        other.defer([remote_end](LoopbackTransport* self) {
            if (!self) {
                return;
            }
            if (auto handler = self->data_channel_handler_) {
                handler(remote_end);
            }
        });
        channel->open();
        remote_end->open();
    }

    void post_ice_state(IceConnectionState state) {
        defer([state](LoopbackTransport* self) {
            if (!self) {
                return;
            }
            if (auto handler = self->ice_state_handler_) {
                handler(state);
            }
        });
    }

    std::shared_ptr<Registry> registry_;
    std::uint64_t endpoint_;
    std::uint64_t session_{1};

    SignalingState signaling_{SignalingState::Stable};
    IceConnectionState ice_{IceConnectionState::New};
    std::optional<protocol::SessionDescription> local_;
    std::optional<protocol::SessionDescription> remote_;
    std::uint64_t remote_endpoint_{0};
    std::uint64_t remote_session_{0};
    bool remote_candidate_ok_{false};
    bool negotiation_pending_{false};
    std::optional<std::uint64_t> paired_;

    std::vector<std::shared_ptr<LoopbackChannel>> channels_;

    IceCandidateHandler ice_candidate_handler_;
    NegotiationNeededHandler negotiation_needed_handler_;
    IceStateHandler ice_state_handler_;
    DataChannelHandler data_channel_handler_;
};

LoopbackNetwork::LoopbackNetwork(core::Scheduler& scheduler)
    : registry_(std::make_shared<Registry>(scheduler)) {}

LoopbackNetwork::~LoopbackNetwork() = default;

std::unique_ptr<PeerTransport> LoopbackNetwork::create_transport(const TransportConfig& config) {
    for (const auto& server : config.ice_servers) {
        for (const auto& url : server.urls) {
            if (!valid_ice_url(url)) {
                throw TransportError("Invalid ICE server url: " + url);
            }
        }
    }
    const auto endpoint = registry_->next_endpoint++;
    auto transport = std::make_unique<LoopbackTransport>(registry_, endpoint);
    registry_->transports[endpoint] = transport.get();
    return transport;
}

void LoopbackNetwork::set_ice_restart_supported(bool supported) noexcept {
    registry_->restart_supported = supported;
}

bool LoopbackNetwork::ice_restart_supported() const noexcept {
    return registry_->restart_supported;
}

std::size_t LoopbackNetwork::fail_links() {
    std::vector<std::pair<LoopbackTransport*, LoopbackTransport*>> links;
    for (const auto& [endpoint, transport] : registry_->transports) {
        const auto paired = transport->paired_with();
        if (!transport->link_established() || !paired || *paired < endpoint) {
            continue;
        }
        if (auto* other = registry_->find(*paired)) {
            links.emplace_back(transport, other);
        }
    }
    for (const auto& [first, second] : links) {
        first->link_failed();
        second->link_failed();
    }
    if (!links.empty()) {
        daemon::StructuredLogger::instance().log(daemon::StructuredLogger::Level::Warning,
                                                 "mesh.loopback.links_failed",
                                                 {{"links", std::to_string(links.size())}});
    }
    return links.size();
}

std::size_t LoopbackNetwork::transport_count() const noexcept {
    return registry_->transports.size();
}

std::size_t LoopbackNetwork::connected_links() const {
    std::size_t count = 0;
    for (const auto& [endpoint, transport] : registry_->transports) {
        const auto paired = transport->paired_with();
        if (transport->link_established() && paired && *paired > endpoint) {
            ++count;
        }
    }
    return count;
}

std::unique_ptr<PeerTransport> LoopbackTransportFactory::create(const TransportConfig& config) {
    return network_.create_transport(config);
}

}  // namespace meshstate::mesh
