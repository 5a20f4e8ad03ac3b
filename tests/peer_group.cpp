#include "meshstate/Config.hpp"
#include "meshstate/daemon/StructuredLogger.hpp"
#include "meshstate/mesh/LoopbackTransport.hpp"
#include "meshstate/mesh/PeerGroup.hpp"
#include "meshstate/protocol/Negotiation.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;

using meshstate::mesh::GroupError;
using meshstate::mesh::PeerConnection;
using meshstate::mesh::PeerGroup;
using meshstate::protocol::NegotiationEnvelope;

const std::string kLocal = "11111111-1111-4111-8111-111111111111";
const std::string kRemote = "22222222-2222-4222-8222-222222222222";
const std::string kOther = "33333333-3333-4333-8333-333333333333";

meshstate::Config config_for(const std::string& id) {
    meshstate::Config config{};
    config.local_id = id;
    return config;
}

std::vector<NegotiationEnvelope> decode(const std::string& payload) {
    std::vector<NegotiationEnvelope> envelopes;
    std::string error;
    const bool ok = meshstate::protocol::decode_batch(payload, envelopes, error);
    assert(ok);
    return envelopes;
}

std::string announce_from(const std::string& id) {
    NegotiationEnvelope envelope{};
    envelope.from = id;
    return meshstate::protocol::encode_batch({envelope});
}

}  // namespace

int main() {
    std::ostringstream log_sink;
    meshstate::daemon::StructuredLogger::instance().set_sink(&log_sink);

    // Announce plus queued parameters leave as one batch after the delay.
    {
        meshstate::test::ManualScheduler scheduler;
        meshstate::mesh::LoopbackNetwork network(scheduler);
        meshstate::mesh::LoopbackTransportFactory factory(network);
        meshstate::test::MemorySignalingHub hub(scheduler);
        auto& channel = hub.add_member();

        PeerGroup group(scheduler, factory, config_for(kLocal));
        assert(group.local_id() == kLocal);
        group.join(channel);
        assert(group.attached());
        channel.open();
        assert(group.pending_negotiations() == 1);

        meshstate::protocol::NegotiationParams candidate{};
        candidate.candidate = meshstate::protocol::IceCandidate{"candidate:x", std::string("0"), 0u};
        group.negotiate(kRemote, candidate);
        group.negotiate(kOther, candidate);
        assert(group.pending_negotiations() == 3);
        assert(scheduler.pending_timers() == 1);

        scheduler.advance(99ms);
        assert(channel.sent().empty());
        scheduler.advance(1ms);
        assert(channel.sent().size() == 1);
        assert(group.pending_negotiations() == 0);

        const auto batch = decode(channel.sent().front());
        assert(batch.size() == 3);
        assert(batch[0].from == kLocal && !batch[0].to.has_value());
        assert(!batch[0].params.candidate && !batch[0].params.description);
        assert(batch[1].to == kRemote);
        assert(batch[2].to == kOther);

        // A queue drained by the flush starts a new batch.
        group.negotiate(kRemote, candidate);
        scheduler.advance(100ms);
        assert(channel.sent().size() == 2);
    }

    // Routing: only envelopes for us, from valid foreign ids, create peers.
    {
        meshstate::test::ManualScheduler scheduler;
        meshstate::mesh::LoopbackNetwork network(scheduler);
        meshstate::mesh::LoopbackTransportFactory factory(network);
        PeerGroup group(scheduler, factory, config_for(kLocal));

        std::vector<GroupError> errors;
        group.set_error_handler([&](const GroupError& error) { errors.push_back(error); });

        NegotiationEnvelope elsewhere{};
        elsewhere.from = kRemote;
        elsewhere.to = kOther;
        NegotiationEnvelope invalid{};
        invalid.from = "not-a-peer-id";
        NegotiationEnvelope self{};
        self.from = kLocal;
        group.handle_relay_message(meshstate::protocol::encode_batch({elsewhere, invalid, self}));
        assert(group.peers().empty());

        NegotiationEnvelope direct{};
        direct.from = kRemote;
        direct.to = kLocal;
        group.handle_relay_message(meshstate::protocol::encode_batch({direct}));
        assert(group.peers().size() == 1);
        assert(group.get_peer(kRemote) != nullptr);

        group.handle_relay_message(announce_from(kOther));
        assert(group.peers().size() == 2);
        group.handle_relay_message(announce_from(kOther));
        assert(group.peers().size() == 2);

        assert(group.add_peer(kOther) == group.get_peer(kOther));
        assert(log_sink.str().find("mesh.peer.duplicate") != std::string::npos);

        assert(errors.empty());
        group.handle_relay_message("{\"from\":\"" + kRemote + "\"}");
        group.handle_relay_message("garbage");
        assert(errors.size() == 2);
        assert(errors[0].kind == GroupError::Kind::MalformedRelayMessage);
        assert(meshstate::mesh::to_string(errors[1].kind) == "malformed_relay_message");
        assert(group.peers().size() == 2);

        // A wrongly typed envelope does not sink the valid one beside it.
        const std::string kFourth = "44444444-4444-4444-8444-444444444444";
        group.handle_relay_message(R"([{"from":")" + kFourth + R"(","to":5},{"from":")" + kFourth + R"("}])");
        assert(errors.size() == 2);
        assert(group.get_peer(kFourth) != nullptr);
        assert(group.peers().size() == 3);
        assert(log_sink.str().find("mesh.relay.envelope_skipped") != std::string::npos);
        group.remove_peer(kFourth);
        assert(group.peers().size() == 2);

        // Links that never opened swallow broadcast sends.
        group.send("hello");
        assert(log_sink.str().find("mesh.peer.send_skipped") != std::string::npos);

        group.remove_peer(kRemote);
        assert(group.peers().size() == 1);
        group.remove_peer(kRemote);
        assert(group.peers().size() == 1);

        // Without a channel the flush reports a relay send failure.
        scheduler.run_until_idle();
        bool relay_send_reported = false;
        for (const auto& error : errors) {
            relay_send_reported = relay_send_reported || error.kind == GroupError::Kind::RelaySend;
        }
        assert(relay_send_reported);
    }

    // Failing relay sends are reported; leave cancels the pending flush.
    {
        meshstate::test::ManualScheduler scheduler;
        meshstate::mesh::LoopbackNetwork network(scheduler);
        meshstate::mesh::LoopbackTransportFactory factory(network);
        meshstate::test::MemorySignalingHub hub(scheduler);
        auto& channel = hub.add_member();
        channel.open();

        PeerGroup group(scheduler, factory, config_for(kLocal));
        std::vector<GroupError> errors;
        group.set_error_handler([&](const GroupError& error) { errors.push_back(error); });
        group.join(channel);
        assert(group.pending_negotiations() == 1);

        channel.set_fail_sends(true);
        scheduler.advance(100ms);
        assert(errors.size() == 1);
        assert(errors[0].kind == GroupError::Kind::RelaySend);
        channel.set_fail_sends(false);

        group.negotiate(std::nullopt);
        group.handle_relay_message(announce_from(kRemote));
        assert(scheduler.pending_timers() == 1);
        group.leave();
        assert(scheduler.pending_timers() == 0);
        assert(group.pending_negotiations() == 0);
        assert(group.peers().empty());
        assert(!group.attached());
        assert(!channel.has_message_handler());
        group.leave();
        scheduler.run_until_idle();
        assert(channel.sent().empty());
        assert(network.transport_count() == 0);
    }

    // Closing the signaling channel detaches the group.
    {
        meshstate::test::ManualScheduler scheduler;
        meshstate::mesh::LoopbackNetwork network(scheduler);
        meshstate::mesh::LoopbackTransportFactory factory(network);
        meshstate::test::MemorySignalingHub hub(scheduler);
        auto& channel = hub.add_member();
        PeerGroup group(scheduler, factory, config_for(kLocal));
        group.join(channel);
        channel.open();
        channel.close();
        assert(!group.attached());
    }

    // Three groups on one relay form a full mesh and exchange messages.
    {
        meshstate::test::ManualScheduler scheduler;
        meshstate::mesh::LoopbackNetwork network(scheduler);
        meshstate::mesh::LoopbackTransportFactory factory(network);
        meshstate::test::MemorySignalingHub hub(scheduler);

        const std::vector<std::string> ids{kLocal, kRemote, kOther};
        std::vector<std::unique_ptr<PeerGroup>> groups;
        std::vector<int> joins(ids.size(), 0);
        std::vector<int> leaves(ids.size(), 0);
        std::vector<std::vector<std::string>> inbox(ids.size());
        std::vector<meshstate::test::MemorySignalingChannel*> channels;
        for (std::size_t i = 0; i < ids.size(); ++i) {
            groups.push_back(std::make_unique<PeerGroup>(scheduler, factory, config_for(ids[i])));
            groups[i]->set_peer_join_handler([&joins, i](PeerConnection&) { ++joins[i]; });
            groups[i]->set_peer_leave_handler([&leaves, i](PeerConnection&) { ++leaves[i]; });
            groups[i]->set_message_handler([&inbox, i](PeerConnection& from, const std::string& message) {
                inbox[i].push_back(from.remote_id() + ":" + message);
            });
            channels.push_back(&hub.add_member());
            groups[i]->join(*channels.back());
        }
        for (auto* channel : channels) {
            channel->open();
        }
        scheduler.run_until_idle();

        for (std::size_t i = 0; i < ids.size(); ++i) {
            assert(joins[i] == 2);
            assert(groups[i]->peers().size() == 2);
        }
        assert(network.connected_links() == 3);

        groups[0]->send("hi");
        scheduler.run_until_idle();
        assert(inbox[1] == std::vector<std::string>{kLocal + ":hi"});
        assert(inbox[2] == std::vector<std::string>{kLocal + ":hi"});
        assert(inbox[0].empty());

        groups[2]->leave();
        scheduler.run_until_idle();
        assert(leaves[0] == 1);
        assert(leaves[1] == 1);
        assert(leaves[2] == 0);
        assert(groups[0]->peers().size() == 1);
        assert(groups[0]->get_peer(kOther) == nullptr);
        assert(network.connected_links() == 1);
    }

    meshstate::daemon::StructuredLogger::instance().set_sink(nullptr);
    return 0;
}
