#include "meshstate/Config.hpp"
#include "meshstate/daemon/StructuredLogger.hpp"
#include "meshstate/mesh/LoopbackTransport.hpp"
#include "meshstate/mesh/PeerConnection.hpp"

#include "test_support.hpp"

#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using meshstate::mesh::ChannelState;
using meshstate::mesh::PeerConnection;
using meshstate::protocol::NegotiationParams;
using meshstate::protocol::SessionDescription;

const std::string kImpolite = "aaaaaaaa-aaaa-aaaa-aaaa-aaaaaaaaaaaa";
const std::string kPolite = "zzzzzzzz-zzzz-zzzz-zzzz-zzzzzzzzzzzz";

struct Endpoint {
    std::shared_ptr<PeerConnection> connection;
    std::vector<SessionDescription::Type> sent_descriptions;
    std::vector<std::string> received;
    std::vector<std::string> errors;
    int opened{0};
    int closed{0};
};

// Two links wired back to back; parameters travel through the scheduler.
struct Pair {
    Pair(meshstate::test::ManualScheduler& scheduler, meshstate::mesh::LoopbackNetwork& network) {
        const meshstate::TransportConfig config{};
        impolite.connection = std::make_shared<PeerConnection>(kImpolite, kPolite, network.create_transport(config), "data");
        polite.connection = std::make_shared<PeerConnection>(kPolite, kImpolite, network.create_transport(config), "data");
        wire(scheduler, impolite, polite);
        wire(scheduler, polite, impolite);
    }

    static void wire(meshstate::test::ManualScheduler& scheduler, Endpoint& from, Endpoint& to) {
        std::weak_ptr<PeerConnection> target = to.connection;
        from.connection->set_negotiate_handler([&scheduler, &from, target](PeerConnection&, const NegotiationParams& params) {
            if (params.description) {
                from.sent_descriptions.push_back(params.description->type);
            }
            scheduler.post([target, params]() {
                if (auto peer = target.lock()) {
                    peer->negotiate(params);
                }
            });
        });
        from.connection->set_open_handler([&from](PeerConnection&) { ++from.opened; });
        from.connection->set_close_handler([&from](PeerConnection&) { ++from.closed; });
        from.connection->set_message_handler([&from](PeerConnection&, const std::string& message) {
            from.received.push_back(message);
        });
        from.connection->set_error_handler([&from](PeerConnection&, const std::string& error) {
            from.errors.push_back(error);
        });
    }

    Endpoint impolite;
    Endpoint polite;
};

std::size_t count_of(const std::vector<SessionDescription::Type>& types, SessionDescription::Type type) {
    std::size_t count = 0;
    for (const auto value : types) {
        if (value == type) {
            ++count;
        }
    }
    return count;
}

}  // namespace

int main() {
    std::ostringstream log_sink;
    meshstate::daemon::StructuredLogger::instance().set_sink(&log_sink);

    // Both sides create their channel at once and offer simultaneously.
    {
        meshstate::test::ManualScheduler scheduler;
        meshstate::mesh::LoopbackNetwork network(scheduler);
        Pair pair(scheduler, network);
        assert(!pair.impolite.connection->polite());
        assert(pair.polite.connection->polite());

        pair.impolite.connection->start();
        pair.polite.connection->start();
        assert(pair.impolite.connection->ready_state() == ChannelState::Connecting);
        scheduler.run_until_idle();

        assert(log_sink.str().find("mesh.negotiation.offer_ignored") != std::string::npos);
        assert(log_sink.str().find(kImpolite) != std::string::npos);
        assert(count_of(pair.impolite.sent_descriptions, SessionDescription::Type::Offer) == 1);
        assert(count_of(pair.impolite.sent_descriptions, SessionDescription::Type::Answer) == 0);
        assert(count_of(pair.polite.sent_descriptions, SessionDescription::Type::Offer) == 1);
        assert(count_of(pair.polite.sent_descriptions, SessionDescription::Type::Answer) == 1);
        assert(pair.impolite.errors.empty());
        assert(pair.polite.errors.empty());

        assert(pair.impolite.opened == 1);
        assert(pair.polite.opened == 1);
        assert(network.connected_links() == 1);
        assert(!pair.impolite.connection->making_offer());

        pair.impolite.connection->send("ping");
        pair.polite.connection->send("pong");
        scheduler.run_until_idle();
        assert(pair.polite.received == std::vector<std::string>{"ping"});
        assert(pair.impolite.received == std::vector<std::string>{"pong"});

        // ICE failure restarts without tearing the channel down.
        assert(network.fail_links() == 1);
        scheduler.run_until_idle();
        assert(network.connected_links() == 1);
        assert(pair.impolite.closed == 0);
        assert(pair.polite.closed == 0);
        assert(pair.impolite.connection->ready_state() == ChannelState::Open);
        pair.polite.connection->send("after restart");
        scheduler.run_until_idle();
        assert(pair.impolite.received.back() == "after restart");

        // Closing one side tears down the other through its channel.
        pair.impolite.connection->close();
        pair.impolite.connection->close();
        assert(pair.impolite.connection->closed());
        assert(!pair.impolite.connection->ready_state().has_value());
        scheduler.run_until_idle();
        assert(pair.impolite.closed == 0);
        assert(pair.polite.closed == 1);
        assert(pair.polite.connection->closed());
        assert(network.transport_count() == 0);

        bool threw = false;
        try {
            pair.impolite.connection->send("late");
        } catch (const meshstate::mesh::TransportError&) {
            threw = true;
        }
        assert(threw);
    }

    // Without ICE restart support a failed link closes both ends once.
    {
        meshstate::test::ManualScheduler scheduler;
        meshstate::mesh::LoopbackNetwork network(scheduler);
        Pair pair(scheduler, network);
        pair.impolite.connection->start();
        pair.polite.connection->start();
        scheduler.run_until_idle();
        assert(network.connected_links() == 1);

        network.set_ice_restart_supported(false);
        network.fail_links();
        scheduler.run_until_idle();
        assert(pair.impolite.closed == 1);
        assert(pair.polite.closed == 1);
        assert(pair.impolite.connection->closed());
        assert(pair.polite.connection->closed());
        assert(log_sink.str().find("mesh.peer.ice_failed") != std::string::npos);
    }

    // Answering side: started from a remote offer, it adopts the pushed channel.
    {
        meshstate::test::ManualScheduler scheduler;
        meshstate::mesh::LoopbackNetwork network(scheduler);
        Pair pair(scheduler, network);

        std::vector<NegotiationParams> held;
        pair.impolite.connection->set_negotiate_handler([&](PeerConnection&, const NegotiationParams& params) {
            held.push_back(params);
        });
        pair.impolite.connection->start();
        scheduler.run_until_idle();
        assert(!held.empty());
        assert(held.front().description && held.front().description->type == SessionDescription::Type::Offer);

        Pair::wire(scheduler, pair.impolite, pair.polite);
        pair.polite.connection->start(*held.front().description);
        for (std::size_t i = 1; i < held.size(); ++i) {
            pair.polite.connection->negotiate(held[i]);
        }
        scheduler.run_until_idle();
        assert(pair.impolite.opened == 1);
        assert(pair.polite.opened == 1);
        assert(count_of(pair.polite.sent_descriptions, SessionDescription::Type::Offer) == 0);
        assert(count_of(pair.polite.sent_descriptions, SessionDescription::Type::Answer) == 1);
        assert(log_sink.str().find("mesh.peer.extra_channel") == std::string::npos);
    }

    // Candidates without a remote description surface as errors.
    {
        meshstate::test::ManualScheduler scheduler;
        meshstate::mesh::LoopbackNetwork network(scheduler);
        Pair pair(scheduler, network);
        pair.polite.connection->start(SessionDescription{SessionDescription::Type::Answer, "loopback 99 1"});
        NegotiationParams candidate{};
        candidate.candidate = meshstate::protocol::IceCandidate{"candidate:loopback 99 1", std::string("0"), 0u};
        pair.polite.connection->negotiate(candidate);
        scheduler.run_until_idle();
        assert(pair.polite.errors.size() == 2);
        assert(pair.polite.errors[0].find("set_remote_description") == 0);
        assert(pair.polite.errors[1].find("add_ice_candidate") == 0);
    }

    meshstate::daemon::StructuredLogger::instance().set_sink(nullptr);
    return 0;
}
