#pragma once

#include "meshstate/core/Scheduler.hpp"
#include "meshstate/mesh/Transport.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace meshstate::mesh {

class LoopbackTransport;

/**
 * In-process stand-in for a peer-to-peer network. Transports created here
 * exchange offers, answers and candidates like real ones and connect once both
 * ends are stable and hold a matching candidate. All callbacks are delivered
 * through the scheduler.
 *
 * Data channels created with the same label on both ends are joined into one
 * stream; a channel created on one end only shows up on the other through the
 * data channel handler.
 */
class LoopbackNetwork {
public:
    explicit LoopbackNetwork(core::Scheduler& scheduler);
    ~LoopbackNetwork();

    LoopbackNetwork(const LoopbackNetwork&) = delete;
    LoopbackNetwork& operator=(const LoopbackNetwork&) = delete;

    // Throws TransportError for ICE server urls without a stun:/turn:/turns: scheme.
    std::unique_ptr<PeerTransport> create_transport(const TransportConfig& config);

    // Drops every established link; both ends report ICE failure.
    std::size_t fail_links();
    void set_ice_restart_supported(bool supported) noexcept;
    bool ice_restart_supported() const noexcept;

    std::size_t transport_count() const noexcept;
    std::size_t connected_links() const;

private:
    friend class LoopbackTransport;

    // Shared with every transport so they stay valid if the network goes first.
    struct Registry;

    std::shared_ptr<Registry> registry_;
};

class LoopbackTransportFactory : public TransportFactory {
public:
    explicit LoopbackTransportFactory(LoopbackNetwork& network) : network_(network) {}

    std::unique_ptr<PeerTransport> create(const TransportConfig& config) override;

private:
    LoopbackNetwork& network_;
};

}  // namespace meshstate::mesh
