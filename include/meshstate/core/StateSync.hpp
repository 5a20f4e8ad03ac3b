#pragma once

#include "meshstate/Config.hpp"
#include "meshstate/Types.hpp"
#include "meshstate/consensus/DivergingGraph.hpp"
#include "meshstate/consensus/NextState.hpp"
#include "meshstate/mesh/PeerGroup.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace meshstate::core {

struct SyncError {
    enum class Kind {
        MalformedProposal,
        ProtocolViolation
    };

    Kind kind{Kind::MalformedProposal};
    PeerId peer;
    std::string detail;
};

/**
 * Runs the convergence loop over a peer group: local proposals are applied and
 * broadcast, received proposals are evaluated and recorded in the history.
 * Installs the group's message and peer-join handlers.
 */
class StateSync {
public:
    using StateHandler = std::function<void(const consensus::NextState&)>;
    using AdvanceHandler = consensus::DivergingGraph::AdvanceHandler;
    using ErrorHandler = std::function<void(const SyncError&)>;
    using PayloadHandler = mesh::PeerGroup::MessageHandler;
    using PeerHandler = mesh::PeerGroup::PeerHandler;

    StateSync(mesh::PeerGroup& group, const Config& config, consensus::NextState initial);
    ~StateSync();

    StateSync(const StateSync&) = delete;
    StateSync& operator=(const StateSync&) = delete;

    // Throws consensus::ProtocolViolation if `next` is already linked in the
    // history; nothing changes in that case.
    consensus::Proposal propose(std::string next);

    void handle_message(const PeerId& from, const std::string& payload);

    const consensus::NextState& current() const noexcept { return state_; }
    const consensus::DivergingGraph& history() const noexcept { return history_; }
    const std::optional<consensus::Proposal>& current_proposal() const noexcept { return current_proposal_; }

    void set_state_handler(StateHandler handler);
    void set_advance_handler(AdvanceHandler handler);
    void set_error_handler(ErrorHandler handler);
    // Receives payloads that are not proposals.
    void set_unhandled_handler(PayloadHandler handler);
    void set_peer_join_handler(PeerHandler handler);

private:
    void handle_peer_join(mesh::PeerConnection& peer);
    void apply(const consensus::Proposal& proposal);
    void report(SyncError error);

    mesh::PeerGroup& group_;
    std::size_t history_max_size_;
    consensus::NextState state_;
    consensus::DivergingGraph history_;
    std::optional<consensus::Proposal> current_proposal_;

    StateHandler state_handler_;
    ErrorHandler error_handler_;
    PayloadHandler unhandled_handler_;
    PeerHandler peer_join_handler_;
};

}  // namespace meshstate::core
