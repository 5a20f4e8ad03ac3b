#include "meshstate/core/StateSync.hpp"

#include "meshstate/daemon/StructuredLogger.hpp"
#include "meshstate/protocol/ProposalCodec.hpp"

#include <utility>

namespace meshstate::core {

namespace {

using daemon::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace

StateSync::StateSync(mesh::PeerGroup& group, const Config& config, consensus::NextState initial)
    : group_(group),
      history_max_size_(config.history_max_size),
      state_(std::move(initial)) {
    group_.set_message_handler([this](mesh::PeerConnection& peer, const std::string& payload) {
        handle_message(peer.remote_id(), payload);
    });
    group_.set_peer_join_handler([this](mesh::PeerConnection& peer) {
        handle_peer_join(peer);
    });
}

StateSync::~StateSync() {
    group_.set_message_handler(nullptr);
    group_.set_peer_join_handler(nullptr);
}

consensus::Proposal StateSync::propose(std::string next) {
    auto proposal = state_.propose(std::move(next));
    history_.add_edge(proposal.state, proposal.next, proposal);

    state_ = state_.advance(proposal);
    current_proposal_ = proposal;
    log_event(StructuredLogger::Level::Info,
              "sync.propose",
              {{"state", proposal.next}, {"time", std::to_string(proposal.time)}});

    group_.send(protocol::encode_proposal(proposal));
    history_.prune(history_max_size_);
    if (auto handler = state_handler_) {
        handler(state_);
    }
    return proposal;
}

void StateSync::handle_message(const PeerId& from, const std::string& payload) {
    consensus::Proposal proposal{};
    std::string error_message;
    if (!protocol::decode_proposal(payload, proposal, error_message)) {
        if (auto handler = unhandled_handler_) {
            if (auto peer = group_.get_peer(from)) {
                handler(*peer, payload);
                return;
            }
        }
        log_event(StructuredLogger::Level::Warning,
                  "sync.malformed",
                  {{"from", from}, {"error", error_message}});
        report(SyncError{SyncError::Kind::MalformedProposal, from, error_message});
        return;
    }

    const auto* known = history_.find(proposal.next);
    // A node orphaned by prune keeps the proposal that created it.
    if (known && (known->source == proposal.state || (!known->source && known->data == proposal))) {
        return;
    }

    const auto evaluation = state_.evaluate(proposal);
    log_event(StructuredLogger::Level::Info,
              "sync.evaluate",
              {{"from", from},
               {"code", std::string(consensus::to_string(evaluation.code))},
               {"accept", evaluation.accept ? "true" : "false"},
               {"reason", evaluation.reason}});

    try {
        history_.add_edge(proposal.state, proposal.next, proposal);
    } catch (const consensus::ProtocolViolation& violation) {
        log_event(StructuredLogger::Level::Warning,
                  "history.protocol_violation",
                  {{"from", from}, {"error", violation.what()}});
        report(SyncError{SyncError::Kind::ProtocolViolation, from, violation.what()});
        return;
    }

    if (evaluation.accept) {
        apply(proposal);
    }
    history_.prune(history_max_size_);
}

void StateSync::apply(const consensus::Proposal& proposal) {
    state_ = state_.advance(proposal);
    current_proposal_ = proposal;
    if (auto handler = state_handler_) {
        handler(state_);
    }
}

void StateSync::handle_peer_join(mesh::PeerConnection& peer) {
    if (current_proposal_) {
        try {
            peer.send(protocol::encode_proposal(*current_proposal_));
        } catch (const mesh::TransportError& error) {
            log_event(StructuredLogger::Level::Info,
                      "sync.catch_up_skipped",
                      {{"remote", peer.remote_id()}, {"reason", error.what()}});
        }
    }
    if (auto handler = peer_join_handler_) {
        handler(peer);
    }
}

void StateSync::set_state_handler(StateHandler handler) {
    state_handler_ = std::move(handler);
}

void StateSync::set_advance_handler(AdvanceHandler handler) {
    history_.set_advance_handler(std::move(handler));
}

void StateSync::set_error_handler(ErrorHandler handler) {
    error_handler_ = std::move(handler);
}

void StateSync::set_unhandled_handler(PayloadHandler handler) {
    unhandled_handler_ = std::move(handler);
}

void StateSync::set_peer_join_handler(PeerHandler handler) {
    peer_join_handler_ = std::move(handler);
}

void StateSync::report(SyncError error) {
    if (auto handler = error_handler_) {
        handler(error);
    }
}

}  // namespace meshstate::core
