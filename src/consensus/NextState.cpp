#include "meshstate/consensus/NextState.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <sstream>
#include <utility>

namespace meshstate::consensus {

namespace {

std::string format_lottery(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // namespace

std::string_view to_string(EvaluationCode code) {
    switch (code) {
        case EvaluationCode::Advance:
            return "advance";
        case EvaluationCode::AdvanceShift:
            return "advance_shift";
        case EvaluationCode::FastForward:
            return "fast_forward";
        case EvaluationCode::Confirm:
            return "confirm";
        case EvaluationCode::LotteryLost:
            return "lottery_lost";
        case EvaluationCode::Rock:
            return "rock";
        case EvaluationCode::OneDirection:
            return "one_direction";
    }
    return "unknown";
}

LotterySource default_lottery_source() {
    std::random_device device;
    auto generator = std::make_shared<std::mt19937_64>((static_cast<std::uint64_t>(device()) << 32) ^ device());
    return [generator]() {
        std::uniform_real_distribution<double> distribution(0.0, 1.0);
        return clamp_lottery(distribution(*generator));
    };
}

double clamp_lottery(double draw) noexcept {
    // uniform_real_distribution may round up to its upper bound.
    constexpr double kBelowOne = 1.0 - std::numeric_limits<double>::epsilon() / 2;
    if (!(draw >= 0.0)) {
        return 0.0;
    }
    return draw < 1.0 ? draw : kBelowOne;
}

NextState::NextState(LotterySource lottery_source)
    : lottery_source_(std::move(lottery_source)) {
    lottery_ = lottery_source_();
}

NextState::NextState(std::string state,
                     std::uint64_t time,
                     std::optional<double> lottery,
                     LotterySource lottery_source)
    : state_(std::move(state)),
      time_(time),
      lottery_source_(std::move(lottery_source)) {
    lottery_ = lottery.has_value() ? *lottery : lottery_source_();
}

Proposal NextState::propose(std::string next) const {
    Proposal proposal{};
    proposal.next = std::move(next);
    proposal.state = state_;
    proposal.time = time_ + 1;
    proposal.lottery = lottery_source_();
    return proposal;
}

Evaluation NextState::evaluate(const Proposal& incoming) const {
    Evaluation result{};

    if (incoming.time > time_) {
        if (incoming.time > time_ + 1) {
            result.code = EvaluationCode::FastForward;
            result.reason = "Skip " + std::to_string(incoming.time - time_) + " steps.";
            result.accept = true;
        } else if (incoming.state == state_) {
            result.code = EvaluationCode::Advance;
            result.reason = "All good.";
            result.accept = true;
        } else {
            result.code = EvaluationCode::AdvanceShift;
            result.reason = "Input source (" + incoming.state + ") differs from local state (" + state_ + ").";
            result.accept = true;
        }
    } else if (incoming.time == time_) {
        // Competing transitions for the same step: highest lottery wins.
        if (incoming.next == state_) {
            result.code = EvaluationCode::Confirm;
            result.reason = "Transition confirms local state. No need to change.";
            result.accept = false;
        } else if (incoming.lottery > lottery_) {
            result.code = EvaluationCode::LotteryLost;
            result.reason = "Their ticket won (" + format_lottery(incoming.lottery) + " > " +
                            format_lottery(lottery_) + ").";
            result.accept = true;
        } else {
            result.code = EvaluationCode::Rock;
            result.reason = "They got scissors, we got rock.";
            result.accept = false;
        }
    } else {
        result.code = EvaluationCode::OneDirection;
        result.reason = "Remote is " + std::to_string(time_ - incoming.time) + " steps behind.";
        result.accept = false;
    }

    return result;
}

NextState NextState::advance(const Proposal& accepted) const {
    return NextState{accepted.next, accepted.time, accepted.lottery, lottery_source_};
}

}  // namespace meshstate::consensus
