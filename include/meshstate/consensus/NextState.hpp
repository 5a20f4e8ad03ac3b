#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace meshstate::consensus {

// A proposed transition from `state` (the sender's state at proposal time) to
// `next`, taking logical time `time`.
struct Proposal {
    std::string next;
    std::string state;
    std::uint64_t time{0};
    double lottery{0.0};

    bool operator==(const Proposal& other) const = default;
};

enum class EvaluationCode : std::uint8_t {
    Advance = 0,
    AdvanceShift = 1,
    FastForward = 2,
    Confirm = 3,
    LotteryLost = 4,
    Rock = 5,
    OneDirection = 6,
};

std::string_view to_string(EvaluationCode code);

struct Evaluation {
    bool accept{false};
    EvaluationCode code{EvaluationCode::Advance};
    std::string reason;
};

// Draws values in [0, 1).
using LotterySource = std::function<double()>;

LotterySource default_lottery_source();

// Maps a raw draw into [0, 1).
double clamp_lottery(double draw) noexcept;

class NextState {
public:
    explicit NextState(LotterySource lottery_source = default_lottery_source());
    NextState(std::string state,
              std::uint64_t time,
              std::optional<double> lottery = std::nullopt,
              LotterySource lottery_source = default_lottery_source());

    [[nodiscard]] Proposal propose(std::string next) const;
    [[nodiscard]] Evaluation evaluate(const Proposal& incoming) const;
    [[nodiscard]] NextState advance(const Proposal& accepted) const;

    const std::string& state() const noexcept { return state_; }
    std::uint64_t time() const noexcept { return time_; }
    double lottery() const noexcept { return lottery_; }

private:
    std::string state_;
    std::uint64_t time_{0};
    double lottery_{0.0};
    LotterySource lottery_source_;
};

}  // namespace meshstate::consensus
