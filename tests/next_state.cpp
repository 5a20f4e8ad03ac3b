#include "meshstate/consensus/NextState.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace {

using meshstate::consensus::EvaluationCode;
using meshstate::consensus::LotterySource;
using meshstate::consensus::NextState;
using meshstate::consensus::Proposal;

LotterySource fixed_lottery(std::vector<double> values) {
    auto index = std::make_shared<std::size_t>(0);
    return [values = std::move(values), index]() {
        const auto value = values[*index % values.size()];
        ++*index;
        return value;
    };
}

Proposal make_proposal(std::string next, std::string state, std::uint64_t time, double lottery) {
    Proposal proposal{};
    proposal.next = std::move(next);
    proposal.state = std::move(state);
    proposal.time = time;
    proposal.lottery = lottery;
    return proposal;
}

}  // namespace

int main() {
    // propose draws a fresh ticket and leaves the local record alone.
    {
        NextState local("idle", 4, 0.25, fixed_lottery({0.75}));
        const auto proposal = local.propose("busy");
        assert(proposal.next == "busy");
        assert(proposal.state == "idle");
        assert(proposal.time == 5);
        assert(proposal.lottery == 0.75);
        assert(local.state() == "idle");
        assert(local.time() == 4);
        assert(local.lottery() == 0.25);
    }

    NextState local("s1", 3, 0.5);

    {
        const auto result = local.evaluate(make_proposal("s9", "s7", 6, 0.1));
        assert(result.accept);
        assert(result.code == EvaluationCode::FastForward);
        assert(result.reason.find("3 steps") != std::string::npos);
    }
    {
        const auto result = local.evaluate(make_proposal("s2", "s1", 4, 0.1));
        assert(result.accept);
        assert(result.code == EvaluationCode::Advance);
    }
    {
        const auto result = local.evaluate(make_proposal("s2", "other", 4, 0.1));
        assert(result.accept);
        assert(result.code == EvaluationCode::AdvanceShift);
    }
    {
        // Re-announcing what we already hold wins over any lottery value.
        const auto high = local.evaluate(make_proposal("s1", "s0", 3, 0.99));
        assert(!high.accept);
        assert(high.code == EvaluationCode::Confirm);
        const auto low = local.evaluate(make_proposal("s1", "s0", 3, 0.01));
        assert(!low.accept);
        assert(low.code == EvaluationCode::Confirm);
    }
    {
        const auto result = local.evaluate(make_proposal("x", "s0", 3, 0.9));
        assert(result.accept);
        assert(result.code == EvaluationCode::LotteryLost);
    }
    {
        const auto result = local.evaluate(make_proposal("x", "s0", 3, 0.1));
        assert(!result.accept);
        assert(result.code == EvaluationCode::Rock);
    }
    {
        // Exact tie keeps the local state.
        const auto result = local.evaluate(make_proposal("x", "s0", 3, 0.5));
        assert(!result.accept);
        assert(result.code == EvaluationCode::Rock);
    }
    {
        const auto result = local.evaluate(make_proposal("old", "older", 1, 0.9));
        assert(!result.accept);
        assert(result.code == EvaluationCode::OneDirection);
        assert(result.reason.find("2 steps") != std::string::npos);
    }

    // Two peers racing for the same step never both accept.
    {
        NextState a("base", 2, 0.1, fixed_lottery({0.3}));
        NextState b("base", 2, 0.2, fixed_lottery({0.8}));
        const auto from_a = a.propose("a-next");
        const auto from_b = b.propose("b-next");
        const auto next_a = a.advance(from_a);
        const auto next_b = b.advance(from_b);
        const auto a_takes_b = next_a.evaluate(from_b);
        const auto b_takes_a = next_b.evaluate(from_a);
        assert(a_takes_b.accept != b_takes_a.accept);
        assert(a_takes_b.code == EvaluationCode::LotteryLost);
        assert(b_takes_a.code == EvaluationCode::Rock);
        assert(next_a.advance(from_b).state() == next_b.state());
    }

    // An echoed proposal confirms the proposer's own state.
    {
        NextState proposer("p0", 0, 0.4, fixed_lottery({0.6}));
        const auto proposal = proposer.propose("p1");
        const auto advanced = proposer.advance(proposal);
        assert(advanced.state() == "p1");
        assert(advanced.time() == 1);
        assert(advanced.lottery() == 0.6);
        const auto echo = advanced.evaluate(proposal);
        assert(!echo.accept);
        assert(echo.code == EvaluationCode::Confirm);
    }

    assert(meshstate::consensus::to_string(EvaluationCode::LotteryLost) == "lottery_lost");
    assert(meshstate::consensus::to_string(EvaluationCode::OneDirection) == "one_direction");

    // Default source stays within [0, 1).
    {
        NextState fresh;
        for (int i = 0; i < 100; ++i) {
            const auto proposal = fresh.propose("n");
            assert(proposal.lottery >= 0.0 && proposal.lottery < 1.0);
        }
    }

    // A draw that rounded up to 1.0 lands just below it.
    {
        using meshstate::consensus::clamp_lottery;
        assert(clamp_lottery(1.0) < 1.0);
        assert(clamp_lottery(1.0) > 0.999999);
        assert(clamp_lottery(0.5) == 0.5);
        assert(clamp_lottery(0.0) == 0.0);
        assert(clamp_lottery(-0.1) == 0.0);
    }

    return 0;
}
