#include "meshstate/consensus/DivergingGraph.hpp"
#include "meshstate/daemon/StructuredLogger.hpp"

#include <cassert>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using meshstate::consensus::DivergingGraph;
using meshstate::consensus::Proposal;
using meshstate::consensus::ProtocolViolation;

bool throws_violation(DivergingGraph& graph, const std::string& source, const std::string& target) {
    try {
        graph.add_edge(source, target);
    } catch (const ProtocolViolation&) {
        return true;
    }
    return false;
}

std::int64_t distance(const DivergingGraph& graph, const std::string& key) {
    const auto* info = graph.find(key);
    assert(info != nullptr);
    return info->distance;
}

}  // namespace

int main() {
    std::ostringstream log_sink;
    meshstate::daemon::StructuredLogger::instance().set_sink(&log_sink);

    // Worked example: branches grafted onto a common root after the fact.
    {
        DivergingGraph graph;
        std::vector<std::optional<std::string>> advanced;
        graph.set_advance_handler([&](const DivergingGraph::AdvanceEvent& event) {
            advanced.push_back(event.node);
        });

        assert(!graph.furthest_node().has_value());
        assert(graph.furthest_distance() == DivergingGraph::kSentinelDistance);

        graph.add_edge("C", "D");
        graph.add_edge("E", "F");
        graph.add_edge("F", "G");
        graph.add_edge("A", "B");
        graph.add_edge("B", "C");
        graph.add_edge("B", "E");

        assert(graph.furthest_node() == std::optional<std::string>("G"));
        assert(distance(graph, "A") == 0);
        assert(distance(graph, "B") == 1);
        assert(distance(graph, "C") == 2);
        assert(distance(graph, "D") == 3);
        assert(distance(graph, "E") == 2);
        assert(distance(graph, "F") == 3);
        assert(distance(graph, "G") == 4);
        assert(graph.heads().size() == 2);
        assert(graph.heads().count("D") == 1);
        assert(graph.heads().count("G") == 1);

        // D took over when C was grafted, G when E was.
        const std::vector<std::optional<std::string>> expected_events{
            std::string("D"), std::string("G"), std::string("D"), std::string("G")};
        assert(advanced == expected_events);

        graph.remove_node("E");
        assert(graph.find("F")->source == std::nullopt);
        assert(distance(graph, "F") == 3);
        assert(graph.furthest_node() == std::optional<std::string>("G"));

        graph.remove_node("G");
        assert(graph.furthest_node() == std::optional<std::string>("D"));
        assert(graph.heads().count("F") == 1);

        graph.add_edge("D", "G");
        assert(graph.furthest_node() == std::optional<std::string>("G"));
        assert(distance(graph, "G") == 4);

        const auto before = graph.size();
        assert(throws_violation(graph, "D", "F"));
        assert(graph.size() == before);
        assert(graph.find("F")->source == std::nullopt);
        assert(graph.furthest_node() == std::optional<std::string>("G"));
    }

    // A second edge into the same node fails and changes nothing.
    {
        DivergingGraph graph;
        Proposal first{};
        first.next = "b";
        first.state = "a";
        first.time = 1;
        graph.add_edge("a", "b", first);
        assert(throws_violation(graph, "x", "b"));
        assert(!graph.contains("x"));
        assert(graph.find("b")->source == std::optional<std::string>("a"));
        assert(graph.find("b")->data == first);
        assert(graph.heads().count("b") == 1);
        assert(graph.size() == 2);
    }

    // Equal lengths resolve to the earliest path.
    {
        DivergingGraph graph;
        graph.add_edge("root", "left");
        graph.add_edge("root", "right");
        assert(graph.furthest_node() == std::optional<std::string>("left"));
        graph.add_edge("right", "right2");
        assert(graph.furthest_node() == std::optional<std::string>("right2"));
        graph.add_edge("left", "left2");
        assert(graph.furthest_node() == std::optional<std::string>("right2"));
        assert(graph.heads().size() == 2);
    }

    // Self loops and cycles are rejected before any mutation.
    {
        DivergingGraph graph;
        assert(throws_violation(graph, "a", "a"));
        assert(graph.size() == 0);

        graph.add_edge("a", "b");
        graph.add_edge("b", "c");
        assert(throws_violation(graph, "c", "a"));
        assert(graph.find("a")->source == std::nullopt);
        assert(graph.heads().count("c") == 1);
        assert(graph.furthest_node() == std::optional<std::string>("c"));
    }

    // Removing the only nodes falls back to the former source, then the root.
    {
        DivergingGraph graph;
        graph.add_edge("a", "b");
        graph.remove_node("b");
        assert(graph.furthest_node() == std::optional<std::string>("a"));
        assert(graph.heads().count("a") == 1);
        graph.remove_node("a");
        assert(!graph.furthest_node().has_value());
        assert(graph.size() == 0);
        graph.remove_node("missing");
    }

    // The advance event carries the node's final source and data.
    {
        DivergingGraph graph;
        Proposal proposal{};
        proposal.next = "n1";
        proposal.state = "n0";
        proposal.time = 1;
        proposal.lottery = 0.5;
        std::optional<DivergingGraph::AdvanceEvent> last;
        graph.set_advance_handler([&](const DivergingGraph::AdvanceEvent& event) { last = event; });
        graph.add_edge("n0", "n1", proposal);
        assert(last.has_value());
        assert(last->node == std::optional<std::string>("n1"));
        assert(last->info.source == std::optional<std::string>("n0"));
        assert(last->info.distance == 1);
        assert(last->info.data == proposal);
    }

    meshstate::daemon::StructuredLogger::instance().set_sink(nullptr);
    return 0;
}
