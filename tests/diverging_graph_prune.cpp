#include "meshstate/consensus/DivergingGraph.hpp"
#include "meshstate/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

using meshstate::consensus::DivergingGraph;

void check_sources(const DivergingGraph& graph, const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        const auto* info = graph.find(key);
        if (!info) {
            continue;
        }
        if (info->source) {
            assert(graph.contains(*info->source));
        }
    }
}

}  // namespace

int main() {
    std::ostringstream log_sink;
    meshstate::daemon::StructuredLogger::instance().set_sink(&log_sink);

    // A single chain keeps its newest tail.
    {
        DivergingGraph graph;
        std::vector<std::string> keys{"n0"};
        for (int i = 1; i <= 10; ++i) {
            keys.push_back("n" + std::to_string(i));
            graph.add_edge(keys[keys.size() - 2], keys.back());
        }
        assert(graph.size() == 11);
        assert(graph.furthest_node() == std::optional<std::string>("n10"));

        graph.prune(4);
        assert(graph.size() == 4);
        for (int i = 7; i <= 10; ++i) {
            assert(graph.contains("n" + std::to_string(i)));
        }
        assert(!graph.contains("n6"));
        // The new path start keeps its old distance.
        assert(graph.find("n7")->source == std::nullopt);
        assert(graph.find("n7")->distance == 7);
        assert(graph.furthest_node() == std::optional<std::string>("n10"));
        assert(graph.heads().size() == 1);
        assert(graph.heads().count("n10") == 1);
        check_sources(graph, keys);

        // Growing the pruned chain still works.
        graph.add_edge("n10", "n11");
        assert(graph.find("n11")->distance == 11);
        assert(graph.furthest_node() == std::optional<std::string>("n11"));

        assert(log_sink.str().find("history.prune") != std::string::npos);
    }

    // Limits at or above the size leave the graph alone.
    {
        DivergingGraph graph;
        graph.add_edge("a", "b");
        graph.add_edge("b", "c");
        graph.prune(3);
        assert(graph.size() == 3);
        graph.prune(10);
        assert(graph.size() == 3);
        graph.prune(0);
        assert(graph.size() == 0);
        assert(!graph.furthest_node().has_value());
        assert(graph.heads().empty());
    }

    // Random branching histories: exactly min(k, size) survivors, no dangling sources.
    std::mt19937 rng(1234);
    for (int round = 0; round < 50; ++round) {
        DivergingGraph graph;
        std::vector<std::string> keys{"root"};
        const int edges = 5 + static_cast<int>(rng() % 40);
        for (int i = 0; i < edges; ++i) {
            const std::string source = keys[rng() % keys.size()];
            keys.push_back("k" + std::to_string(round) + "_" + std::to_string(i));
            graph.add_edge(source, keys.back());
        }
        const auto size = graph.size();
        const std::size_t limit = rng() % (size + 5);
        graph.prune(limit);
        assert(graph.size() == std::min(limit, size));
        check_sources(graph, keys);

        for (const auto& head : graph.heads()) {
            assert(graph.contains(head));
        }
        if (graph.size() > 0) {
            assert(graph.furthest_node().has_value());
            assert(graph.contains(*graph.furthest_node()));
            for (const auto& key : keys) {
                if (const auto* info = graph.find(key)) {
                    assert(info->distance <= graph.furthest_distance());
                }
            }
        }
    }

    // Retention scores follow the tail of each path.
    {
        DivergingGraph graph;
        graph.add_edge("a", "b");
        graph.add_edge("b", "c");
        const auto scores = graph.retention_scores();
        assert(scores.size() == 3);
        assert(scores.at("a") == 1);
        assert(scores.at("b") == 3);
        assert(scores.at("c") == 5);
    }

    meshstate::daemon::StructuredLogger::instance().set_sink(nullptr);
    return 0;
}
