#pragma once

#include "meshstate/consensus/NextState.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace meshstate::consensus {

// Raised when an edge would join two paths into one node. The graph is left
// untouched when this is thrown.
class ProtocolViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Directed graph in which at most one edge leads into each node: paths may
 * split but never join. Nodes are states, edges are transitions. Peers that
 * act at the same time grow separate branches; the branch that progresses
 * furthest is the one every peer converges onto.
 *
 * An implicit sentinel root (distance -1) precedes every path start and is the
 * furthest node while the graph is empty. It is represented by an empty key.
 */
class DivergingGraph {
public:
    using Key = std::string;
    using NodeRef = std::optional<Key>;

    struct NodeInfo {
        NodeRef source{};
        std::int64_t distance{0};
        std::uint64_t arrival{0};
        std::optional<Proposal> data{};
    };

    struct AdvanceEvent {
        NodeRef node{};
        NodeInfo info{};
    };

    using AdvanceHandler = std::function<void(const AdvanceEvent&)>;

    static constexpr std::int64_t kSentinelDistance = -1;

    DivergingGraph() = default;

    void set_advance_handler(AdvanceHandler handler);

    // Throws ProtocolViolation when `target` exists and is not a path start,
    // when source and target are equal, or when the edge would close a cycle.
    void add_edge(const Key& source, const Key& target, std::optional<Proposal> data = std::nullopt);

    // Keeps the `max_size` most recently inserted nodes. Nodes whose source is
    // dropped become path starts but keep their distance.
    void prune(std::size_t max_size);

    void remove_node(const Key& key);

    // score(n) = max(score(parent) - (distance(n) - 1), arrival(n)) + distance(n)
    [[nodiscard]] std::unordered_map<Key, std::int64_t> retention_scores() const;

    const NodeRef& furthest_node() const noexcept { return furthest_; }
    std::int64_t furthest_distance() const;
    const NodeInfo* find(const Key& key) const;
    bool contains(const Key& key) const;
    const std::unordered_set<Key>& heads() const noexcept { return heads_; }
    std::size_t size() const noexcept { return nodes_.size(); }

private:
    struct Node {
        NodeInfo info;
        std::size_t children{0};
    };

    std::int64_t distance_of(const NodeRef& ref) const;
    std::uint64_t arrival_of(const NodeRef& ref) const;
    NodeRef preferred(const NodeRef& current, const NodeRef& candidate) const;
    bool descends_from(const Key& node, const Key& ancestor) const;
    void graft(const Key& source, const Key& target, std::int64_t shift, std::optional<Proposal> data);
    void release_child(const Key& source);
    void rebuild_heads();
    void set_furthest(NodeRef node);

    std::unordered_map<Key, Node> nodes_;
    std::unordered_set<Key> heads_;
    NodeRef furthest_{};
    std::uint64_t next_arrival_{1};
    AdvanceHandler advance_handler_{};
};

}  // namespace meshstate::consensus
