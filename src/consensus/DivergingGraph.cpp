#include "meshstate/consensus/DivergingGraph.hpp"

#include "meshstate/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace meshstate::consensus {

namespace {

constexpr std::int64_t kSentinelScore = DivergingGraph::kSentinelDistance;

}

void DivergingGraph::set_advance_handler(AdvanceHandler handler) {
    advance_handler_ = std::move(handler);
}

std::int64_t DivergingGraph::distance_of(const NodeRef& ref) const {
    if (!ref) {
        return kSentinelDistance;
    }
    return nodes_.at(*ref).info.distance;
}

std::uint64_t DivergingGraph::arrival_of(const NodeRef& ref) const {
    if (!ref) {
        return 0;
    }
    return nodes_.at(*ref).info.arrival;
}

DivergingGraph::NodeRef DivergingGraph::preferred(const NodeRef& current, const NodeRef& candidate) const {
    const auto current_distance = distance_of(current);
    const auto candidate_distance = distance_of(candidate);
    if (candidate_distance > current_distance) {
        return candidate;
    }
    if (candidate_distance == current_distance && arrival_of(candidate) < arrival_of(current)) {
        return candidate;
    }
    return current;
}

bool DivergingGraph::descends_from(const Key& node, const Key& ancestor) const {
    NodeRef cursor = node;
    std::size_t steps = 0;
    while (cursor && steps <= nodes_.size()) {
        if (*cursor == ancestor) {
            return true;
        }
        const auto it = nodes_.find(*cursor);
        if (it == nodes_.end()) {
            return false;
        }
        cursor = it->second.info.source;
        ++steps;
    }
    return false;
}

void DivergingGraph::add_edge(const Key& source, const Key& target, std::optional<Proposal> data) {
    if (source == target) {
        throw ProtocolViolation("Edge from " + source + " to itself");
    }

    const bool target_known = nodes_.find(target) != nodes_.end();
    if (target_known) {
        const auto& info = nodes_.at(target).info;
        if (info.source.has_value() || info.distance != 0) {
            throw ProtocolViolation("The graph can only split, not join (" + source + " -> " + target + ")");
        }
        if (nodes_.find(source) != nodes_.end() && descends_from(source, target)) {
            throw ProtocolViolation("Edge " + source + " -> " + target + " would close a cycle");
        }
    }

    auto source_it = nodes_.find(source);
    if (source_it == nodes_.end()) {
        Node root{};
        root.info.arrival = next_arrival_++;
        source_it = nodes_.emplace(source, std::move(root)).first;
    }
    source_it->second.children += 1;
    heads_.erase(source);
    const auto target_distance = source_it->second.info.distance + 1;

    if (target_known) {
        graft(source, target, target_distance, std::move(data));
        return;
    }

    Node node{};
    node.info.source = source;
    node.info.distance = target_distance;
    node.info.arrival = next_arrival_++;
    node.info.data = std::move(data);
    nodes_.emplace(target, std::move(node));
    heads_.insert(target);

    if (target_distance > distance_of(furthest_)) {
        set_furthest(target);
    }
}

// Attaches an existing path start below `source`, shifting the distance of
// every node that follows it.
void DivergingGraph::graft(const Key& source, const Key& target, std::int64_t shift, std::optional<Proposal> data) {
    std::unordered_map<Key, bool> follows;
    follows.emplace(target, true);

    std::vector<Key> path;
    for (const auto& head : heads_) {
        path.clear();
        NodeRef cursor = head;
        bool value = false;
        while (cursor) {
            const auto memo = follows.find(*cursor);
            if (memo != follows.end()) {
                value = memo->second;
                break;
            }
            path.push_back(*cursor);
            cursor = nodes_.at(*cursor).info.source;
        }
        for (const auto& key : path) {
            follows.emplace(key, value);
        }
    }

    auto& target_node = nodes_.at(target);
    target_node.info.source = source;
    target_node.info.data = std::move(data);

    NodeRef best = furthest_;
    for (const auto& [key, follows_target] : follows) {
        if (!follows_target) {
            continue;
        }
        nodes_.at(key).info.distance += shift;
    }
    for (const auto& [key, follows_target] : follows) {
        if (follows_target) {
            best = preferred(best, key);
        }
    }
    set_furthest(std::move(best));
}

void DivergingGraph::release_child(const Key& source) {
    const auto it = nodes_.find(source);
    if (it == nodes_.end()) {
        return;
    }
    if (it->second.children > 0) {
        --it->second.children;
    }
    if (it->second.children == 0) {
        heads_.insert(source);
    }
}

void DivergingGraph::remove_node(const Key& key) {
    const auto it = nodes_.find(key);
    if (it == nodes_.end()) {
        return;
    }
    const NodeRef former_source = it->second.info.source;
    nodes_.erase(it);
    heads_.erase(key);

    for (auto& [other, node] : nodes_) {
        if (node.info.source == key) {
            node.info.source.reset();
        }
    }
    if (former_source) {
        release_child(*former_source);
    }

    if (furthest_ == key) {
        NodeRef best = (former_source && nodes_.count(*former_source) > 0) ? former_source : NodeRef{};
        for (const auto& [other, node] : nodes_) {
            best = preferred(best, other);
        }
        set_furthest(std::move(best));
    }
}

std::unordered_map<DivergingGraph::Key, std::int64_t> DivergingGraph::retention_scores() const {
    std::unordered_map<Key, std::int64_t> scores;
    std::vector<Key> path;

    const auto score_from = [&](const Key& start) {
        path.clear();
        NodeRef cursor = start;
        std::int64_t score = kSentinelScore;
        while (cursor) {
            const auto memo = scores.find(*cursor);
            if (memo != scores.end()) {
                score = memo->second;
                break;
            }
            path.push_back(*cursor);
            const auto node = nodes_.find(*cursor);
            cursor = node == nodes_.end() ? NodeRef{} : node->second.info.source;
        }
        for (auto it = path.rbegin(); it != path.rend(); ++it) {
            const auto& info = nodes_.at(*it).info;
            const auto arrival = static_cast<std::int64_t>(info.arrival);
            score = std::max(score - (info.distance - 1), arrival) + info.distance;
            scores[*it] = score;
        }
    };

    for (const auto& head : heads_) {
        score_from(head);
    }
    for (const auto& [key, node] : nodes_) {
        if (scores.find(key) == scores.end()) {
            score_from(key);
        }
    }
    return scores;
}

void DivergingGraph::rebuild_heads() {
    for (auto& [key, node] : nodes_) {
        node.children = 0;
    }
    for (const auto& [key, node] : nodes_) {
        if (!node.info.source) {
            continue;
        }
        const auto parent = nodes_.find(*node.info.source);
        if (parent != nodes_.end()) {
            ++parent->second.children;
        }
    }
    heads_.clear();
    for (const auto& [key, node] : nodes_) {
        if (node.children == 0) {
            heads_.insert(key);
        }
    }
}

void DivergingGraph::prune(std::size_t max_size) {
    if (nodes_.size() <= max_size) {
        return;
    }

    const auto scores = retention_scores();

    std::vector<std::pair<std::uint64_t, Key>> by_arrival;
    by_arrival.reserve(nodes_.size());
    for (const auto& [key, node] : nodes_) {
        by_arrival.emplace_back(node.info.arrival, key);
    }
    std::sort(by_arrival.begin(), by_arrival.end());

    const auto drop_count = nodes_.size() - max_size;
    bool dropped_furthest = false;
    std::int64_t highest_dropped_score = kSentinelScore;
    for (std::size_t i = 0; i < drop_count; ++i) {
        const auto& key = by_arrival[i].second;
        if (furthest_ == key) {
            dropped_furthest = true;
        }
        const auto score = scores.find(key);
        if (score != scores.end()) {
            highest_dropped_score = std::max(highest_dropped_score, score->second);
        }
        nodes_.erase(key);
    }

    for (auto& [key, node] : nodes_) {
        if (node.info.source && nodes_.find(*node.info.source) == nodes_.end()) {
            node.info.source.reset();
        }
    }
    rebuild_heads();

    if (dropped_furthest) {
        NodeRef best{};
        for (const auto& [key, node] : nodes_) {
            best = preferred(best, key);
        }
        set_furthest(std::move(best));
    }

    daemon::StructuredLogger::instance().log(
        daemon::StructuredLogger::Level::Info,
        "history.prune",
        {{"kept", std::to_string(nodes_.size())},
         {"dropped", std::to_string(drop_count)},
         {"highest_dropped_score", std::to_string(highest_dropped_score)}});
}

std::int64_t DivergingGraph::furthest_distance() const {
    return distance_of(furthest_);
}

const DivergingGraph::NodeInfo* DivergingGraph::find(const Key& key) const {
    const auto it = nodes_.find(key);
    return it == nodes_.end() ? nullptr : &it->second.info;
}

bool DivergingGraph::contains(const Key& key) const {
    return nodes_.find(key) != nodes_.end();
}

void DivergingGraph::set_furthest(NodeRef node) {
    if (node == furthest_) {
        return;
    }
    furthest_ = std::move(node);
    if (!advance_handler_) {
        return;
    }
    AdvanceEvent event{};
    event.node = furthest_;
    if (furthest_) {
        event.info = nodes_.at(*furthest_).info;
    } else {
        event.info.distance = kSentinelDistance;
    }
    advance_handler_(event);
}

}  // namespace meshstate::consensus
