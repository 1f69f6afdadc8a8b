//─────────────────────────────────────────────────────────────
// File: src/tree_builder.cpp
//
// Greedy capacitated BFS tree rooted at the gateway.
//
// Capacity is checked eagerly while `current` is being expanded, so a
// full node simply passes over the remaining neighbors; they stay
// unattached and may still be picked up by a later frontier node.
//─────────────────────────────────────────────────────────────
#include "tree_builder.hpp"
#include "logger.hpp"

#include <deque>

namespace lplan {

namespace {
const std::vector<NodeId> kNoChildren;
}

const std::vector<NodeId>& TreeResult::children_of(const NodeId& id) const
{
    if (id == GATEWAY_ID)
        return gateway_children;
    auto it = attached.find(id);
    if (it == attached.end())
        return kNoChildren;
    return it->second.children;
}

std::optional<NodeId> TreeResult::parent_of(const NodeId& id) const
{
    auto it = attached.find(id);
    if (it == attached.end())
        return std::nullopt;
    return it->second.parent;
}

std::optional<std::size_t> TreeResult::depth_of(const NodeId& id) const
{
    if (id == GATEWAY_ID)
        return 0;

    std::size_t depth = 0;
    NodeId cur = id;
    // bounded by the attached count: a longer walk would mean a cycle
    while (cur != GATEWAY_ID) {
        auto it = attached.find(cur);
        if (it == attached.end() || depth > attached.size())
            return std::nullopt;
        cur = it->second.parent;
        ++depth;
    }
    return depth;
}

TreeResult build_tree(const FeasibilityGraph& graph,
                      const std::vector<RelayNode>& nodes,
                      std::size_t max_children,
                      std::optional<std::size_t> gateway_max_children,
                      Logger* log)
{
    TreeResult tree;
    tree.attach_order.reserve(nodes.size());

    std::deque<NodeId> frontier;
    frontier.push_back(GATEWAY_ID);

    while (!frontier.empty()) {
        const NodeId current = frontier.front();
        frontier.pop_front();

        const bool at_gateway = (current == GATEWAY_ID);
        std::vector<NodeId>& children =
            at_gateway ? tree.gateway_children : tree.attached[current].children;

        for (const NodeId& neighbor : graph.neighbors(current)) {
            if (neighbor == GATEWAY_ID || tree.is_attached(neighbor))
                continue;

            const bool has_room = at_gateway
                ? (!gateway_max_children || children.size() < *gateway_max_children)
                : children.size() < max_children;
            if (!has_room)
                continue;

            children.push_back(neighbor);
            tree.attached[neighbor].parent = current;
            tree.attach_order.push_back(neighbor);
            frontier.push_back(neighbor);

            if (log)
                log->info("Tree: " + current + " -> " + neighbor);
        }
    }

    for (const auto& n : nodes) {
        if (!tree.is_attached(n.id))
            tree.unreachable.push_back(n.id);
    }

    if (log) {
        for (const auto& id : tree.unreachable)
            log->warn("Node " + id + " is unreachable from the gateway");
    }

    return tree;
}

} // namespace lplan
