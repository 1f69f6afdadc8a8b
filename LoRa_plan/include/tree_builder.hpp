#ifndef TREE_BUILDER_HPP
#define TREE_BUILDER_HPP

/*
  File: include/tree_builder.hpp

  Capacitated breadth-first tree over a FeasibilityGraph.

  Algorithm (src/tree_builder.cpp):
    - FIFO frontier seeded with GATEWAY_ID
    - on dequeue of `current`, walk neighbors(current) in recorded order:
        * skip GATEWAY_ID (the gateway is never anyone's child)
        * skip nodes already attached
        * attach while children(current) < cap(current), where
            cap(gateway) = gateway_max_children (nullopt = unlimited)
            cap(node)    = max_children
        * attach = parent/children link + enqueue
    - nodes never attached are unreachable

  The result is "first reachable within capacity", not a shortest-path
  tree: a node is taken by whichever frontier node reaches it first with
  spare capacity. Given the same graph it is always the same tree.

  build_tree() is pure: it returns a fresh TreeResult and touches no
  node records, so there is nothing to reset between runs.

  Used in:
    - planner.cpp (second pipeline stage)
    - frequency.cpp (consumes TreeResult)
*/

#include "common.hpp"
#include "feasibility.hpp"
#include "network_state.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace lplan {
    class Logger;

    struct TreeEntry {
        NodeId              parent;
        std::vector<NodeId> children;

        bool operator==(const TreeEntry& o) const
        {
            return parent == o.parent && children == o.children;
        }
    };

    struct TreeResult {
        std::vector<NodeId>                   gateway_children;
        std::unordered_map<NodeId, TreeEntry> attached;     // every reachable node
        std::vector<NodeId>                   attach_order; // BFS attachment order
        std::vector<NodeId>                   unreachable;  // node order

        std::size_t reachable_count() const { return attached.size(); }
        bool is_attached(const NodeId& id) const { return attached.count(id) != 0; }

        /* Children of GATEWAY_ID or of an attached node; empty otherwise. */
        const std::vector<NodeId>& children_of(const NodeId& id) const;

        /* nullopt for the gateway and for unreachable nodes. */
        std::optional<NodeId> parent_of(const NodeId& id) const;

        /* Hops from the gateway (gateway = 0); nullopt if unreachable. */
        std::optional<std::size_t> depth_of(const NodeId& id) const;

        bool operator==(const TreeResult& o) const
        {
            return gateway_children == o.gateway_children && attached == o.attached &&
                   attach_order == o.attach_order && unreachable == o.unreachable;
        }
    };

    /*
      build_tree

      Parameters:
        graph                : output of build_feasibility_graph()
        nodes                : the node set, defines unreachable ordering
        max_children         : per-node fan-out cap
        gateway_max_children : gateway fan-out cap, nullopt = unlimited
        log                  : optional; attachments at INFO, each
                               unreachable node at WARN

      No exceptions. An edgeless graph leaves every node unreachable.
    */
    TreeResult build_tree(const FeasibilityGraph& graph,
                          const std::vector<RelayNode>& nodes,
                          std::size_t max_children,
                          std::optional<std::size_t> gateway_max_children,
                          Logger* log = nullptr);
}

#endif // TREE_BUILDER_HPP
