#ifndef FEASIBILITY_HPP
#define FEASIBILITY_HPP

/*
  File: include/feasibility.hpp

  Public interface for the feasibility graph builder.

  Usage in this codebase:

    - planner.cpp:
        * build_feasibility_graph(gateway, nodes, overrides, gw_km, node_km, log)
          is the first stage of plan_network(). Its graph feeds
          build_tree() (tree_builder.hpp); its diagnostics are copied into
          PlanResult for the link report.

    - plan_report.cpp:
        * log_link_report() prints one line per LinkDiagnostic.

  Link rules (distances from geo.hpp::distance_km):
    - gateway <-> node : node.direct_to_gateway
                         && distance <= gateway_threshold_km
                         && pair not overridden
    - node <-> node    : distance <  node_threshold_km
                         && pair not overridden
    The inclusive/strict asymmetry is deliberate and preserved.
*/

#include "common.hpp"
#include "network_state.hpp"
#include "overrides.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace lplan {
    class Logger;

    /*
      FeasibilityGraph

      Undirected adjacency keyed by node id (GATEWAY_ID included).

      Invariants:
        - every node passed to the builder, and the gateway, has an entry
          (possibly empty)
        - add_edge() inserts both directions, so B in neighbors(A)
          iff A in neighbors(B)
        - neighbor lists keep insertion order; the tree builder depends
          on it for its deterministic tie-break
    */
    class FeasibilityGraph {
    public:
        void add_vertex(const NodeId& id);
        void add_edge(const NodeId& a, const NodeId& b);

        /* Empty list for unknown ids. */
        const std::vector<NodeId>& neighbors(const NodeId& id) const;

        bool has_vertex(const NodeId& id) const;
        bool has_edge(const NodeId& a, const NodeId& b) const;

        std::size_t vertex_count() const { return adjacency_.size(); }
        std::size_t edge_count() const { return edges_; }

        const std::unordered_map<NodeId, std::vector<NodeId>>& adjacency() const
        {
            return adjacency_;
        }

        bool operator==(const FeasibilityGraph& o) const
        {
            return edges_ == o.edges_ && adjacency_ == o.adjacency_;
        }

    private:
        std::unordered_map<NodeId, std::vector<NodeId>> adjacency_;
        std::size_t edges_ = 0;
    };

    /*
      LinkStatus

      Classification of one evaluated pair. Reason precedence:
        gateway pairs : FailedOverride, NoDirectGatewayFlag, DistanceExceeded
        node pairs    : FailedOverride, DistanceExceeded
    */
    enum class LinkStatus {
        Available,
        FailedOverride,
        NoDirectGatewayFlag,
        DistanceExceeded
    };

    const char* link_status_name(LinkStatus s);

    /*
      LinkDiagnostic

      One record per evaluated pair, in evaluation order (all gateway
      pairs first, then node pairs i<j). a is GATEWAY_ID for gateway
      pairs. Report-only: nothing downstream reads these.
    */
    struct LinkDiagnostic {
        NodeId     a;
        NodeId     b;
        double     distance_km = 0.0;
        LinkStatus status = LinkStatus::Available;

        bool operator==(const LinkDiagnostic& o) const
        {
            return a == o.a && b == o.b && distance_km == o.distance_km && status == o.status;
        }
    };

    struct FeasibilityResult {
        FeasibilityGraph            graph;
        std::vector<LinkDiagnostic> diagnostics;
    };

    /*
      build_feasibility_graph

      Never fails. An empty node list yields a graph holding only the
      gateway vertex. Each decision is logged at INFO when log != nullptr.
    */
    FeasibilityResult build_feasibility_graph(
        const GatewayNode& gateway, const std::vector<RelayNode>& nodes,
        const ConnectionOverrides& overrides, double gateway_threshold_km,
        double node_threshold_km, Logger* log = nullptr);
}

#endif // FEASIBILITY_HPP
