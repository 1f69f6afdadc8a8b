#ifndef PLANNER_HPP
#define PLANNER_HPP

/*
  File: include/planner.hpp

  Full planning pipeline and node pre-classification.

    plan_network(state, cfg, log)
      1) validate_config(cfg)                 (ConfigError)
      2) state.gateway()                      (NoGateway)
      3) build_feasibility_graph(...)         feasibility.hpp
      4) build_tree(...)                      tree_builder.hpp
      5) assign_frequencies(...)              frequency.hpp
      6) fold everything into PlanResult

    FrequencyExhausted raised in step 5 is caught and reported through
    PlanResult::frequency (status Exhausted + node + unassigned count);
    the tree part of the result stays valid.

  The state is taken by const reference and never modified, so running
  the same state twice gives identical results.

  Used in:
    - lora_plan_main.cpp
    - plan_report.cpp (consumes PlanResult)
*/

#include "common.hpp"
#include "feasibility.hpp"
#include "frequency.hpp"
#include "network_state.hpp"
#include "plan_config.hpp"
#include "tree_builder.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace lplan {
    class Logger;

    /*
      PlannedNode

      One RelayNode as it comes out of a run. parent is nullopt for
      unreachable nodes; uplink/downlink are nullopt when not assigned.
    */
    struct PlannedNode {
        NodeId                id;
        Coordinate            position;
        bool                  direct_to_gateway = false;
        std::optional<NodeId> parent;
        std::vector<NodeId>   children;
        std::optional<int>    uplink;
        std::optional<int>    downlink;

        bool operator==(const PlannedNode& o) const
        {
            return id == o.id && position == o.position &&
                   direct_to_gateway == o.direct_to_gateway && parent == o.parent &&
                   children == o.children && uplink == o.uplink && downlink == o.downlink;
        }
    };

    struct PlannedGateway {
        Coordinate          position;
        int                 downlink = 0;
        std::vector<NodeId> children;

        bool operator==(const PlannedGateway& o) const
        {
            return position == o.position && downlink == o.downlink && children == o.children;
        }
    };

    enum class FrequencyStatus { Assigned, Exhausted, Skipped };

    const char* frequency_status_name(FrequencyStatus s);

    /*
      FrequencyOutcome

      Assigned  : every branching node has a downlink
      Exhausted : Fail policy aborted at exhausted_node;
                  unassigned = branching nodes left without downlink
      Skipped   : Skip policy; `skipped` lists nodes left without downlink
    */
    struct FrequencyOutcome {
        FrequencyStatus     status = FrequencyStatus::Assigned;
        NodeId              exhausted_node;
        std::size_t         unassigned = 0;
        std::vector<NodeId> skipped;

        bool ok() const { return status == FrequencyStatus::Assigned; }

        bool operator==(const FrequencyOutcome& o) const
        {
            return status == o.status && exhausted_node == o.exhausted_node &&
                   unassigned == o.unassigned && skipped == o.skipped;
        }
    };

    struct PlanResult {
        PlannedGateway              gateway;
        std::vector<PlannedNode>    nodes;          // NetworkState node order
        std::vector<NodeId>         unreachable;    // NetworkState node order
        std::size_t                 reachable_count = 0;
        FeasibilityGraph            graph;
        std::vector<LinkDiagnostic> diagnostics;
        TreeResult                  tree;
        FrequencyOutcome            frequency;

        const PlannedNode* find(const NodeId& id) const;

        bool operator==(const PlanResult& o) const
        {
            return gateway == o.gateway && nodes == o.nodes && unreachable == o.unreachable &&
                   reachable_count == o.reachable_count && graph == o.graph &&
                   diagnostics == o.diagnostics && tree == o.tree && frequency == o.frequency;
        }
    };

    PlanResult plan_network(const NetworkState& state, const PlanConfig& cfg, Logger& log);

    /*
      evaluate_single_node_eligibility

      Pre-classifies a node that is not in the set yet. True when:
        - distance(candidate, gateway) <= gateway_threshold_km, or
        - distance(candidate, node)    <  node_threshold_km for any node
      and, when candidate_id is non-empty, that pair is not a failed
      connection. Existing nodes with id == candidate_id are ignored.

      Throws NoGateway when the state has no gateway.
    */
    bool evaluate_single_node_eligibility(const Coordinate& candidate,
                                          const NetworkState& state,
                                          const PlanConfig& cfg,
                                          const NodeId& candidate_id = NodeId());
}

#endif // PLANNER_HPP
