//─────────────────────────────────────────────────────────────
// File: src/planner.cpp
//
// plan_network() entry point.
//
// Orchestrates the three planning stages over a const NetworkState:
//   - feasibility graph (feasibility.cpp)
//   - capacitated BFS tree (tree_builder.cpp)
//   - frequency assignment (frequency.cpp)
// and folds their outputs into one PlanResult.
//─────────────────────────────────────────────────────────────
#include "planner.hpp"
#include "geo.hpp"
#include "logger.hpp"

namespace lplan {

const char* frequency_status_name(FrequencyStatus s)
{
    switch (s) {
        case FrequencyStatus::Assigned:  return "assigned";
        case FrequencyStatus::Exhausted: return "exhausted";
        case FrequencyStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

const PlannedNode* PlanResult::find(const NodeId& id) const
{
    for (const auto& n : nodes)
        if (n.id == id)
            return &n;
    return nullptr;
}

PlanResult plan_network(const NetworkState& state, const PlanConfig& cfg, Logger& log)
{
    validate_config(cfg);
    const GatewayNode& gw = state.gateway();

    log.info("Planning " + std::to_string(state.nodes().size()) + " node(s), " +
             std::to_string(state.overrides().size()) + " failed connection(s)");
    log.info("Config   : " + describe_config(cfg));

    PlanResult result;

    /*---------------------------------------------------------
      Stage 1: feasibility graph
    ---------------------------------------------------------*/
    FeasibilityResult feas = build_feasibility_graph(
        gw, state.nodes(), state.overrides(), cfg.gateway_threshold_km,
        cfg.node_threshold_km, &log);
    log.info("Feasibility graph: " + std::to_string(feas.graph.edge_count()) + " link(s)");

    /*---------------------------------------------------------
      Stage 2: capacitated tree
    ---------------------------------------------------------*/
    result.tree = build_tree(feas.graph, state.nodes(), cfg.max_children,
                             cfg.gateway_max_children, &log);
    result.graph = std::move(feas.graph);
    result.diagnostics = std::move(feas.diagnostics);
    result.unreachable = result.tree.unreachable;
    result.reachable_count = result.tree.reachable_count();

    log.info("Connected nodes   : " + std::to_string(result.reachable_count));
    log.info("Unreachable nodes : " + std::to_string(result.unreachable.size()));
    log.info("Failed connections: " + std::to_string(state.overrides().size()));

    /*---------------------------------------------------------
      Stage 3: frequencies. Exhaustion under the Fail policy is
      reported, not rethrown; assignments made before it are kept.
    ---------------------------------------------------------*/
    FrequencyAssignment freq;
    try {
        assign_frequencies(result.tree, cfg, freq, &log);
        if (!freq.skipped.empty()) {
            result.frequency.status = FrequencyStatus::Skipped;
            result.frequency.skipped = freq.skipped;
            result.frequency.unassigned = freq.skipped.size();
        }
    }
    catch (const FrequencyExhausted& ex) {
        log.error(ex.what());
        result.frequency.status = FrequencyStatus::Exhausted;
        result.frequency.exhausted_node = ex.node();
        result.frequency.unassigned = ex.unassigned();
    }

    /*---------------------------------------------------------
      Fold into planned records
    ---------------------------------------------------------*/
    result.gateway.position = gw.position;
    result.gateway.downlink = cfg.gateway_frequency;
    result.gateway.children = result.tree.gateway_children;

    result.nodes.reserve(state.nodes().size());
    for (const auto& n : state.nodes()) {
        PlannedNode p;
        p.id = n.id;
        p.position = n.position;
        p.direct_to_gateway = n.direct_to_gateway;
        p.parent = result.tree.parent_of(n.id);
        p.children = result.tree.children_of(n.id);
        if (const NodeFrequencies* f = freq.find(n.id)) {
            p.uplink = f->uplink;
            p.downlink = f->downlink;
        }
        result.nodes.push_back(std::move(p));
    }

    return result;
}

bool evaluate_single_node_eligibility(const Coordinate& candidate,
                                      const NetworkState& state,
                                      const PlanConfig& cfg,
                                      const NodeId& candidate_id)
{
    const GatewayNode& gw = state.gateway();
    const ConnectionOverrides& ov = state.overrides();
    const bool check_overrides = !candidate_id.empty();

    if (distance_km(candidate, gw.position) <= cfg.gateway_threshold_km &&
        !(check_overrides && ov.contains(GATEWAY_ID, candidate_id)))
        return true;

    for (const auto& n : state.nodes()) {
        if (n.id == candidate_id)
            continue;
        if (check_overrides && ov.contains(n.id, candidate_id))
            continue;
        if (distance_km(candidate, n.position) < cfg.node_threshold_km)
            return true;
    }
    return false;
}

} // namespace lplan
