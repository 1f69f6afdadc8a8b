//─────────────────────────────────────────────────────────────
// File: src/feasibility.cpp
// Feasibility graph construction from distances and overrides
//─────────────────────────────────────────────────────────────
//
// Phase 1: gateway links
//   - For each node, in node order, measure the gateway distance and
//     classify the pair. Accepted pairs become gateway<->node edges.
//
// Phase 2: node-to-node links
//   - For every unordered pair (i<j) in node order, measure the distance
//     and classify it. Accepted pairs become node<->node edges.
//
// Because gateway edges are inserted first, a node's neighbor list
// always starts with GATEWAY_ID when it has a gateway link, followed by
// its node neighbors in the order the pair loop reaches them.
//
// Cost is O(N^2) distance evaluations; planning sets are small.

#include "feasibility.hpp"
#include "geo.hpp"
#include "logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace lplan {

namespace {

const std::vector<NodeId> kNoNeighbors;

std::string format_km(double km)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << km << "km";
    return os.str();
}

} // anonymous namespace

void FeasibilityGraph::add_vertex(const NodeId& id)
{
    adjacency_.try_emplace(id);
}

void FeasibilityGraph::add_edge(const NodeId& a, const NodeId& b)
{
    adjacency_[a].push_back(b);
    adjacency_[b].push_back(a);
    ++edges_;
}

const std::vector<NodeId>& FeasibilityGraph::neighbors(const NodeId& id) const
{
    auto it = adjacency_.find(id);
    if (it == adjacency_.end())
        return kNoNeighbors;
    return it->second;
}

bool FeasibilityGraph::has_vertex(const NodeId& id) const
{
    return adjacency_.find(id) != adjacency_.end();
}

bool FeasibilityGraph::has_edge(const NodeId& a, const NodeId& b) const
{
    const auto& na = neighbors(a);
    const auto& nb = neighbors(b);
    return std::find(na.begin(), na.end(), b) != na.end() &&
           std::find(nb.begin(), nb.end(), a) != nb.end();
}

const char* link_status_name(LinkStatus s)
{
    switch (s) {
        case LinkStatus::Available:           return "available";
        case LinkStatus::FailedOverride:      return "failed-override";
        case LinkStatus::NoDirectGatewayFlag: return "no-direct-gateway-flag";
        case LinkStatus::DistanceExceeded:    return "distance-exceeded";
    }
    return "unknown";
}

FeasibilityResult build_feasibility_graph(
    const GatewayNode& gateway, const std::vector<RelayNode>& nodes,
    const ConnectionOverrides& overrides, double gateway_threshold_km,
    double node_threshold_km, Logger* log)
{
    FeasibilityResult result;
    result.graph.add_vertex(GATEWAY_ID);
    for (const auto& n : nodes)
        result.graph.add_vertex(n.id);

    const std::size_t n_nodes = nodes.size();
    if (n_nodes > 0)
        result.diagnostics.reserve(n_nodes + n_nodes * (n_nodes - 1) / 2);

    // ------------------------------------------------------------------
    // Phase 1: gateway <-> node
    // ------------------------------------------------------------------
    for (const auto& n : nodes) {
        LinkDiagnostic diag;
        diag.a = GATEWAY_ID;
        diag.b = n.id;
        diag.distance_km = distance_km(gateway.position, n.position);

        if (overrides.contains(GATEWAY_ID, n.id))
            diag.status = LinkStatus::FailedOverride;
        else if (!n.direct_to_gateway)
            diag.status = LinkStatus::NoDirectGatewayFlag;
        else if (diag.distance_km > gateway_threshold_km)
            diag.status = LinkStatus::DistanceExceeded;
        else
            diag.status = LinkStatus::Available;

        if (diag.status == LinkStatus::Available)
            result.graph.add_edge(GATEWAY_ID, n.id);

        if (log) {
            if (diag.status == LinkStatus::Available)
                log->info("Link " + n.id + " -> gateway available (" +
                          format_km(diag.distance_km) + ")");
            else
                log->info("Link " + n.id + " -> gateway rejected: " +
                          link_status_name(diag.status) + " (" +
                          format_km(diag.distance_km) + ")");
        }
        result.diagnostics.push_back(std::move(diag));
    }

    // ------------------------------------------------------------------
    // Phase 2: node <-> node, i < j
    // ------------------------------------------------------------------
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        for (std::size_t j = i + 1; j < nodes.size(); ++j) {
            const RelayNode& a = nodes[i];
            const RelayNode& b = nodes[j];

            LinkDiagnostic diag;
            diag.a = a.id;
            diag.b = b.id;
            diag.distance_km = distance_km(a.position, b.position);

            if (overrides.contains(a.id, b.id))
                diag.status = LinkStatus::FailedOverride;
            else if (!(diag.distance_km < node_threshold_km))
                diag.status = LinkStatus::DistanceExceeded;
            else
                diag.status = LinkStatus::Available;

            if (diag.status == LinkStatus::Available)
                result.graph.add_edge(a.id, b.id);

            if (log) {
                log->info("Link " + a.id + " <-> " + b.id + " " +
                          format_km(diag.distance_km) + " " +
                          (diag.status == LinkStatus::Available
                               ? std::string("available")
                               : std::string("rejected: ") + link_status_name(diag.status)));
            }
            result.diagnostics.push_back(std::move(diag));
        }
    }

    return result;
}

} // namespace lplan
