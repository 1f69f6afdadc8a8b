/*─────────────────────────────────────────────────────────────
  File: include/common.hpp
  Types & helpers shared across LoRa_plan modules

  This header defines:
  - Node identity conventions (the reserved gateway id)
  - Geographic coordinate type
  - Canonical (order-independent) node-pair keys
  - The exception hierarchy used by the planning pipeline
  - Global physical constants

  Design intent:
  - No heavy dependencies
  - No ownership of large data
  - Keeping these primitives here prevents cyclic dependencies between
    the graph, tree, frequency and I/O modules.
─────────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace lplan {

/*======================================================================
  Node identity
======================================================================*/
/*
  NodeId is a plain string key. Relay nodes carry user-chosen names,
  the single gateway of a planning run always uses GATEWAY_ID.

  GATEWAY_ID is reserved: NetworkState::upsert_node() rejects it, and
  the failed-connection store accepts it as a valid endpoint.
*/
using NodeId = std::string;

inline const NodeId GATEWAY_ID = "gateway";

/*======================================================================
  Coordinate
======================================================================*/
/*
  Geographic position in decimal degrees (WGS84 assumed, not enforced).
  No range validation is performed here; callers are expected to pass
  finite values with |lat| <= 90 and |lon| <= 180.
*/
struct Coordinate {
    double lat = 0.0;
    double lon = 0.0;

    bool operator==(const Coordinate& o) const { return lat == o.lat && lon == o.lon; }
    bool operator!=(const Coordinate& o) const { return !(*this == o); }
};

/*======================================================================
  NodePair
======================================================================*/
/*
  Unordered pair of node ids stored in canonical (lexicographic) order,
  so that make_pair_key(a,b) == make_pair_key(b,a).

  Used by:
    - ConnectionOverrides (failed-connection set)
    - LinkDiagnostic records in the feasibility report
*/
struct NodePair {
    NodeId first;
    NodeId second;

    bool operator==(const NodePair& o) const
    {
        return first == o.first && second == o.second;
    }
    bool operator<(const NodePair& o) const
    {
        if (first != o.first) return first < o.first;
        return second < o.second;
    }
};

inline NodePair make_pair_key(const NodeId& a, const NodeId& b)
{
    if (b < a) return NodePair{b, a};
    return NodePair{a, b};
}

struct NodePairHash {
    std::size_t operator()(const NodePair& p) const
    {
        std::size_t h1 = std::hash<std::string>{}(p.first);
        std::size_t h2 = std::hash<std::string>{}(p.second);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

/*======================================================================
  Errors
======================================================================*/
/*
  All planning failures derive from PlanError so the CLI can separate
  them from I/O or parse errors (plain std::runtime_error).

    InvalidOverridePair : failed-connection endpoint unknown / degenerate
    FrequencyExhausted  : pool drained before all branching nodes served
    NoGateway           : tree/frequency work requested without a gateway
    ConfigError         : PlanConfig value out of range
*/
class PlanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidOverridePair : public PlanError {
public:
    InvalidOverridePair(const NodeId& a, const NodeId& b, const std::string& why)
        : PlanError("Invalid failed connection " + a + " <-> " + b + ": " + why),
          pair_(make_pair_key(a, b)) {}

    const NodePair& pair() const { return pair_; }

private:
    NodePair pair_;
};

class FrequencyExhausted : public PlanError {
public:
    FrequencyExhausted(const NodeId& node, std::size_t unassigned)
        : PlanError("Frequency pool exhausted at node " + node + " (" +
                    std::to_string(unassigned) + " branching node(s) left without downlink)"),
          node_(node), unassigned_(unassigned) {}

    const NodeId& node() const { return node_; }
    std::size_t unassigned() const { return unassigned_; }

private:
    NodeId      node_;
    std::size_t unassigned_;
};

class NoGateway : public PlanError {
public:
    NoGateway() : PlanError("No gateway position set") {}
};

class ConfigError : public PlanError {
public:
    using PlanError::PlanError;
};

/*======================================================================
  Constants
======================================================================*/
/* Mean Earth radius used by the haversine distance, kilometres. */
constexpr double EARTH_RADIUS_KM = 6371.0;

/* Gateway downlink channels live in a 3-bit range, disjoint from the pool. */
constexpr int GATEWAY_FREQ_MIN = 0;
constexpr int GATEWAY_FREQ_MAX = 7;

} // namespace lplan
