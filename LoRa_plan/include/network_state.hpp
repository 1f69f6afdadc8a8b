/*
  File: include/network_state.hpp

  NetworkState: the long-lived input of every planning run.

  Holds:
    - the gateway position (optional until set)
    - the relay/leaf node set, kept in insertion order
    - the failed-connection overrides

  It carries no tree or frequency data; plan_network() derives those
  fresh on each run and returns them in PlanResult (planner.hpp).

  Insertion order matters: the feasibility graph builder walks nodes in
  this order, which fixes each node's neighbor order and therefore the
  BFS tree. Re-adding an existing id updates it in place and keeps its
  slot.

  Used in:
    - planner.cpp (plan_network, evaluate_single_node_eligibility)
    - plan_io.cpp (network definition reader, failed list reader)
    - lora_plan_main.cpp
*/
#pragma once

#include "common.hpp"
#include "overrides.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace lplan {

/*
  GatewayNode

  Only the position is long-lived. Its downlink frequency comes from
  PlanConfig::gateway_frequency and its children from the tree builder.
*/
struct GatewayNode {
    Coordinate position;
};

/*
  RelayNode

  id                : unique key within the node set (not GATEWAY_ID)
  position          : coordinate in degrees
  direct_to_gateway : eligible for a direct gateway link
*/
struct RelayNode {
    NodeId     id;
    Coordinate position;
    bool       direct_to_gateway = false;
};

class NetworkState
{
public:
    void set_gateway(const Coordinate& position);
    bool has_gateway() const { return gateway_.has_value(); }

    /* Throws NoGateway when unset. */
    const GatewayNode& gateway() const;

    /*
      Insert or update a node. Throws std::invalid_argument for an empty
      id or for GATEWAY_ID. Returns true when the node is new.
    */
    bool upsert_node(const NodeId& id, const Coordinate& position, bool direct_to_gateway);

    /*
      Remove a node and every failed connection that references it.
      Returns false when the id is unknown.
    */
    bool remove_node(const NodeId& id);

    const RelayNode* find_node(const NodeId& id) const;

    /* true for GATEWAY_ID and any known node id */
    bool is_known_endpoint(const NodeId& id) const;

    const std::vector<RelayNode>& nodes() const { return nodes_; }

    /*
      Checked failed-connection insert.

      Throws InvalidOverridePair when:
        - an endpoint is neither GATEWAY_ID nor a known node id
        - both endpoints are the same id
      Returns false if the pair was already present.
    */
    bool add_failed_connection(const NodeId& a, const NodeId& b);

    /* Returns whether the pair was present. */
    bool remove_failed_connection(const NodeId& a, const NodeId& b);

    const ConnectionOverrides& overrides() const { return overrides_; }

private:
    std::optional<GatewayNode>              gateway_;
    std::vector<RelayNode>                  nodes_;
    std::unordered_map<NodeId, std::size_t> index_;     // id -> slot in nodes_
    ConnectionOverrides                     overrides_;
};

} // namespace lplan
