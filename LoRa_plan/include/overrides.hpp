/*
  File: include/overrides.hpp

  ConnectionOverrides: in-memory set of manually failed connections.

  A failed connection is an unordered pair of node ids (the gateway id
  is a valid endpoint) that must never become a feasibility-graph edge,
  whatever the distance between the two radios.

  Every operation first normalizes (a,b) through make_pair_key() so
  add(x,y) and contains(y,x) agree.

  Used in:
    - planner.hpp / NetworkState (owned copy, checked add/remove)
    - feasibility.cpp (read-only membership tests)
    - plan_io.cpp (failed-connection list load/save)

  Endpoint validation against the node set is not done here; see
  NetworkState::add_failed_connection().
*/
#pragma once

#include "common.hpp"

#include <unordered_set>
#include <vector>

namespace lplan {

class ConnectionOverrides
{
public:
    /* Insert the pair. Returns false if it was already present. */
    bool add(const NodeId& a, const NodeId& b);

    /* Erase the pair. Returns whether it was present. */
    bool remove(const NodeId& a, const NodeId& b);

    bool contains(const NodeId& a, const NodeId& b) const;

    /* Canonical pairs, sorted ascending (stable output for reports/files). */
    std::vector<NodePair> list() const;

    /* Drop every pair that has `id` as an endpoint; returns the count. */
    std::size_t remove_all_for(const NodeId& id);

    std::size_t size() const { return pairs_.size(); }
    bool empty() const { return pairs_.empty(); }
    void clear() { pairs_.clear(); }

private:
    std::unordered_set<NodePair, NodePairHash> pairs_;
};

} // namespace lplan
