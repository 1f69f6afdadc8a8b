/*─────────────────────────────────────────────────────────────
  network_state.cpp  –  gateway, ordered node set, checked overrides
─────────────────────────────────────────────────────────────*/
#include "network_state.hpp"

namespace lplan {

void NetworkState::set_gateway(const Coordinate& position)
{
    gateway_ = GatewayNode{position};
}

const GatewayNode& NetworkState::gateway() const
{
    if (!gateway_)
        throw NoGateway();
    return *gateway_;
}

bool NetworkState::upsert_node(const NodeId& id, const Coordinate& position,
                               bool direct_to_gateway)
{
    if (id.empty())
        throw std::invalid_argument("Node id must not be empty");
    if (id == GATEWAY_ID)
        throw std::invalid_argument("Node id \"" + GATEWAY_ID + "\" is reserved for the gateway");

    auto it = index_.find(id);
    if (it != index_.end()) {
        RelayNode& n = nodes_[it->second];
        n.position = position;
        n.direct_to_gateway = direct_to_gateway;
        return false;
    }

    index_.emplace(id, nodes_.size());
    nodes_.push_back(RelayNode{id, position, direct_to_gateway});
    return true;
}

bool NetworkState::remove_node(const NodeId& id)
{
    auto it = index_.find(id);
    if (it == index_.end())
        return false;

    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(it->second));

    index_.clear();
    for (std::size_t i = 0; i < nodes_.size(); ++i)
        index_.emplace(nodes_[i].id, i);

    overrides_.remove_all_for(id);
    return true;
}

const RelayNode* NetworkState::find_node(const NodeId& id) const
{
    auto it = index_.find(id);
    if (it == index_.end())
        return nullptr;
    return &nodes_[it->second];
}

bool NetworkState::is_known_endpoint(const NodeId& id) const
{
    return id == GATEWAY_ID || index_.count(id) != 0;
}

bool NetworkState::add_failed_connection(const NodeId& a, const NodeId& b)
{
    if (a == b)
        throw InvalidOverridePair(a, b, "both endpoints are the same");
    if (!is_known_endpoint(a))
        throw InvalidOverridePair(a, b, "unknown endpoint " + a);
    if (!is_known_endpoint(b))
        throw InvalidOverridePair(a, b, "unknown endpoint " + b);
    return overrides_.add(a, b);
}

bool NetworkState::remove_failed_connection(const NodeId& a, const NodeId& b)
{
    return overrides_.remove(a, b);
}

} // namespace lplan
