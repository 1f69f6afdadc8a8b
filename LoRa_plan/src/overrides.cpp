/*─────────────────────────────────────────────────────────────
  overrides.cpp  –  failed-connection set with canonical pair keys
─────────────────────────────────────────────────────────────*/
#include "overrides.hpp"

#include <algorithm>

namespace lplan {

bool ConnectionOverrides::add(const NodeId& a, const NodeId& b)
{
    return pairs_.insert(make_pair_key(a, b)).second;
}

bool ConnectionOverrides::remove(const NodeId& a, const NodeId& b)
{
    return pairs_.erase(make_pair_key(a, b)) > 0;
}

bool ConnectionOverrides::contains(const NodeId& a, const NodeId& b) const
{
    return pairs_.find(make_pair_key(a, b)) != pairs_.end();
}

std::vector<NodePair> ConnectionOverrides::list() const
{
    std::vector<NodePair> out(pairs_.begin(), pairs_.end());
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t ConnectionOverrides::remove_all_for(const NodeId& id)
{
    std::size_t removed = 0;
    for (auto it = pairs_.begin(); it != pairs_.end();) {
        if (it->first == id || it->second == id) {
            it = pairs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace lplan
