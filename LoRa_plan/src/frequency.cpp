/*─────────────────────────────────────────────────────────────
  frequency.cpp  –  pool-based downlink allocation along the tree

  BFS order guarantees a parent is processed (and its downlink
  decided) before any of its children are dequeued.
─────────────────────────────────────────────────────────────*/
#include "frequency.hpp"
#include "logger.hpp"

namespace lplan {

std::optional<int> FrequencyPool::take()
{
    if (values_.empty())
        return std::nullopt;
    int v = values_.front();
    values_.pop_front();
    return v;
}

const NodeFrequencies* FrequencyAssignment::find(const NodeId& id) const
{
    auto it = by_node.find(id);
    if (it == by_node.end())
        return nullptr;
    return &it->second;
}

/* count of attached nodes that need a downlink */
static std::size_t count_branching(const TreeResult& tree)
{
    std::size_t n = 0;
    for (const auto& kv : tree.attached)
        if (!kv.second.children.empty())
            ++n;
    return n;
}

void assign_frequencies(const TreeResult& tree, const PlanConfig& cfg,
                        FrequencyAssignment& out, Logger* log)
{
    out.gateway_downlink = cfg.gateway_frequency;
    out.by_node.clear();
    out.skipped.clear();

    FrequencyPool pool(cfg.frequency_pool);
    const std::size_t branching = count_branching(tree);
    std::size_t served = 0;

    std::deque<NodeId> queue(tree.gateway_children.begin(), tree.gateway_children.end());

    while (!queue.empty()) {
        const NodeId current = queue.front();
        queue.pop_front();

        auto entry = tree.attached.find(current);
        if (entry == tree.attached.end())
            continue;

        NodeFrequencies& freqs = out.by_node[current];

        /*---------------------------------------------------------
          Uplink follows the parent's downlink. A parent skipped
          under ExhaustionPolicy::Skip leaves this unset.
        ---------------------------------------------------------*/
        const NodeId& parent = entry->second.parent;
        if (parent == GATEWAY_ID) {
            freqs.uplink = out.gateway_downlink;
        } else {
            auto p = out.by_node.find(parent);
            if (p != out.by_node.end())
                freqs.uplink = p->second.downlink;
        }

        const std::vector<NodeId>& children = entry->second.children;
        if (!children.empty()) {
            std::optional<int> f = pool.take();
            if (f) {
                freqs.downlink = *f;
                ++served;
            } else if (cfg.on_exhaustion == ExhaustionPolicy::Fail) {
                throw FrequencyExhausted(current, branching - served);
            } else {
                out.skipped.push_back(current);
                if (log)
                    log->warn("No downlink frequency left for " + current + " (" +
                              std::to_string(children.size()) +
                              " child(ren) keep an unset uplink)");
            }
        }

        queue.insert(queue.end(), children.begin(), children.end());
    }
}

FrequencyAssignment assign_frequencies(const TreeResult& tree, const PlanConfig& cfg,
                                       Logger* log)
{
    FrequencyAssignment out;
    assign_frequencies(tree, cfg, out, log);
    return out;
}

} // namespace lplan
