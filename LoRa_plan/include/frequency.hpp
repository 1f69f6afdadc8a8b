#ifndef FREQUENCY_HPP
#define FREQUENCY_HPP

/*
  File: include/frequency.hpp

  Downlink/uplink channel assignment along a planned tree.

  Rules:
    - the gateway downlink is PlanConfig::gateway_frequency (0..7) and
      never comes from the pool
    - BFS from the gateway's children: uplink(node) = downlink(parent)
    - a node with children takes the next pool value as its downlink;
      leaves get no downlink
    - every pool value goes to at most one node per run; the pool is
      rebuilt from PlanConfig on every call

  Exhaustion (pool empty while a branching node still needs a downlink):
    - ExhaustionPolicy::Fail : throw FrequencyExhausted(node, unassigned)
    - ExhaustionPolicy::Skip : leave the node without a downlink (its
                               children keep an unset uplink), log WARN,
                               record it in FrequencyAssignment::skipped

  Used in:
    - planner.cpp (third pipeline stage)
*/

#include "common.hpp"
#include "plan_config.hpp"
#include "tree_builder.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

namespace lplan {
    class Logger;

    /*
      FrequencyPool

      Ordered, consume-only channel list.
    */
    class FrequencyPool {
    public:
        explicit FrequencyPool(const std::vector<int>& values)
            : values_(values.begin(), values.end()) {}

        /* Front value, or nullopt when drained. */
        std::optional<int> take();

        bool empty() const { return values_.empty(); }
        std::size_t remaining() const { return values_.size(); }

    private:
        std::deque<int> values_;
    };

    struct NodeFrequencies {
        std::optional<int> uplink;
        std::optional<int> downlink;

        bool operator==(const NodeFrequencies& o) const
        {
            return uplink == o.uplink && downlink == o.downlink;
        }
    };

    struct FrequencyAssignment {
        int                                         gateway_downlink = 0;
        std::unordered_map<NodeId, NodeFrequencies> by_node;
        std::vector<NodeId>                         skipped;

        /* nullptr when the node was never reached by the walk */
        const NodeFrequencies* find(const NodeId& id) const;

        bool operator==(const FrequencyAssignment& o) const
        {
            return gateway_downlink == o.gateway_downlink && by_node == o.by_node &&
                   skipped == o.skipped;
        }
    };

    /*
      assign_frequencies (filling form)

      Writes into `out` as the walk proceeds, so when FrequencyExhausted
      is thrown `out` still holds every assignment made before the
      offending node. FrequencyExhausted::unassigned() counts branching
      nodes left without a downlink, the offending node included.
    */
    void assign_frequencies(const TreeResult& tree, const PlanConfig& cfg,
                            FrequencyAssignment& out, Logger* log = nullptr);

    FrequencyAssignment assign_frequencies(const TreeResult& tree, const PlanConfig& cfg,
                                           Logger* log = nullptr);
}

#endif // FREQUENCY_HPP
