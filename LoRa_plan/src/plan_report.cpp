/*─────────────────────────────────────────────────────────────
  plan_report.cpp  –  tree rendering, configuration commands, log
                      summaries for a finished PlanResult
─────────────────────────────────────────────────────────────*/
#include "plan_report.hpp"
#include "logger.hpp"

#include <map>
#include <ostream>
#include <sstream>

namespace lplan::report {

namespace {

std::string freq_str(const std::optional<int>& f)
{
    return f ? std::to_string(*f) : std::string("none");
}

void print_subtree(std::ostream& out, const PlanResult& result, const NodeId& id,
                   size_t level)
{
    const std::string indent(level * 4, ' ');
    const PlannedNode* node = result.find(id);
    if (!node)
        return;

    out << indent << "└── " << node->id << '\n';
    out << indent << "    ├── Parent: " << node->parent.value_or("-") << '\n';
    out << indent << "    └── Freq UP: " << freq_str(node->uplink);
    if (node->downlink)
        out << ", Freq DOWN: " << *node->downlink;
    out << '\n';

    for (const auto& child : node->children)
        print_subtree(out, result, child, level + 1);
}

} // anonymous namespace

std::vector<std::string> configuration_commands(const PlanResult& result)
{
    std::vector<std::string> commands;
    for (const auto& n : result.nodes) {
        if (!n.parent)
            continue;
        std::string cmd = "CONFIG_NODE " + n.id + ": PARENT=" + *n.parent +
                          ", FREQ_UP=" + freq_str(n.uplink);
        if (n.downlink)
            cmd += ", FREQ_DOWN=" + std::to_string(*n.downlink);
        commands.push_back(std::move(cmd));
    }
    return commands;
}

void print_tree(std::ostream& out, const PlanResult& result)
{
    out << "Gateway (Freq DOWN: " << result.gateway.downlink << ")\n";
    for (const auto& child : result.gateway.children)
        print_subtree(out, result, child, 1);
}

void log_link_summary(const PlanResult& result, Logger& log)
{
    std::map<std::string, size_t> by_reason;
    size_t available = 0;
    for (const auto& d : result.diagnostics) {
        if (d.status == LinkStatus::Available)
            ++available;
        else
            ++by_reason[link_status_name(d.status)];
    }

    log.info("Links evaluated: " + std::to_string(result.diagnostics.size()) +
             ", available: " + std::to_string(available));
    for (const auto& kv : by_reason)
        log.info("  rejected (" + kv.first + "): " + std::to_string(kv.second));
}

void log_unreachable(const PlanResult& result, Logger& log)
{
    if (result.unreachable.empty()) {
        log.info("All nodes are reachable");
        return;
    }

    log.warn(std::to_string(result.unreachable.size()) + " node(s) cannot reach the gateway");
    for (const auto& id : result.unreachable) {
        const PlannedNode* n = result.find(id);
        std::ostringstream os;
        os << "  " << id;
        if (n)
            os << " at (" << n->position.lat << ", " << n->position.lon << ")";
        log.warn(os.str());
    }
}

void log_failed_connections(const ConnectionOverrides& overrides, Logger& log)
{
    if (overrides.empty()) {
        log.info("No manually failed connections");
        return;
    }
    log.info("Manually failed connections:");
    for (const auto& p : overrides.list())
        log.info("  " + p.first + " <-> " + p.second);
}

void log_frequency_outcome(const PlanResult& result, Logger& log)
{
    const FrequencyOutcome& f = result.frequency;
    switch (f.status) {
        case FrequencyStatus::Assigned:
            log.info("Frequencies assigned (gateway downlink " +
                     std::to_string(result.gateway.downlink) + ")");
            break;
        case FrequencyStatus::Exhausted:
            log.info("Frequency outcome: exhausted at " + f.exhausted_node + ", " +
                     std::to_string(f.unassigned) + " branching node(s) without downlink");
            break;
        case FrequencyStatus::Skipped:
            for (const auto& id : f.skipped)
                log.warn("Skipped downlink for " + id);
            break;
    }
}

} // namespace lplan::report
