/*
  File: include/plan_report.hpp

  Human-readable views of a PlanResult.

    configuration_commands : one CONFIG_NODE line per attached node, in
                             node order, e.g.
                               CONFIG_NODE relay-1: PARENT=gateway, FREQ_UP=3, FREQ_DOWN=16
                             an unset uplink prints as "none"
    print_tree             : indented tree from the gateway down
    log_link_summary       : per-reason counts of rejected links
    log_unreachable        : WARN per unreachable node with its position
    log_failed_connections : current failed-connection list
    log_frequency_outcome  : exhaustion / skip report

  Called in:
    - lora_plan_main.cpp after plan_network()
    - plan_io.cpp (write_routes_file uses configuration_commands)
*/
#pragma once

#include "overrides.hpp"
#include "planner.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace lplan {
class Logger;
}

namespace lplan::report {

std::vector<std::string> configuration_commands(const PlanResult& result);

void print_tree(std::ostream& out, const PlanResult& result);

void log_link_summary(const PlanResult& result, Logger& log);
void log_unreachable(const PlanResult& result, Logger& log);
void log_failed_connections(const ConnectionOverrides& overrides, Logger& log);
void log_frequency_outcome(const PlanResult& result, Logger& log);

} // namespace lplan::report
