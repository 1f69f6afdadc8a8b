/*
  File: include/plan_config.hpp

  PlanConfig: every tunable of a planning run.

  Sources (later overrides earlier), assembled in lora_plan_main.cpp:
    1) defaults below
    2) --config FILE   (parse_config_file in plan_io.cpp)
    3) command-line flags

  Field semantics:
    gateway_threshold_km:
      - gateway <-> node link allowed when distance <= this (inclusive)
    node_threshold_km:
      - node <-> node link allowed when distance < this (strict)
      The inclusive/strict difference is kept on purpose; both default to 5.
    max_children:
      - fan-out cap of every relay node (>= 1)
    gateway_max_children:
      - fan-out cap of the gateway; std::nullopt means unlimited
    frequency_pool:
      - downlink channels handed out front-to-back, one per branching node
      - must not overlap the gateway range GATEWAY_FREQ_MIN..GATEWAY_FREQ_MAX
    gateway_frequency:
      - the gateway's own downlink, in GATEWAY_FREQ_MIN..GATEWAY_FREQ_MAX
    on_exhaustion:
      - Fail : abort the frequency stage with FrequencyExhausted
      - Skip : leave the node without a downlink and keep going
*/
#pragma once

#include "common.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lplan {

enum class ExhaustionPolicy { Fail, Skip };

std::vector<int> default_frequency_pool();

struct PlanConfig {
    double gateway_threshold_km = 5.0;
    double node_threshold_km = 5.0;
    std::size_t max_children = 4;
    std::optional<std::size_t> gateway_max_children;
    std::vector<int> frequency_pool = default_frequency_pool();
    int gateway_frequency = 3;
    ExhaustionPolicy on_exhaustion = ExhaustionPolicy::Fail;
};

/* Throws ConfigError describing the first invalid field. */
void validate_config(const PlanConfig& cfg);

/* "fail" / "skip" (case-insensitive); throws ConfigError otherwise. */
ExhaustionPolicy parse_exhaustion_policy(const std::string& token);
const char* exhaustion_policy_name(ExhaustionPolicy p);

/* One-line summary for the log, e.g. "gw<=5km node<5km cap=4 ...". */
std::string describe_config(const PlanConfig& cfg);

} // namespace lplan
