/*─────────────────────────────────────────────────────────────
  plan_config.cpp  –  PlanConfig defaults, validation, printing
─────────────────────────────────────────────────────────────*/
#include "plan_config.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace lplan {

std::vector<int> default_frequency_pool()
{
    std::vector<int> pool;
    for (int f = 16; f <= 30; ++f)
        pool.push_back(f);
    return pool;
}

void validate_config(const PlanConfig& cfg)
{
    if (!(cfg.gateway_threshold_km >= 0.0))
        throw ConfigError("gateway_threshold_km must be >= 0");
    if (!(cfg.node_threshold_km >= 0.0))
        throw ConfigError("node_threshold_km must be >= 0");
    if (cfg.max_children < 1)
        throw ConfigError("max_children must be >= 1");
    if (cfg.gateway_max_children && *cfg.gateway_max_children < 1)
        throw ConfigError("gateway_max_children must be >= 1 or unlimited");

    if (cfg.gateway_frequency < GATEWAY_FREQ_MIN || cfg.gateway_frequency > GATEWAY_FREQ_MAX)
        throw ConfigError("gateway_frequency " + std::to_string(cfg.gateway_frequency) +
                          " outside " + std::to_string(GATEWAY_FREQ_MIN) + "-" +
                          std::to_string(GATEWAY_FREQ_MAX));

    for (int f : cfg.frequency_pool) {
        if (f >= GATEWAY_FREQ_MIN && f <= GATEWAY_FREQ_MAX)
            throw ConfigError("frequency pool value " + std::to_string(f) +
                              " overlaps the gateway range");
    }

    std::vector<int> sorted = cfg.frequency_pool;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
        throw ConfigError("frequency pool contains duplicate values");
}

ExhaustionPolicy parse_exhaustion_policy(const std::string& token)
{
    std::string t;
    for (char c : token)
        t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "fail") return ExhaustionPolicy::Fail;
    if (t == "skip") return ExhaustionPolicy::Skip;
    throw ConfigError("on_exhaustion must be fail or skip, got \"" + token + '"');
}

const char* exhaustion_policy_name(ExhaustionPolicy p)
{
    return p == ExhaustionPolicy::Skip ? "skip" : "fail";
}

std::string describe_config(const PlanConfig& cfg)
{
    std::ostringstream os;
    os << "gw<=" << cfg.gateway_threshold_km << "km"
       << " node<" << cfg.node_threshold_km << "km"
       << " cap=" << cfg.max_children
       << " gw_cap=";
    if (cfg.gateway_max_children)
        os << *cfg.gateway_max_children;
    else
        os << "unlimited";
    os << " pool=" << cfg.frequency_pool.size() << " ch";
    if (!cfg.frequency_pool.empty())
        os << " [" << cfg.frequency_pool.front() << ".." << cfg.frequency_pool.back() << "]";
    os << " gw_freq=" << cfg.gateway_frequency
       << " on_exhaustion=" << exhaustion_policy_name(cfg.on_exhaustion);
    return os.str();
}

} // namespace lplan
