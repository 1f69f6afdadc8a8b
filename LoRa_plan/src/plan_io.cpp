/*─────────────────────────────────────────────────────────────
// File: src/plan_io.cpp
// Network definition, configuration and failed-list readers/writers
//─────────────────────────────────────────────────────────────
//
// Responsibilities:
//   - Parse line-oriented network definition files into a NetworkState
//   - Parse "key value" configuration files into a PlanConfig
//   - Load/save the failed-connection list
//   - Write the routes file consumed by field configuration tools
//
// Input format (network definition):
//
//       gateway  40.7128  -74.0060
//       node     relay-1  40.7200  -74.0100  direct
//       node     leaf-7   40.7300  -74.0200
//       failed   gateway  relay-1
//
// Design notes:
//   - Keywords are matched case-insensitively.
//   - failed lines are collected and applied after every node line, so
//     they may appear anywhere in the file.
//   - Errors carry "<source>:<line>: " so a user can jump to the line.
//
// This module is purely concerned with text formats; planning happens
// in planner.cpp.
───────────────────────────────────────────────────────────────*/
#include "plan_io.hpp"
#include "plan_report.hpp"
#include "planner.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace lplan::io {

namespace {

std::string where(const std::string& source, size_t line_no)
{
    return source + ":" + std::to_string(line_no) + ": ";
}

struct PendingFailed {
    NodeId a;
    NodeId b;
    size_t line_no = 0;
};

} // anonymous namespace

/*-------------------------------------------------------------
  parse_network

  Builds a NetworkState from definition text.

  Validation:
    - wrong token counts, bad numbers, bad flags -> runtime_error
    - second gateway line                        -> runtime_error
    - failed pair with an unknown endpoint       -> InvalidOverridePair
-------------------------------------------------------------*/
NetworkState parse_network(std::istream& in, const std::string& source)
{
    NetworkState state;
    std::vector<PendingFailed> failed;
    bool have_gateway = false;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::vector<std::string> tokens = split_tokens(line);
        if (tokens.empty())
            continue;

        const std::string keyword = normalize_token(tokens.front());
        try {
            if (keyword == "gateway") {
                if (tokens.size() != 3)
                    throw std::runtime_error("expected: gateway <lat> <lon>");
                if (have_gateway)
                    throw std::runtime_error("gateway defined more than once");
                state.set_gateway(Coordinate{parse_double(tokens[1], "latitude"),
                                             parse_double(tokens[2], "longitude")});
                have_gateway = true;
            }
            else if (keyword == "node") {
                if (tokens.size() != 4 && tokens.size() != 5)
                    throw std::runtime_error("expected: node <id> <lat> <lon> [direct]");
                bool direct = tokens.size() == 5 ? parse_flag(tokens[4]) : false;
                state.upsert_node(tokens[1],
                                  Coordinate{parse_double(tokens[2], "latitude"),
                                             parse_double(tokens[3], "longitude")},
                                  direct);
            }
            else if (keyword == "failed") {
                if (tokens.size() != 3)
                    throw std::runtime_error("expected: failed <a> <b>");
                failed.push_back(PendingFailed{tokens[1], tokens[2], line_no});
            }
            else {
                throw std::runtime_error("unknown keyword \"" + tokens.front() + '"');
            }
        }
        catch (const std::exception& ex) {
            throw std::runtime_error(where(source, line_no) + ex.what());
        }
    }

    /*---------------------------------------------------------
      Failed pairs: endpoints are checked against the full node
      set, with the line number of the offending entry.
    ---------------------------------------------------------*/
    for (const auto& f : failed) {
        for (const NodeId& end : {f.a, f.b}) {
            if (!state.is_known_endpoint(end))
                throw InvalidOverridePair(f.a, f.b, "unknown endpoint " + end + " at " +
                                                        source + ":" + std::to_string(f.line_no));
        }
        state.add_failed_connection(f.a, f.b);
    }

    return state;
}

NetworkState parse_network_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Could not open network definition file: " + path);
    return parse_network(in, path);
}

std::string format_network_line(const RelayNode& node)
{
    std::ostringstream os;
    os << std::setprecision(10)
       << "node " << node.id << ' ' << node.position.lat << ' ' << node.position.lon << ' '
       << (node.direct_to_gateway ? "direct" : "relay");
    return os.str();
}

/*-------------------------------------------------------------
  apply_config_value

  Single entry point for configuration keys, shared by the config
  file reader and the command-line flags in lora_plan_main.cpp.
-------------------------------------------------------------*/
void apply_config_value(PlanConfig& cfg, const std::string& key, const std::string& value)
{
    const std::string k = normalize_token(key);

    if (k == "gatewaythresholdkm")
        cfg.gateway_threshold_km = parse_double(value, key);
    else if (k == "nodethresholdkm")
        cfg.node_threshold_km = parse_double(value, key);
    else if (k == "maxchildren")
        cfg.max_children = parse_count(value, key);
    else if (k == "gatewaymaxchildren") {
        if (normalize_token(value) == "unlimited" || normalize_token(value) == "none")
            cfg.gateway_max_children.reset();
        else
            cfg.gateway_max_children = parse_count(value, key);
    }
    else if (k == "frequencypool")
        cfg.frequency_pool = parse_range_list(value);
    else if (k == "gatewayfrequency")
        cfg.gateway_frequency = parse_int(value, key);
    else if (k == "onexhaustion")
        cfg.on_exhaustion = parse_exhaustion_policy(value);
    else
        throw ConfigError("Unknown configuration key \"" + key + '"');
}

void parse_config(std::istream& in, const std::string& source, PlanConfig& cfg)
{
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::vector<std::string> tokens = split_tokens(line);
        if (tokens.empty())
            continue;

        /* "key value" or "key = value"; the value may contain spaces ("16-20, 24") */
        std::string value;
        size_t first = 1;
        if (tokens.size() > 2 && tokens[1] == "=")
            first = 2;
        for (size_t i = first; i < tokens.size(); ++i)
            value += tokens[i];

        if (value.empty())
            throw std::runtime_error(where(source, line_no) + "missing value for " + tokens[0]);

        try {
            apply_config_value(cfg, tokens[0], value);
        }
        catch (const std::exception& ex) {
            throw ConfigError(where(source, line_no) + ex.what());
        }
    }
}

void parse_config_file(const std::string& path, PlanConfig& cfg)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Could not open configuration file: " + path);
    parse_config(in, path, cfg);
}

/*-------------------------------------------------------------
  Failed-connection list
-------------------------------------------------------------*/
std::size_t read_failed_connections(std::istream& in, const std::string& source,
                                    NetworkState& state)
{
    std::size_t added = 0;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::vector<std::string> tokens = split_tokens(line);
        if (tokens.empty())
            continue;
        if (tokens.size() != 2)
            throw std::runtime_error(where(source, line_no) + "expected: <a> <b>");
        if (state.add_failed_connection(tokens[0], tokens[1]))
            ++added;
    }
    return added;
}

std::size_t read_failed_connections_file(const std::string& path, NetworkState& state)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Could not open failed-connection list: " + path);
    return read_failed_connections(in, path, state);
}

void write_failed_connections(std::ostream& out, const ConnectionOverrides& overrides)
{
    out << "# failed connections (" << overrides.size() << ")\n";
    for (const auto& p : overrides.list())
        out << p.first << ' ' << p.second << '\n';
}

void write_failed_connections_file(const std::string& path,
                                   const ConnectionOverrides& overrides)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out)
        throw std::runtime_error("Could not write failed-connection list: " + path);
    write_failed_connections(out, overrides);
}

void write_routes_file(const std::string& path, const PlanResult& result)
{
    // an aborted walk leaves nodes without frequencies; nothing to hand to the field
    if (result.frequency.status == FrequencyStatus::Exhausted)
        throw PlanError("Routes file not written: frequency pool exhausted at " +
                        result.frequency.exhausted_node);

    std::ofstream out(path, std::ios::trunc);
    if (!out)
        throw std::runtime_error("Could not write routes file: " + path);

    const std::vector<std::string> commands = report::configuration_commands(result);
    out << "# gateway FREQ_DOWN=" << result.gateway.downlink << '\n';
    out << "# " << commands.size() << " node command(s), "
        << result.unreachable.size() << " unreachable\n";
    for (const auto& cmd : commands)
        out << cmd << '\n';
}

} // namespace lplan::io
