/*
  File: include/plan_io.hpp

  Text input/output for the lora_plan executable.

  This header is included by:
    - src/plan_io_helpers.cpp
    - src/plan_io.cpp
    - src/lora_plan_main.cpp
    - scripts/net_gen/net_gen.cpp (format_network_line)

  It centralizes:
    - token helpers (trim, normalize_token, range lists, numbers, flags)
    - the network definition reader (gateway / node / failed lines)
    - the configuration file reader and the key=value applier shared
      with command-line flags
    - failed-connection list load/save
    - routes file writer (CONFIG_NODE lines)

  Every reader has a stream form (used by the tests) and a path form.
  Parse errors are std::runtime_error carrying "<source>:<line>: ".
*/
#pragma once

#include "common.hpp"
#include "network_state.hpp"
#include "plan_config.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace lplan {
struct PlanResult;
}

namespace lplan::io {

/*------------------------------------------------------------------------------
  Token helpers (src/plan_io_helpers.cpp)
------------------------------------------------------------------------------*/

/*
  trim(s)

  Removes leading and trailing ASCII whitespace using std::isspace.
*/
std::string trim(const std::string& s);

/*
  normalize_token(s)

  Lowercases and keeps only alphanumeric characters, so config keys can
  be written gateway_threshold_km, gateway-threshold-km or
  GatewayThresholdKm.
*/
std::string normalize_token(const std::string& s);

/*
  split_tokens(line)

  Whitespace tokenization after '#' comments are stripped.
*/
std::vector<std::string> split_tokens(const std::string& line);

/*
  parse_range_list(token)

  Parses integer lists like:
    "16"           -> {16}
    "16,18,20"     -> {16,18,20}
    "16-30"        -> {16,...,30}
    "16-20,24-25"  -> {16,17,18,19,20,24,25}
    "30,16-17"     -> {30,16,17}

  Values keep the order written and duplicates are not removed. A range
  with a>b expands downwards. Throws std::invalid_argument on malformed
  fragments or when the list would exceed MAX_RANGE_VALUES entries.
*/
constexpr std::size_t MAX_RANGE_VALUES = 1024;

std::vector<int> parse_range_list(const std::string& token);

/* Whole-token numeric parses; throw std::invalid_argument naming `what`. */
double      parse_double(const std::string& token, const std::string& what);
int         parse_int(const std::string& token, const std::string& what);
std::size_t parse_count(const std::string& token, const std::string& what);

/*
  parse_flag(token)

  Direct-to-gateway eligibility token:
    true  : y, yes, true, 1, direct
    false : n, no, false, 0, nodirect, relay
  Throws std::invalid_argument otherwise.
*/
bool parse_flag(const std::string& token);

/*------------------------------------------------------------------------------
  Network definition (src/plan_io.cpp)

    gateway <lat> <lon>
    node    <id> <lat> <lon> [flag]
    failed  <a> <b>

  Keywords are case-insensitive. A missing flag means not eligible for a
  direct gateway link. failed lines are applied after all nodes, through
  NetworkState::add_failed_connection (InvalidOverridePair for unknown
  endpoints). More than one gateway line is an error.
------------------------------------------------------------------------------*/
NetworkState parse_network(std::istream& in, const std::string& source);
NetworkState parse_network_file(const std::string& path);

/* One definition line for a node, as parse_network() reads it back. */
std::string format_network_line(const RelayNode& node);

/*------------------------------------------------------------------------------
  Configuration

    <key> <value>      one per line, '#' comments

  Keys (normalize_token applied): gateway_threshold_km, node_threshold_km,
  max_children, gateway_max_children (integer or "unlimited"),
  frequency_pool (range list), gateway_frequency, on_exhaustion.

  apply_config_value() throws ConfigError for unknown keys and
  std::invalid_argument for malformed values. Range checks are left to
  validate_config().
------------------------------------------------------------------------------*/
void apply_config_value(PlanConfig& cfg, const std::string& key, const std::string& value);

void parse_config(std::istream& in, const std::string& source, PlanConfig& cfg);
void parse_config_file(const std::string& path, PlanConfig& cfg);

/*------------------------------------------------------------------------------
  Failed-connection list

    <a> <b>            one canonical pair per line

  read_* applies each pair with the checked add and returns how many
  pairs were new.
------------------------------------------------------------------------------*/
std::size_t read_failed_connections(std::istream& in, const std::string& source,
                                    NetworkState& state);
std::size_t read_failed_connections_file(const std::string& path, NetworkState& state);

void write_failed_connections(std::ostream& out, const ConnectionOverrides& overrides);
void write_failed_connections_file(const std::string& path,
                                   const ConnectionOverrides& overrides);

/*------------------------------------------------------------------------------
  Routes file: header comment + configuration_commands(result).
  Throws PlanError, without touching `path`, when result.frequency is
  Exhausted.
------------------------------------------------------------------------------*/
void write_routes_file(const std::string& path, const PlanResult& result);

} // namespace lplan::io
