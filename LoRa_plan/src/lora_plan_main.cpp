/*─────────────────────────────────────────────────────────────
  File: src/lora_plan_main.cpp

  Command-line entry point for LoRa network tree planning.

  This file:
  - Parses CLI arguments and assembles the PlanConfig
  - Loads the network definition and optional failed-connection list
  - Runs plan_network() and prints the tree and configuration commands
  - Optionally writes the routes file and saves the failed list

  All distance, graph, tree and frequency logic is delegated to other
  modules; this file contains no planning math.
─────────────────────────────────────────────────────────────*/
#include "logger.hpp"
#include "plan_io.hpp"
#include "plan_report.hpp"
#include "planner.hpp"

#include <filesystem>
#include <iostream>

namespace {

/*-------------------------------------------------------------
  Print CLI usage.
-------------------------------------------------------------*/
void usage()
{
    std::cerr << "Usage: lora_plan network.def [--config FILE] [--failed FILE]\n"
                 "         [--gateway-km X] [--node-km X] [--max-children N]\n"
                 "         [--gateway-max-children N|unlimited] [--pool LIST]\n"
                 "         [--gateway-freq F] [--on-exhaustion fail|skip]\n"
                 "         [--routes FILE] [--save-failed FILE] [--log FILE] [--quiet-links]\n";
}

/* flag -> configuration key, for flags that take one value */
const char* config_key_for(const std::string& flag)
{
    if (flag == "--gateway-km")           return "gateway_threshold_km";
    if (flag == "--node-km")              return "node_threshold_km";
    if (flag == "--max-children")         return "max_children";
    if (flag == "--gateway-max-children") return "gateway_max_children";
    if (flag == "--pool")                 return "frequency_pool";
    if (flag == "--gateway-freq")         return "gateway_frequency";
    if (flag == "--on-exhaustion")        return "on_exhaustion";
    return nullptr;
}

} // anonymous namespace


/*=====================================================================
  Program entry point.

  Control flow overview:

  1) Parse CLI arguments (config flags are applied after --config)
  2) Initialize logging
  3) Load network definition + failed list
  4) plan_network()
  5) Report, print tree + commands, write optional outputs

  Exit codes: 0 ok, 1 usage, 2 fatal error, 3 frequency pool exhausted
=====================================================================*/
int main(int argc, char** argv)
{
    if (argc < 2 || argv[1][0] == '-') {
        usage();
        return 1;
    }

    const std::string networkPath = argv[1];
    std::string configPath;
    std::string failedPath;
    std::string routesPath;
    std::string saveFailedPath;
    std::string logPath;
    bool quiet_links = false;

    /*---------------------------------------------------------
      Config flags are collected first and applied on top of the
      config file, so the command line always wins.
    ---------------------------------------------------------*/
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        std::string value;

        size_t eq = flag.find('=');
        if (flag.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
        }
        else if (flag != "--quiet-links") {
            if (i + 1 >= argc) {
                usage();
                return 1;
            }
            value = argv[++i];
        }

        if (flag == "--config") configPath = value;
        else if (flag == "--failed") failedPath = value;
        else if (flag == "--routes") routesPath = value;
        else if (flag == "--save-failed") saveFailedPath = value;
        else if (flag == "--log") logPath = value;
        else if (flag == "--quiet-links") quiet_links = true;
        else if (const char* key = config_key_for(flag)) overrides.emplace_back(key, value);
        else {
            usage();
            return 1;
        }
    }

    /*---------------------------------------------------------
      Logger initialization.
      Default log file is written next to the network definition.
    ---------------------------------------------------------*/
    if (logPath.empty())
        logPath = (std::filesystem::path(networkPath).parent_path() / "lora_plan.log").string();
    lplan::Logger log(logPath);
    log.info("lora_plan started");
    log.info("Network  : " + networkPath);

    try {
        lplan::PlanConfig cfg;
        if (!configPath.empty()) {
            log.info("Config   : " + configPath);
            lplan::io::parse_config_file(configPath, cfg);
        }
        for (const auto& kv : overrides)
            lplan::io::apply_config_value(cfg, kv.first, kv.second);
        lplan::validate_config(cfg);

        lplan::NetworkState state = lplan::io::parse_network_file(networkPath);
        log.info("Loaded " + std::to_string(state.nodes().size()) + " node(s)");

        if (!failedPath.empty()) {
            std::size_t added = lplan::io::read_failed_connections_file(failedPath, state);
            log.info("Failed list: " + failedPath + " (" + std::to_string(added) + " new pair(s))");
        }

        lplan::report::log_failed_connections(state.overrides(), log);

        /*-----------------------------------------------------
          With --quiet-links the per-stage lines of plan_network
          (one per evaluated link) go to the log file only.
        -----------------------------------------------------*/
        if (quiet_links)
            log.set_echo(false);
        lplan::PlanResult result = lplan::plan_network(state, cfg, log);
        log.set_echo(true);

        lplan::report::log_link_summary(result, log);
        lplan::report::log_unreachable(result, log);
        lplan::report::log_frequency_outcome(result, log);

        std::cout << "\nFINAL NETWORK TREE STRUCTURE\n";
        lplan::report::print_tree(std::cout, result);

        const std::vector<std::string> commands = lplan::report::configuration_commands(result);
        std::cout << "\nCONFIGURATION COMMANDS\n";
        for (const auto& cmd : commands)
            std::cout << "  " << cmd << '\n';
        std::cout << '\n';

        if (!saveFailedPath.empty()) {
            lplan::io::write_failed_connections_file(saveFailedPath, state.overrides());
            log.info("Failed list written: " + saveFailedPath);
        }

        if (result.frequency.status == lplan::FrequencyStatus::Exhausted) {
            if (!routesPath.empty())
                log.warn("Routes file not written: " + routesPath);
            log.error("Finished with frequency pool exhausted.");
            return 3;
        }

        if (!routesPath.empty()) {
            lplan::io::write_routes_file(routesPath, result);
            log.info("Routes written: " + routesPath);
        }

        log.info(std::to_string(commands.size()) + " command(s) to send; " +
                 std::to_string(log.warnings()) + " warning(s).  Finished OK.");
        return 0;
    }
    catch (const std::exception& ex) {
        log.set_echo(true);
        log.error(ex.what());
        std::cout << "Fatal: " << ex.what() << '\n';
        return 2;
    }
}
