#include "plan_report.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace lplan;

TEST(ConfigurationCommands, OneLinePerAttachedNode)
{
    NetworkState state = test::make_chain(3);
    state.upsert_node("lost", Coordinate{45.0, 45.0}, false);
    PlanResult r = plan_network(state, PlanConfig{}, test::quiet_log());

    EXPECT_EQ(report::configuration_commands(r),
              (std::vector<std::string>{
                  "CONFIG_NODE N1: PARENT=gateway, FREQ_UP=3, FREQ_DOWN=16",
                  "CONFIG_NODE N2: PARENT=N1, FREQ_UP=16, FREQ_DOWN=17",
                  "CONFIG_NODE N3: PARENT=N2, FREQ_UP=17",
              }));
}

TEST(ConfigurationCommands, UnsetUplinkPrintsNone)
{
    NetworkState state = test::make_chain(3);
    PlanConfig cfg;
    cfg.frequency_pool = {20};
    cfg.on_exhaustion = ExhaustionPolicy::Skip;
    PlanResult r = plan_network(state, cfg, test::quiet_log());

    const std::vector<std::string> cmds = report::configuration_commands(r);
    ASSERT_EQ(cmds.size(), 3u);
    EXPECT_EQ(cmds[1], "CONFIG_NODE N2: PARENT=N1, FREQ_UP=20");
    EXPECT_EQ(cmds[2], "CONFIG_NODE N3: PARENT=N2, FREQ_UP=none");
}

TEST(ConfigurationCommands, EmptyWhenNothingReachable)
{
    NetworkState state = test::make_cluster(3, 0);
    PlanConfig cfg;
    cfg.node_threshold_km = 0.0;
    PlanResult r = plan_network(state, cfg, test::quiet_log());
    EXPECT_TRUE(report::configuration_commands(r).empty());
}

TEST(TreePrinter, IndentsByDepth)
{
    NetworkState state = test::make_chain(2);
    PlanResult r = plan_network(state, PlanConfig{}, test::quiet_log());

    std::ostringstream out;
    report::print_tree(out, r);
    EXPECT_EQ(out.str(),
              "Gateway (Freq DOWN: 3)\n"
              "    └── N1\n"
              "        ├── Parent: gateway\n"
              "        └── Freq UP: 3, Freq DOWN: 16\n"
              "        └── N2\n"
              "            ├── Parent: N1\n"
              "            └── Freq UP: 16\n");
}

TEST(TreePrinter, GatewayOnly)
{
    NetworkState state;
    state.set_gateway(Coordinate{1.0, 1.0});
    PlanConfig cfg;
    cfg.gateway_frequency = 0;
    PlanResult r = plan_network(state, cfg, test::quiet_log());

    std::ostringstream out;
    report::print_tree(out, r);
    EXPECT_EQ(out.str(), "Gateway (Freq DOWN: 0)\n");
}

TEST(ReportLogging, UnreachableNodesRaiseWarnings)
{
    Logger log;
    log.set_echo(false);

    NetworkState state = test::make_chain(1);
    state.upsert_node("lost", Coordinate{45.0, 45.0}, false);
    PlanResult r = plan_network(state, PlanConfig{}, test::quiet_log());

    const std::size_t before = log.warnings();
    report::log_unreachable(r, log);
    // summary line plus one line per node
    EXPECT_EQ(log.warnings() - before, 2u);

    report::log_link_summary(r, log);
    report::log_failed_connections(state.overrides(), log);
    report::log_frequency_outcome(r, log);
    EXPECT_EQ(log.warnings() - before, 2u);
    EXPECT_EQ(log.errors(), 0u);
}
