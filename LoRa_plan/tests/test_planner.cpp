#include "planner.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace lplan;

namespace {

NetworkState city_pair()
{
    NetworkState state;
    state.set_gateway(Coordinate{40.7128, -74.0060});
    state.upsert_node("NodeA", Coordinate{40.7129, -74.0061}, true);
    state.upsert_node("NodeB", Coordinate{40.9, -74.9}, false);
    return state;
}

} // namespace

TEST(PlanNetwork, NearNodeAttachesFarNodeUnreachable)
{
    NetworkState state = city_pair();
    PlanResult r = plan_network(state, PlanConfig{}, test::quiet_log());

    EXPECT_EQ(r.gateway.children, (std::vector<NodeId>{"NodeA"}));
    EXPECT_EQ(r.unreachable, (std::vector<NodeId>{"NodeB"}));
    EXPECT_EQ(r.reachable_count, 1u);

    const PlannedNode* a = r.find("NodeA");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->parent, std::optional<NodeId>(GATEWAY_ID));
    EXPECT_EQ(a->uplink, std::optional<int>(3));
    EXPECT_FALSE(a->downlink.has_value());

    const PlannedNode* b = r.find("NodeB");
    ASSERT_NE(b, nullptr);
    EXPECT_FALSE(b->parent.has_value());
    EXPECT_FALSE(b->uplink.has_value());
    EXPECT_TRUE(r.frequency.ok());
}

TEST(PlanNetwork, FailedGatewayLinkMakesNodeUnreachable)
{
    NetworkState state = city_pair();
    state.add_failed_connection(GATEWAY_ID, "NodeA");

    PlanResult r = plan_network(state, PlanConfig{}, test::quiet_log());
    EXPECT_TRUE(r.gateway.children.empty());
    EXPECT_EQ(r.unreachable, (std::vector<NodeId>{"NodeA", "NodeB"}));
    EXPECT_EQ(r.reachable_count, 0u);
}

TEST(PlanNetwork, ChainGetsLinearTreeAndPoolOrder)
{
    NetworkState state = test::make_chain(5);
    PlanResult r = plan_network(state, PlanConfig{}, test::quiet_log());

    ASSERT_EQ(r.reachable_count, 5u);
    for (int i = 1; i <= 4; ++i) {
        const PlannedNode* n = r.find("N" + std::to_string(i));
        ASSERT_NE(n, nullptr);
        EXPECT_EQ(n->children, (std::vector<NodeId>{"N" + std::to_string(i + 1)}));
        EXPECT_EQ(n->downlink, std::optional<int>(15 + i));
    }
    EXPECT_FALSE(r.find("N5")->downlink.has_value());
    EXPECT_EQ(r.find("N5")->uplink, std::optional<int>(19));
}

TEST(PlanNetwork, ExhaustionIsReportedNotThrown)
{
    NetworkState state = test::make_chain(3);
    PlanConfig cfg;
    cfg.frequency_pool = {16};

    PlanResult r;
    ASSERT_NO_THROW(r = plan_network(state, cfg, test::quiet_log()));
    EXPECT_EQ(r.frequency.status, FrequencyStatus::Exhausted);
    EXPECT_EQ(r.frequency.exhausted_node, "N2");
    EXPECT_EQ(r.frequency.unassigned, 1u);
    EXPECT_FALSE(r.frequency.ok());

    // the tree is still complete
    EXPECT_EQ(r.reachable_count, 3u);
    EXPECT_EQ(r.find("N1")->downlink, std::optional<int>(16));
    EXPECT_FALSE(r.find("N2")->downlink.has_value());
    EXPECT_FALSE(r.find("N3")->uplink.has_value());
}

TEST(PlanNetwork, SkipPolicyReportsSkippedNodes)
{
    NetworkState state = test::make_chain(3);
    PlanConfig cfg;
    cfg.frequency_pool = {16};
    cfg.on_exhaustion = ExhaustionPolicy::Skip;

    PlanResult r = plan_network(state, cfg, test::quiet_log());
    EXPECT_EQ(r.frequency.status, FrequencyStatus::Skipped);
    EXPECT_EQ(r.frequency.skipped, (std::vector<NodeId>{"N2"}));
    EXPECT_STREQ(frequency_status_name(r.frequency.status), "skipped");
}

TEST(PlanNetwork, RequiresGateway)
{
    NetworkState state;
    state.upsert_node("N1", Coordinate{0.0, 0.0}, true);
    EXPECT_THROW(plan_network(state, PlanConfig{}, test::quiet_log()), NoGateway);
}

TEST(PlanNetwork, RejectsInvalidConfig)
{
    NetworkState state = test::make_chain(2);
    PlanConfig cfg;
    cfg.max_children = 0;
    EXPECT_THROW(plan_network(state, cfg, test::quiet_log()), ConfigError);

    cfg = PlanConfig{};
    cfg.frequency_pool = {3, 16};
    EXPECT_THROW(plan_network(state, cfg, test::quiet_log()), ConfigError);
}

TEST(PlanNetwork, RepeatedRunsAreIdentical)
{
    NetworkState state = test::make_cluster(10, 3);
    state.add_failed_connection("N1", "N4");
    PlanConfig cfg;
    cfg.max_children = 2;

    PlanResult first = plan_network(state, cfg, test::quiet_log());
    PlanResult second = plan_network(state, cfg, test::quiet_log());
    EXPECT_EQ(first, second);
}

TEST(PlanNetwork, ReflectsStateChangesBetweenRuns)
{
    NetworkState state = test::make_chain(3);
    PlanResult before = plan_network(state, PlanConfig{}, test::quiet_log());
    EXPECT_EQ(before.reachable_count, 3u);

    state.add_failed_connection("N1", "N2");
    PlanResult after = plan_network(state, PlanConfig{}, test::quiet_log());
    EXPECT_EQ(after.reachable_count, 1u);
    EXPECT_EQ(after.unreachable, (std::vector<NodeId>{"N2", "N3"}));

    state.remove_failed_connection("N2", "N1");
    PlanResult restored = plan_network(state, PlanConfig{}, test::quiet_log());
    EXPECT_EQ(restored, before);
}

TEST(NodeEligibility, InRangeOfGateway)
{
    NetworkState state = city_pair();
    PlanConfig cfg;
    EXPECT_TRUE(evaluate_single_node_eligibility(Coordinate{40.72, -74.01}, state, cfg));
}

TEST(NodeEligibility, InRangeOfAnotherNodeOnly)
{
    NetworkState state = city_pair();
    PlanConfig cfg;
    // ~3.3 km from NodeB, far from the gateway
    EXPECT_TRUE(evaluate_single_node_eligibility(Coordinate{40.93, -74.9}, state, cfg));
}

TEST(NodeEligibility, OutOfRangeOfEverything)
{
    NetworkState state = city_pair();
    PlanConfig cfg;
    EXPECT_FALSE(evaluate_single_node_eligibility(Coordinate{41.5, -73.0}, state, cfg));
}

TEST(NodeEligibility, FailedConnectionsExcludeCandidates)
{
    NetworkState state = city_pair();
    state.upsert_node("NodeC", Coordinate{40.93, -74.9}, false);
    state.add_failed_connection("NodeB", "NodeC");
    PlanConfig cfg;

    const Coordinate near_b{40.93, -74.9};
    EXPECT_TRUE(evaluate_single_node_eligibility(near_b, state, cfg));
    // NodeC itself is skipped and its only neighbour link has failed
    EXPECT_FALSE(evaluate_single_node_eligibility(near_b, state, cfg, "NodeC"));

    // at the gateway itself, with NodeA gone and the gateway link failed
    state.remove_node("NodeA");
    state.add_failed_connection(GATEWAY_ID, "NodeC");
    EXPECT_FALSE(evaluate_single_node_eligibility(Coordinate{40.7128, -74.0060}, state, cfg,
                                                  "NodeC"));
}

TEST(NodeEligibility, RequiresGateway)
{
    NetworkState state;
    EXPECT_THROW(evaluate_single_node_eligibility(Coordinate{0.0, 0.0}, state, PlanConfig{}),
                 NoGateway);
}
