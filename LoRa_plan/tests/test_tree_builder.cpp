#include "tree_builder.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace lplan;

namespace {

/* structural invariants every built tree must satisfy */
void expect_valid_tree(const TreeResult& tree, const FeasibilityGraph& graph,
                       std::size_t max_children)
{
    for (const auto& kv : tree.attached) {
        const NodeId& id = kv.first;
        EXPECT_NE(kv.second.parent, id) << id << " is its own parent";
        EXPECT_TRUE(tree.depth_of(id).has_value()) << id << " is on a cycle";
        EXPECT_LE(kv.second.children.size(), max_children) << id << " exceeds its cap";
        EXPECT_TRUE(graph.has_edge(kv.second.parent, id))
            << kv.second.parent << " -> " << id << " is not a feasible link";
    }
}

} // namespace

TEST(TreeBuilder, ChainIsLinear)
{
    NetworkState state = test::make_chain(5);
    PlanConfig cfg;
    TreeResult tree = test::tree_for(state, cfg);

    EXPECT_EQ(tree.gateway_children, (std::vector<NodeId>{"N1"}));
    EXPECT_EQ(tree.children_of("N1"), (std::vector<NodeId>{"N2"}));
    EXPECT_EQ(tree.children_of("N4"), (std::vector<NodeId>{"N5"}));
    EXPECT_TRUE(tree.children_of("N5").empty());
    EXPECT_EQ(tree.parent_of("N3"), std::optional<NodeId>("N2"));
    EXPECT_EQ(tree.depth_of("N5"), std::optional<std::size_t>(5));
    EXPECT_EQ(tree.reachable_count(), 5u);
    EXPECT_TRUE(tree.unreachable.empty());
}

TEST(TreeBuilder, AttachmentQueries)
{
    NetworkState state = test::make_chain(2);
    state.upsert_node("far", Coordinate{20.0, 20.0}, true);
    TreeResult tree = test::tree_for(state, PlanConfig{});

    EXPECT_TRUE(tree.is_attached("N1"));
    EXPECT_TRUE(tree.is_attached("N2"));
    EXPECT_FALSE(tree.is_attached("far"));
    EXPECT_FALSE(tree.is_attached(GATEWAY_ID));
    EXPECT_FALSE(tree.is_attached("nobody"));
    EXPECT_EQ(tree.unreachable, (std::vector<NodeId>{"far"}));
}

TEST(TreeBuilder, GatewayUncappedByDefault)
{
    NetworkState state = test::make_cluster(6, 6);
    PlanConfig cfg;
    TreeResult tree = test::tree_for(state, cfg);

    EXPECT_EQ(tree.gateway_children.size(), 6u);
    EXPECT_EQ(tree.reachable_count(), 6u);
}

TEST(TreeBuilder, GatewayCapOverflowsToFirstChild)
{
    NetworkState state = test::make_cluster(6, 6);
    PlanConfig cfg;
    cfg.gateway_max_children = 4;
    TreeResult tree = test::tree_for(state, cfg);

    EXPECT_EQ(tree.gateway_children, (std::vector<NodeId>{"N1", "N2", "N3", "N4"}));
    EXPECT_EQ(tree.children_of("N1"), (std::vector<NodeId>{"N5", "N6"}));
    EXPECT_EQ(tree.reachable_count(), 6u);
}

TEST(TreeBuilder, NodeCapSpillsToNextFrontierNode)
{
    // only N1 may reach the gateway; N2..N7 all hear N1 and each other
    NetworkState state = test::make_cluster(7, 1);
    PlanConfig cfg;
    FeasibilityResult feas = build_feasibility_graph(
        state.gateway(), state.nodes(), state.overrides(), 5.0, 5.0);
    TreeResult tree = build_tree(feas.graph, state.nodes(), 4, std::nullopt);

    EXPECT_EQ(tree.gateway_children, (std::vector<NodeId>{"N1"}));
    EXPECT_EQ(tree.children_of("N1"), (std::vector<NodeId>{"N2", "N3", "N4", "N5"}));
    EXPECT_EQ(tree.children_of("N2"), (std::vector<NodeId>{"N6", "N7"}));
    EXPECT_EQ(tree.attach_order,
              (std::vector<NodeId>{"N1", "N2", "N3", "N4", "N5", "N6", "N7"}));
    expect_valid_tree(tree, feas.graph, 4);
}

TEST(TreeBuilder, CapOfOneBuildsPath)
{
    NetworkState state = test::make_cluster(5, 5);
    FeasibilityResult feas = build_feasibility_graph(
        state.gateway(), state.nodes(), state.overrides(), 5.0, 5.0);
    TreeResult tree = build_tree(feas.graph, state.nodes(), 1, std::size_t{1});

    EXPECT_EQ(tree.gateway_children, (std::vector<NodeId>{"N1"}));
    EXPECT_EQ(tree.children_of("N1"), (std::vector<NodeId>{"N2"}));
    EXPECT_EQ(tree.children_of("N4"), (std::vector<NodeId>{"N5"}));
    expect_valid_tree(tree, feas.graph, 1);
}

TEST(TreeBuilder, EdgelessGraphLeavesEverythingUnreachable)
{
    NetworkState state = test::make_cluster(3, 0);
    FeasibilityResult feas = build_feasibility_graph(
        state.gateway(), state.nodes(), state.overrides(), 5.0, 0.0);
    ASSERT_EQ(feas.graph.edge_count(), 0u);

    TreeResult tree = build_tree(feas.graph, state.nodes(), 4, std::nullopt);
    EXPECT_EQ(tree.reachable_count(), 0u);
    EXPECT_EQ(tree.unreachable, (std::vector<NodeId>{"N1", "N2", "N3"}));
    EXPECT_TRUE(tree.gateway_children.empty());
    EXPECT_FALSE(tree.parent_of("N1").has_value());
    EXPECT_FALSE(tree.depth_of("N1").has_value());
}

TEST(TreeBuilder, UnreachableListKeepsNodeOrder)
{
    NetworkState state = test::make_chain(2);
    state.upsert_node("z-far", Coordinate{10.0, 10.0}, true);
    state.upsert_node("a-far", Coordinate{-10.0, 10.0}, true);

    TreeResult tree = test::tree_for(state, PlanConfig{});
    EXPECT_EQ(tree.unreachable, (std::vector<NodeId>{"z-far", "a-far"}));
    EXPECT_EQ(tree.reachable_count(), 2u);
}

TEST(TreeBuilder, SameGraphSameTree)
{
    NetworkState state = test::make_cluster(9, 3);
    PlanConfig cfg;
    cfg.max_children = 2;
    cfg.gateway_max_children = 2;

    TreeResult first = test::tree_for(state, cfg);
    TreeResult second = test::tree_for(state, cfg);
    EXPECT_EQ(first, second);
}

TEST(TreeBuilder, InvariantsHoldOnMixedLayout)
{
    NetworkState state;
    state.set_gateway(Coordinate{0.0, 0.0});
    for (int r = 0; r < 5; ++r)
        for (int c = 0; c < 5; ++c)
            state.upsert_node("g" + std::to_string(r) + std::to_string(c),
                              Coordinate{r * 0.02, c * 0.02}, (r + c) % 3 == 0);
    state.add_failed_connection("g00", "g01");
    state.add_failed_connection(GATEWAY_ID, "g03");

    FeasibilityResult feas = build_feasibility_graph(
        state.gateway(), state.nodes(), state.overrides(), 5.0, 2.5);
    TreeResult tree = build_tree(feas.graph, state.nodes(), 3, std::nullopt);

    expect_valid_tree(tree, feas.graph, 3);
    EXPECT_NE(tree.parent_of("g01"), std::optional<NodeId>("g00"));
    EXPECT_NE(tree.parent_of("g03"), std::optional<NodeId>(GATEWAY_ID));
    EXPECT_EQ(tree.reachable_count() + tree.unreachable.size(), state.nodes().size());
}
