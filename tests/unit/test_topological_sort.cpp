/**
 * @file test_topological_sort.cpp
 * @brief Unit tests for topological_order over vertex partitions.
 */

#include "pipeline/topological_sort.hpp"
#include "model/generator.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace pipeseg;

namespace {

Network chain_abc() {
    Network net("abc");
    for (const char* name : {"A", "B", "C"}) {
        auto added = net.add_layer(Layer{.name = name});
        if (!added) throw std::runtime_error(added.error().message);
    }
    return net;
}

}  // namespace

TEST(TopologicalSortTest, OrdersShuffledChain) {
    auto net = chain_abc();
    auto order = topological_order(net, {{"C"}, {"A"}, {"B"}});
    ASSERT_TRUE(order.has_value()) << order.error().message;
    EXPECT_EQ(*order, (std::vector<Vertex>{{"A"}, {"B"}, {"C"}}));
}

TEST(TopologicalSortTest, KeepsMergedVertices) {
    auto net = chain_abc();
    auto order = topological_order(net, {{"B", "C"}, {"A"}});
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(*order, (std::vector<Vertex>{{"A"}, {"B", "C"}}));
}

TEST(TopologicalSortTest, BranchesFollowDeclarationOrder) {
    Network net;
    ASSERT_TRUE(net.add_layer(Layer{.name = "A"}));
    ASSERT_TRUE(net.add_layer(Layer{.name = "B"}, {"A"}));
    ASSERT_TRUE(net.add_layer(Layer{.name = "C"}, {"A"}));
    ASSERT_TRUE(net.add_layer(Layer{.name = "D"}, {"B"}));
    ASSERT_TRUE(net.add_layer(Layer{.name = "E"}, {"C", "D"}));

    auto order = topological_order(net, {{"A"}, {"B"}, {"C"}, {"D"}, {"E"}});
    ASSERT_TRUE(order.has_value());
    // DFS finishes C's side first, so B's chain lands before C.
    EXPECT_EQ(*order, (std::vector<Vertex>{{"A"}, {"B"}, {"D"}, {"C"}, {"E"}}));
}

TEST(TopologicalSortTest, SeveralInputsStartInDeclarationOrder) {
    Network net;
    ASSERT_TRUE(net.add_layer(Layer{.name = "a"}));
    ASSERT_TRUE(net.add_layer(Layer{.name = "b"}, {LayerName{Network::kInputLayerKey}}));
    ASSERT_TRUE(net.add_layer(Layer{.name = "c"}, {"a", "b"}));

    auto order = topological_order(net, {{"c"}, {"b"}, {"a"}});
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(*order, (std::vector<Vertex>{{"a"}, {"b"}, {"c"}}));
}

TEST(TopologicalSortTest, VertexLevelCycleIsRejected) {
    auto net = chain_abc();
    auto order = topological_order(net, {{"A", "C"}, {"B"}});
    ASSERT_FALSE(order.has_value());
    EXPECT_EQ(order.error().code, ErrorCode::InvalidGraph);
    EXPECT_NE(order.error().message.find("Cycle"), std::string::npos);
}

TEST(TopologicalSortTest, BadPartitionsAreRejected) {
    auto net = chain_abc();

    auto missing = topological_order(net, {{"A"}, {"B"}});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidGraph);

    auto twice = topological_order(net, {{"A", "B"}, {"B", "C"}});
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error().code, ErrorCode::InvalidGraph);

    auto unknown = topological_order(net, {{"A"}, {"B"}, {"C"}, {"Z"}});
    ASSERT_FALSE(unknown.has_value());

    auto empty = topological_order(net, {{"A", "B", "C"}, {}});
    ASSERT_FALSE(empty.has_value());
}

TEST(TopologicalSortTest, DeepChainDoesNotRecurse) {
    auto net = NetworkGenerator::linear_chain(20000);
    std::vector<Vertex> vertices;
    for (const auto& name : net) vertices.push_back({name});

    auto order = topological_order(net, vertices);
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(order->front(), Vertex{"layer_0"});
    EXPECT_EQ(order->back(), Vertex{"layer_19999"});
}
