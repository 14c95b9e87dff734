/**
 * @file test_generator.cpp
 * @brief Unit tests for NetworkGenerator.
 */

#include "model/generator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <random>

using namespace pipeseg;

// ─── Linear Chain ────────────────────────────

TEST(GeneratorTest, LinearChainLayerCount) {
    auto net = NetworkGenerator::linear_chain(5);
    EXPECT_EQ(net.size(), 5u);
    EXPECT_EQ(net.name(), "chain");
}

TEST(GeneratorTest, LinearChainConnectivity) {
    auto net = NetworkGenerator::linear_chain(4);

    EXPECT_EQ(net.first_layers(), std::vector<LayerName>{"layer_0"});
    EXPECT_EQ(net.last_layers(), std::vector<LayerName>{"layer_3"});
    EXPECT_EQ(net.prev_layers("layer_2"), std::vector<LayerName>{"layer_1"});
    EXPECT_EQ(net.next_layers("layer_2"), std::vector<LayerName>{"layer_3"});
}

TEST(GeneratorTest, LinearChainLayerType) {
    auto net = NetworkGenerator::linear_chain(3, LayerType::FC);
    for (const auto& name : net) {
        EXPECT_EQ(net.layer(name).type, LayerType::FC);
    }
}

// ─── Residual Blocks ─────────────────────────

TEST(GeneratorTest, ResidualBlockStructure) {
    auto net = NetworkGenerator::residual_blocks(2);

    // stem (2) + projection block (5) + identity block (4)
    EXPECT_EQ(net.size(), 11u);
    EXPECT_EQ(net.prev_layers("blk0_res"), (std::vector<LayerName>{"blk0_br", "blk0_c"}));
    EXPECT_EQ(net.prev_layers("blk1_res"), (std::vector<LayerName>{"blk0_res", "blk1_c"}));
    EXPECT_EQ(net.layer("blk1_res").type, LayerType::Eltwise);
    EXPECT_FALSE(net.contains("blk1_br"));
    EXPECT_EQ(net.last_layers(), std::vector<LayerName>{"blk1_res"});
}

// ─── Inception ───────────────────────────────

TEST(GeneratorTest, InceptionStructure) {
    auto net = NetworkGenerator::inception(2);

    // stem (2) + 7 per module + head (2)
    EXPECT_EQ(net.size(), 18u);
    EXPECT_EQ(net.next_layers("stem_pool").size(), 4u);
    EXPECT_EQ(net.prev_layers("inc1_1x1").size(), 4u);
    EXPECT_EQ(net.prev_layers("pool_out"),
              (std::vector<LayerName>{"inc1_1x1", "inc1_3x3", "inc1_5x5", "inc1_pool_proj"}));
    EXPECT_EQ(net.last_layers(), std::vector<LayerName>{"fc"});
}

// ─── Random ──────────────────────────────────

TEST(GeneratorTest, RandomNetworkIsWellFormed) {
    std::mt19937 rng(42);
    auto net = NetworkGenerator::random_network(30, 0.2f, 0.4f, rng);

    EXPECT_EQ(net.size(), 30u);
    EXPECT_EQ(net.first_layers(), std::vector<LayerName>{"rand_0"});

    for (size_t i = 0; i < net.size(); ++i) {
        const auto& name = net.layer_names()[i];
        const auto& prevs = net.prev_layers(name);
        ASSERT_FALSE(prevs.empty());
        for (const auto& p : prevs) {
            if (p == Network::kInputLayerKey) continue;
            // Predecessors are always declared earlier.
            auto pos = std::find(net.begin(), net.end(), p) - net.begin();
            EXPECT_LT(static_cast<size_t>(pos), i);
        }
    }
}

TEST(GeneratorTest, RandomNetworkIsReproducible) {
    std::mt19937 rng_a(7);
    std::mt19937 rng_b(7);
    auto a = NetworkGenerator::random_network(20, 0.3f, 0.5f, rng_a);
    auto b = NetworkGenerator::random_network(20, 0.3f, 0.5f, rng_b);

    for (const auto& name : a) {
        EXPECT_EQ(a.prev_layers(name), b.prev_layers(name));
        EXPECT_EQ(a.layer(name), b.layer(name));
    }
}
