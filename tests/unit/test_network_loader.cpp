/**
 * @file test_network_loader.cpp
 * @brief Unit tests for TOML network descriptions.
 */

#include "model/network_loader.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace pipeseg;

class NetworkLoaderTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "pipeseg_test_network";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "net.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(NetworkLoaderTest, LoadBranchyNetwork) {
    auto path = write_toml(R"(
        [network]
        name = "tiny"

        [[layers]]
        name = "conv1"
        type = "conv"
        nifm = 3
        nofm = 16
        size = 32
        filter = 3

        [[layers]]
        name = "pool1"
        type = "pool"
        nifm = 16
        size = 16
        filter = 2
        stride = 2

        [[layers]]
        name = "left"
        nifm = 16
        nofm = 16
        size = 16
        prevs = ["pool1"]

        [[layers]]
        name = "right"
        nifm = 16
        nofm = 16
        size = 16
        prevs = ["pool1"]

        [[layers]]
        name = "sum"
        type = "eltwise"
        nifm = 16
        size = 16
        prevs = ["left", "right"]
    )");

    auto result = load_network(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const auto& net = *result;
    EXPECT_EQ(net.name(), "tiny");
    EXPECT_EQ(net.size(), 5u);
    EXPECT_EQ(net.layer("conv1").nofm, 16u);
    EXPECT_EQ(net.layer("conv1").hfil, 3u);
    EXPECT_EQ(net.layer("pool1").type, LayerType::Pooling);
    EXPECT_EQ(net.layer("pool1").nofm, 16u);   // defaults to nifm
    EXPECT_EQ(net.layer("pool1").stride, 2u);
    EXPECT_EQ(net.layer("left").type, LayerType::Conv);
    EXPECT_EQ(net.prev_layers("pool1"), std::vector<LayerName>{"conv1"});
    EXPECT_EQ(net.prev_layers("sum"), (std::vector<LayerName>{"left", "right"}));
}

TEST_F(NetworkLoaderTest, ExplicitInputReference) {
    auto result = parse_network(R"(
        [[layers]]
        name = "a"

        [[layers]]
        name = "b"
        prevs = ["__INPUT__", "a"]
    )");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->name(), "network");
    EXPECT_EQ(result->first_layers(), std::vector<LayerName>{"a"});
}

TEST_F(NetworkLoaderTest, NonexistentFile) {
    auto result = load_network("/nonexistent/net.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(NetworkLoaderTest, MalformedToml) {
    auto result = parse_network("[[layers]\nname = ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
}

TEST_F(NetworkLoaderTest, NoLayers) {
    auto result = parse_network("[network]\nname = \"void\"\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
}

TEST_F(NetworkLoaderTest, UnknownLayerType) {
    auto result = parse_network("[[layers]]\nname = \"a\"\ntype = \"deconv\"\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
}

TEST_F(NetworkLoaderTest, NonPositiveDimension) {
    auto result = parse_network("[[layers]]\nname = \"a\"\nnifm = 0\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
}

TEST_F(NetworkLoaderTest, ForwardReferenceRejected) {
    auto result = parse_network(R"(
        [[layers]]
        name = "a"
        prevs = ["b"]

        [[layers]]
        name = "b"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidNetwork);
}

TEST_F(NetworkLoaderTest, MissingName) {
    auto result = parse_network("[[layers]]\ntype = \"conv\"\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
}
