/**
 * @file test_pipeline_end_to_end.cpp
 * @brief Integration tests: files on disk through to accepted segments.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "model/generator.hpp"
#include "model/network_loader.hpp"
#include "pipeline/inter_layer_pipeline.hpp"
#include "pipeline/segment_validator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <set>

using namespace pipeseg;

// ═══════════════════════════════════════════════
// Fixture
// ═══════════════════════════════════════════════

class PipelineEndToEnd : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "pipeseg_e2e";
        std::filesystem::remove_all(temp_dir_);
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = temp_dir_ / name;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    static std::vector<std::string> read_lines(const std::filesystem::path& path) {
        std::vector<std::string> lines;
        std::ifstream ifs(path);
        for (std::string line; std::getline(ifs, line);) lines.push_back(line);
        return lines;
    }
};

/// Every segment must cover whole vertices that are contiguous in the order.
void expect_covers_contiguous_vertices(const SchedulingDAG& dag, const PipelineSegment& segment) {
    std::set<VertexIndex> vertices;
    for (const auto& layer : segment.layers()) {
        auto v = dag.vertex_of(layer);
        ASSERT_TRUE(v.has_value()) << layer;
        vertices.insert(*v);
    }
    if (segment.layer_count() == 1) return;

    size_t covered = 0;
    for (VertexIndex v : vertices) covered += dag.vertex(v).size();
    EXPECT_EQ(covered, segment.layer_count()) << segment.to_string();
    EXPECT_EQ(static_cast<size_t>(*vertices.rbegin() - *vertices.begin() + 1), vertices.size())
        << segment.to_string();
}

// ═══════════════════════════════════════════════
// Tests
// ═══════════════════════════════════════════════

TEST_F(PipelineEndToEnd, ConfigAndNetworkFromDisk) {
    auto config_path = write_file("run.toml", R"(
        [pipeline]
        batch_size = 4

        [options]
        partition_interlayer = true
        hw_gbuf_save_writeback = false

        [resource]
        proc_rows = 1
        proc_cols = 2

        [validator]
        kind = "node_budget"

        [logging]
        level = "debug"
    )");
    auto network_path = write_file("net.toml", R"(
        [network]
        name = "stem_chain"

        [[layers]]
        name = "conv1"
        nifm = 3
        nofm = 32
        size = 32

        [[layers]]
        name = "pool1"
        type = "pool"
        nifm = 32
        size = 16

        [[layers]]
        name = "a"
        nifm = 32
        size = 16

        [[layers]]
        name = "b"
        nifm = 32
        size = 16

        [[layers]]
        name = "c"
        nifm = 32
        size = 16
    )");

    auto config = load_config(config_path);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    auto network = load_network(network_path);
    ASSERT_TRUE(network.has_value()) << network.error().message;

    std::vector<std::string> log_lines;
    Logger logger(std::make_unique<MemorySink>(log_lines), config->logging.level);

    auto pipeline = InterLayerPipeline::create(
        std::make_shared<const Network>(std::move(*network)), config->pipeline.batch_size,
        config->resource, config->pipeline.max_util_drop, logger);
    ASSERT_TRUE(pipeline.has_value()) << pipeline.error().message;

    EXPECT_EQ(pipeline->ordered_layer_list(),
              (std::vector<LayerName>{"conv1", "pool1", "a", "b", "c"}));
    EXPECT_EQ(pipeline->dag().vertex_count(), 4u);

    NodeBudgetValidator validator(config->validator.max_layers_per_segment);
    auto stream = pipeline->generate_segments(config->options, validator);

    std::vector<PipelineSegment> segments;
    for (const auto& segment : stream) {
        EXPECT_TRUE(segment.valid());
        EXPECT_LE(segment.stage_count(), 2u);
        EXPECT_EQ(segment.context().batch_size, 4u);
        expect_covers_contiguous_vertices(pipeline->dag(), segment);
        segments.push_back(segment);
    }

    // 5 singletons, the merged stem, 3 two-vertex spatial pairs.
    EXPECT_EQ(segments.size(), 9u);
    EXPECT_EQ(stream.stats().rejected, 3u);

    bool logged_merge = std::any_of(log_lines.begin(), log_lines.end(), [](const auto& l) {
        return l.find("Merge layer pool1") != std::string::npos;
    });
    EXPECT_TRUE(logged_merge);
}

TEST_F(PipelineEndToEnd, MetricsWrittenToLogDirectory) {
    auto log_dir = temp_dir_ / "logs";
    auto net = NetworkGenerator::inception(1);

    {
        Logger logger(std::make_unique<JsonFileSink>(log_dir, "pipeseg"), LogLevel::Info);
        MetricsCollector metrics(std::make_unique<JsonFileSink>(log_dir, "metrics"));

        auto pipeline = InterLayerPipeline::create(std::make_shared<const Network>(net), 1,
                                                   Resource{}, 0.05, logger);
        ASSERT_TRUE(pipeline.has_value());
        metrics.record_dag_summary(pipeline->network(), pipeline->dag());

        AcceptAllValidator validator;
        auto stream = pipeline->generate_segments(
            SegmentOptions{.partition_interlayer = true, .hw_gbuf_save_writeback = true},
            validator);
        auto start = std::chrono::steady_clock::now();
        while (auto segment = stream.next()) {
            expect_covers_contiguous_vertices(pipeline->dag(), *segment);
        }
        metrics.record_stream_stats(stream.stats(),
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start));
        logger.flush();
        metrics.flush();
    }

    auto metric_lines = read_lines(log_dir / "metrics.ndjson");
    ASSERT_EQ(metric_lines.size(), 2u);
    EXPECT_NE(metric_lines[0].find(R"("event":"dag_summary")"), std::string::npos);
    EXPECT_NE(metric_lines[1].find(R"("event":"segment_stream")"), std::string::npos);

    auto log_lines = read_lines(log_dir / "pipeseg.ndjson");
    EXPECT_FALSE(log_lines.empty());
    bool summary = std::any_of(log_lines.begin(), log_lines.end(), [](const auto& l) {
        return l.find("Segment generation done") != std::string::npos;
    });
    EXPECT_TRUE(summary);
}

TEST_F(PipelineEndToEnd, LargeRandomNetworksStayConsistent) {
    std::mt19937 rng(31337);
    for (int trial = 0; trial < 5; ++trial) {
        auto net = NetworkGenerator::random_network(40, 0.08f, 0.35f, rng);
        auto names = net.layer_names();
        auto pipeline = InterLayerPipeline::create(std::make_shared<const Network>(std::move(net)),
                                                   2, Resource{});
        ASSERT_TRUE(pipeline.has_value()) << pipeline.error().message;

        AcceptAllValidator validator;
        auto stream = pipeline->generate_segments(
            SegmentOptions{.partition_interlayer = true, .hw_gbuf_save_writeback = true},
            validator);

        std::set<SegmentLayout> seen;
        size_t index = 0;
        for (const auto& segment : stream) {
            EXPECT_TRUE(seen.insert(segment.layout()).second) << segment.to_string();
            if (index < names.size()) {
                EXPECT_EQ(segment.layout(), SegmentLayout{{names[index]}});
            }
            expect_covers_contiguous_vertices(pipeline->dag(), segment);
            ++index;
        }
        EXPECT_EQ(stream.stats().yielded, seen.size());
        EXPECT_EQ(stream.stats().candidates,
                  stream.stats().yielded + stream.stats().duplicates + stream.stats().rejected);
    }
}
