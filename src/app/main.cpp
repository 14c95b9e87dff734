/**
 * @file main.cpp
 * @brief pipeseg command-line entry point.
 *
 * Wires the modules into one run:
 *   Config → Logger → Network → InterLayerPipeline → Validator → SegmentStream → Telemetry
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "model/generator.hpp"
#include "model/network.hpp"
#include "model/network_loader.hpp"
#include "pipeline/inter_layer_pipeline.hpp"
#include "pipeline/segment_validator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace pipeseg;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitInvariant = 2;

struct CLIArgs {
    std::filesystem::path config_path;
    std::filesystem::path network_path;
    std::string builtin;
    std::optional<bool> spatial;
    std::optional<bool> temporal;
    bool order_only = false;
    std::optional<size_t> limit;
    std::string log_dir;
};

void print_usage() {
    std::cout << "Usage: pipeseg [OPTIONS] (--network <path> | --builtin <name>)\n"
              << "  --config <path>    Configuration file (default: built-in defaults)\n"
              << "  --network <path>   Network description (TOML)\n"
              << "  --builtin <name>   Built-in network: chain, resnet_block, inception\n"
              << "  --spatial          Emit one-stage-per-vertex candidates\n"
              << "  --no-spatial       Do not emit spatial candidates\n"
              << "  --temporal         Emit all-layers-in-one-stage candidates\n"
              << "  --no-temporal      Do not emit temporal candidates\n"
              << "  --order-only       Print the layer order and exit\n"
              << "  --limit <n>        Stop after n segments\n"
              << "  --log-dir <path>   Log output directory (default: stderr)\n"
              << "  --help, -h         Show this help message\n";
}

/// Parse the command line; nullopt after printing a diagnostic.
std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--network" && i + 1 < argc) {
            args.network_path = argv[++i];
        } else if (arg == "--builtin" && i + 1 < argc) {
            args.builtin = argv[++i];
        } else if (arg == "--spatial") {
            args.spatial = true;
        } else if (arg == "--no-spatial") {
            args.spatial = false;
        } else if (arg == "--temporal") {
            args.temporal = true;
        } else if (arg == "--no-temporal") {
            args.temporal = false;
        } else if (arg == "--order-only") {
            args.order_only = true;
        } else if (arg == "--limit" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                size_t consumed = 0;
                auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size()) throw std::invalid_argument(value);
                args.limit = static_cast<size_t>(parsed);
            } catch (const std::logic_error&) {
                std::cerr << "Invalid --limit value: " << value << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitOk);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (args.network_path.empty() == args.builtin.empty()) {
        std::cerr << "Exactly one of --network or --builtin is required" << std::endl;
        return std::nullopt;
    }
    return args;
}

Result<Network> builtin_network(const std::string& name) {
    if (name == "chain") return NetworkGenerator::linear_chain(8);
    if (name == "resnet_block") return NetworkGenerator::residual_blocks(2);
    if (name == "inception") return NetworkGenerator::inception(1);
    return make_error<Network>(ErrorCode::NotFound, "Unknown built-in network: " + name);
}

std::unique_ptr<ISegmentValidator> make_validator(const ValidatorConfig& config) {
    if (config.kind == "accept_all") {
        return std::make_unique<AcceptAllValidator>();
    }
    return std::make_unique<NodeBudgetValidator>(config.max_layers_per_segment);
}

/**
 * @brief Build the pipeline and print order, segments and statistics.
 */
int run(const Config& config, const CLIArgs& args, Logger& logger) {
    auto network = args.builtin.empty() ? load_network(args.network_path)
                                        : builtin_network(args.builtin);
    if (!network) {
        logger.error("Failed to load network: " + network.error().message);
        std::cerr << "Failed to load network: " << network.error().message << std::endl;
        return kExitError;
    }

    auto shared_network = std::make_shared<const Network>(std::move(*network));
    auto pipeline = InterLayerPipeline::create(shared_network,
                                               config.pipeline.batch_size,
                                               config.resource,
                                               config.pipeline.max_util_drop,
                                               logger.child("pipeline"));
    if (!pipeline) {
        std::cerr << "Failed to build pipeline: " << pipeline.error().message << std::endl;
        return kExitError;
    }

    // ── Telemetry ────────────────────────────
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.logging.log_dir.empty()) {
        metrics_sink = std::make_unique<JsonFileSink>(config.logging.log_dir, "pipeseg_metrics",
                                                      config.logging.max_file_size_mb,
                                                      config.logging.rotate_count);
    } else {
        metrics_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(metrics_sink));
    metrics.record_dag_summary(pipeline->network(), pipeline->dag());

    std::cout << "Layer order:";
    for (const auto& name : pipeline->ordered_layer_list()) {
        std::cout << ' ' << name;
    }
    std::cout << '\n';

    if (args.order_only) {
        metrics.flush();
        return kExitOk;
    }

    SegmentOptions options = config.options;
    if (args.spatial) options.partition_interlayer = *args.spatial;
    if (args.temporal) options.hw_gbuf_save_writeback = *args.temporal;

    auto validator = make_validator(config.validator);
    logger.info("Validator: " + std::string(validator->name()));

    auto start = std::chrono::steady_clock::now();
    auto stream = pipeline->generate_segments(options, *validator);

    std::cout << "Segments:\n";
    size_t printed = 0;
    while (!args.limit || printed < *args.limit) {
        auto segment = stream.next();
        if (!segment) break;
        std::cout << "  " << segment->to_string() << '\n';
        metrics.record_segment(*segment);
        ++printed;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    const auto& stats = stream.stats();
    metrics.record_stream_stats(stats, elapsed);
    metrics.flush();

    std::cout << "Stats: " << stats.yielded << " segments, "
              << stats.vertex_segments << " vsegs, "
              << stats.candidates << " candidates, "
              << stats.duplicates << " duplicates, "
              << stats.rejected << " rejected"
              << (stream.finished() ? "" : " (truncated)") << '\n';
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return kExitError;
    }

    // Load configuration
    Config config = default_config();
    if (!args->config_path.empty()) {
        auto config_result = load_config(args->config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return kExitError;
        }
        config = *config_result;
    }

    // Apply CLI overrides
    if (!args->log_dir.empty()) config.logging.log_dir = args->log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    try {
        if (!config.logging.log_dir.empty()) {
            log_sink = std::make_unique<JsonFileSink>(config.logging.log_dir, "pipeseg",
                                                      config.logging.max_file_size_mb,
                                                      config.logging.rotate_count);
        } else {
            log_sink = std::make_unique<StderrSink>();
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Cannot open log directory: " << e.what() << std::endl;
        return kExitError;
    }
    Logger logger(std::move(log_sink), config.logging.level);
    logger.info("pipeseg starting");
    logger.info("Batch size: " + std::to_string(config.pipeline.batch_size)
                + ", processing region " + std::to_string(config.resource.proc_region.rows)
                + "x" + std::to_string(config.resource.proc_region.cols));

    int status = kExitOk;
    try {
        status = run(config, *args, logger);
    } catch (const InvariantViolation& e) {
        logger.error(std::string("Invariant violation: ") + e.what());
        std::cerr << "Invariant violation: " << e.what() << std::endl;
        status = kExitInvariant;
    } catch (const std::filesystem::filesystem_error& e) {
        logger.error(std::string("Filesystem error: ") + e.what());
        std::cerr << "Filesystem error: " << e.what() << std::endl;
        status = kExitError;
    }

    logger.flush();
    return status;
}
