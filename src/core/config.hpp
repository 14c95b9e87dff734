/**
 * @file config.hpp
 * @brief Run configuration with TOML deserialization.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "model/resource.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace pipeseg {

struct PipelineConfig {
    uint32_t batch_size = 1;
    double max_util_drop = 0.05;        ///< Tolerated utilization loss, [0, 1]
};

struct ValidatorConfig {
    std::string kind = "node_budget";   ///< "node_budget", "accept_all"
    uint32_t max_layers_per_segment = 0;    ///< 0 = unlimited
};

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    std::filesystem::path log_dir;      ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    PipelineConfig pipeline;
    SegmentOptions options{.partition_interlayer = true, .hw_gbuf_save_writeback = true};
    Resource resource;
    ValidatorConfig validator;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing tables and keys keep their defaults. Out-of-range values are
 * rejected here so that later stages only see well-formed settings.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace pipeseg
