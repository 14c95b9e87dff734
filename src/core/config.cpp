/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <cstdint>

namespace pipeseg {

namespace {

Result<Config> build_config(const toml::table& tbl) {
    Config config;

    // [pipeline]
    if (auto pipeline = tbl["pipeline"]; pipeline.is_table()) {
        auto batch = pipeline["batch_size"].value_or(int64_t{1});
        if (batch <= 0 || batch > int64_t{UINT32_MAX}) {
            return Error{ErrorCode::InvalidConfig, "pipeline.batch_size must be positive"};
        }
        config.pipeline.batch_size = static_cast<uint32_t>(batch);
        config.pipeline.max_util_drop = pipeline["max_util_drop"].value_or(0.05);
        if (!(config.pipeline.max_util_drop >= 0.0 && config.pipeline.max_util_drop <= 1.0)) {
            return Error{ErrorCode::InvalidConfig, "pipeline.max_util_drop must be in [0, 1]"};
        }
    }

    // [options]
    if (auto options = tbl["options"]; options.is_table()) {
        config.options.partition_interlayer =
            options["partition_interlayer"].value_or(config.options.partition_interlayer);
        config.options.hw_gbuf_save_writeback =
            options["hw_gbuf_save_writeback"].value_or(config.options.hw_gbuf_save_writeback);
    }

    // [resource]
    if (auto resource = tbl["resource"]; resource.is_table()) {
        auto& res = config.resource;
        auto rows = resource["proc_rows"].value_or(int64_t{res.proc_region.rows});
        auto cols = resource["proc_cols"].value_or(int64_t{res.proc_region.cols});
        auto regions = resource["data_regions"].value_or(int64_t{res.data_regions});
        auto gbuf = resource["gbuf_bytes"].value_or(static_cast<int64_t>(res.gbuf_bytes));
        auto regf = resource["regf_bytes"].value_or(static_cast<int64_t>(res.regf_bytes));
        if (rows <= 0 || cols <= 0 || regions <= 0 || gbuf <= 0 || regf <= 0) {
            return Error{ErrorCode::InvalidConfig,
                         "resource: node region, data regions and buffers must be positive"};
        }
        res.proc_region = PhyDim2{static_cast<uint32_t>(rows), static_cast<uint32_t>(cols)};
        res.data_regions = static_cast<uint32_t>(regions);
        res.gbuf_bytes = static_cast<uint64_t>(gbuf);
        res.regf_bytes = static_cast<uint64_t>(regf);
        res.dram_bandwidth = resource["dram_bandwidth"].value_or(res.dram_bandwidth);
        if (!res.is_valid()) {
            return Error{ErrorCode::InvalidConfig,
                         "resource.dram_bandwidth must be positive"};
        }
    }

    // [validator]
    if (auto validator = tbl["validator"]; validator.is_table()) {
        config.validator.kind = validator["kind"].value_or(config.validator.kind);
        if (config.validator.kind != "node_budget" && config.validator.kind != "accept_all") {
            return Error{ErrorCode::ParseError,
                         "validator.kind must be 'node_budget' or 'accept_all', got '"
                         + config.validator.kind + "'"};
        }
        auto cap = validator["max_layers_per_segment"].value_or(int64_t{0});
        if (cap < 0) {
            return Error{ErrorCode::InvalidConfig, "validator.max_layers_per_segment must be >= 0"};
        }
        config.validator.max_layers_per_segment = static_cast<uint32_t>(cap);
    }

    // [logging]
    if (auto logging = tbl["logging"]; logging.is_table()) {
        auto level_text = logging["level"].value_or(std::string{"info"});
        auto level = parse_log_level(level_text);
        if (!level) {
            return Error{ErrorCode::ParseError, "logging.level: unknown level '" + level_text + "'"};
        }
        config.logging.level = *level;
        config.logging.log_dir = logging["log_dir"].value_or(std::string{});
        auto file_mb = logging["max_file_size_mb"].value_or(int64_t{50});
        auto rotate = logging["rotate_count"].value_or(int64_t{5});
        if (file_mb < 0 || rotate < 0) {
            return Error{ErrorCode::InvalidConfig,
                         "logging.max_file_size_mb and logging.rotate_count must be >= 0"};
        }
        config.logging.max_file_size_mb = static_cast<uint32_t>(file_mb);
        config.logging.rotate_count = static_cast<uint32_t>(rotate);
    }

    return config;
}

}  // anonymous namespace

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return build_config(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace pipeseg
