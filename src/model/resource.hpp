/**
 * @file resource.hpp
 * @brief Hardware resource descriptor.
 *
 * The scheduling core treats a Resource as opaque; it is only shape-checked
 * on pipeline construction and handed to segment validators.
 */

#pragma once

#include <compare>
#include <cstdint>

namespace pipeseg {

/**
 * @brief Two-dimensional extent of a processing-node array.
 */
struct PhyDim2 {
    uint32_t rows = 0;
    uint32_t cols = 0;

    [[nodiscard]] constexpr uint64_t size() const noexcept {
        return static_cast<uint64_t>(rows) * cols;
    }

    auto operator<=>(const PhyDim2&) const = default;
};

struct Resource {
    PhyDim2 proc_region{4, 4};          ///< Processing nodes available to a segment
    uint32_t data_regions = 1;          ///< Off-chip memory channels
    uint64_t gbuf_bytes = 65536;        ///< Global buffer per node
    uint64_t regf_bytes = 64;           ///< Register file per PE
    double dram_bandwidth = 25.6;       ///< GB/s per data region

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return proc_region.size() > 0
            && data_regions > 0
            && gbuf_bytes > 0
            && regf_bytes > 0
            && dram_bandwidth > 0.0;
    }

    auto operator<=>(const Resource&) const = default;
};

}  // namespace pipeseg
