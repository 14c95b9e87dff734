/**
 * @file layer.hpp
 * @brief Neural-network layer descriptors.
 *
 * A layer is identified by name and tagged with a LayerType. Whether a layer
 * may be merged into its producer's scheduling vertex is a trait of the tag
 * (see is_mergeable), never of the concrete C++ type.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace pipeseg {

enum class LayerType : uint8_t {
    Conv,          ///< Convolution, owns filters
    FC,            ///< Fully connected, owns filters
    Pooling,       ///< Spatial pooling, no weights
    Eltwise,       ///< Element-wise combination of several inputs
    LocalRegion    ///< Other local-region ops (LRN, activation), no weights
};

[[nodiscard]] constexpr std::string_view to_string(LayerType type) noexcept {
    switch (type) {
        case LayerType::Conv:        return "conv";
        case LayerType::FC:          return "fc";
        case LayerType::Pooling:     return "pool";
        case LayerType::Eltwise:     return "eltwise";
        case LayerType::LocalRegion: return "local_region";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LayerType> parse_layer_type(std::string_view text) noexcept;

/// Layers with filters start their own scheduling vertex; the rest may merge.
[[nodiscard]] constexpr bool is_mergeable(LayerType type) noexcept {
    return type != LayerType::Conv && type != LayerType::FC;
}

/**
 * @brief Shape of one layer. Carried through for validators; the scheduling
 *        core only looks at name and type.
 */
struct Layer {
    LayerName name;
    LayerType type = LayerType::Conv;
    uint32_t nifm = 1;      ///< Input channels
    uint32_t nofm = 1;      ///< Output channels
    uint32_t hofm = 1;      ///< Output height
    uint32_t wofm = 1;      ///< Output width
    uint32_t hfil = 1;      ///< Filter / window height
    uint32_t wfil = 1;      ///< Filter / window width
    uint32_t stride = 1;

    [[nodiscard]] constexpr bool mergeable() const noexcept { return is_mergeable(type); }

    [[nodiscard]] constexpr uint64_t ofmap_size() const noexcept {
        return static_cast<uint64_t>(nofm) * hofm * wofm;
    }

    [[nodiscard]] constexpr uint64_t filter_size() const noexcept {
        return mergeable() ? 0 : static_cast<uint64_t>(nifm) * nofm * hfil * wfil;
    }

    auto operator<=>(const Layer&) const = default;
};

}  // namespace pipeseg
