/**
 * @file layer.cpp
 * @brief LayerType parsing.
 */

#include "model/layer.hpp"

namespace pipeseg {

std::optional<LayerType> parse_layer_type(std::string_view text) noexcept {
    if (text == "conv")         return LayerType::Conv;
    if (text == "fc")           return LayerType::FC;
    if (text == "pool")         return LayerType::Pooling;
    if (text == "eltwise")      return LayerType::Eltwise;
    if (text == "local_region") return LayerType::LocalRegion;
    return std::nullopt;
}

}  // namespace pipeseg
