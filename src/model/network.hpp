/**
 * @file network.hpp
 * @brief Layer graph of a neural network.
 *
 * Layers are kept in declaration order. A layer may only name predecessors
 * that were declared before it, so a Network built through add_layer() is
 * acyclic. The reserved key kInputLayerKey stands for the network's external
 * input and appears in the predecessor list of every layer fed by it.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "model/layer.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pipeseg {

class Network {
public:
    static constexpr std::string_view kInputLayerKey = "__INPUT__";

    explicit Network(std::string name = "network");

    // ── Construction ──────────────────────────

    /// Append a layer fed by the previously declared layer (the external
    /// input for the first one).
    Result<void> add_layer(Layer layer);

    /// Append a layer fed by `prevs`, which may contain kInputLayerKey.
    Result<void> add_layer(Layer layer, std::vector<LayerName> prevs);

    // ── Queries ───────────────────────────────
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] size_t size() const noexcept { return order_.size(); }
    [[nodiscard]] bool empty() const noexcept { return order_.empty(); }
    [[nodiscard]] bool contains(std::string_view layer_name) const;

    /// Throws std::out_of_range for an unknown name.
    [[nodiscard]] const Layer& layer(std::string_view layer_name) const;
    [[nodiscard]] const Layer* find(std::string_view layer_name) const;

    /// Layer names in declaration order.
    [[nodiscard]] const std::vector<LayerName>& layer_names() const noexcept { return order_; }
    [[nodiscard]] auto begin() const noexcept { return order_.begin(); }
    [[nodiscard]] auto end() const noexcept { return order_.end(); }

    /// Predecessors in declaration order; kInputLayerKey for the external input.
    [[nodiscard]] const std::vector<LayerName>& prev_layers(std::string_view layer_name) const;

    /// Successors in the order they were attached; empty when the layer only
    /// feeds the external output.
    [[nodiscard]] const std::vector<LayerName>& next_layers(std::string_view layer_name) const;

    /// Layers fed only by the external input, in declaration order.
    [[nodiscard]] std::vector<LayerName> first_layers() const;

    /// Layers without successors, in declaration order.
    [[nodiscard]] std::vector<LayerName> last_layers() const;

private:
    struct Entry {
        Layer layer;
        std::vector<LayerName> prevs;
        std::vector<LayerName> nexts;
    };

    const Entry& entry(std::string_view layer_name) const;

    std::string name_;
    std::vector<LayerName> order_;
    std::unordered_map<LayerName, Entry> entries_;
};

}  // namespace pipeseg
