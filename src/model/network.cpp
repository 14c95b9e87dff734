/**
 * @file network.cpp
 * @brief Network construction and adjacency queries.
 */

#include "model/network.hpp"

#include <algorithm>
#include <stdexcept>

namespace pipeseg {

Network::Network(std::string name) : name_(std::move(name)) {}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<void> Network::add_layer(Layer layer) {
    LayerName prev = order_.empty() ? LayerName{kInputLayerKey} : order_.back();
    return add_layer(std::move(layer), {std::move(prev)});
}

Result<void> Network::add_layer(Layer layer, std::vector<LayerName> prevs) {
    if (layer.name.empty()) {
        return Error{ErrorCode::InvalidNetwork, "Layer name must not be empty"};
    }
    if (layer.name == kInputLayerKey) {
        return Error{ErrorCode::InvalidNetwork,
                     "Layer name " + layer.name + " is reserved for the network input"};
    }
    if (entries_.contains(layer.name)) {
        return Error{ErrorCode::InvalidNetwork, "Duplicate layer " + layer.name};
    }
    if (prevs.empty()) {
        return Error{ErrorCode::InvalidNetwork,
                     "Layer " + layer.name + " must have at least one predecessor"};
    }

    for (size_t i = 0; i < prevs.size(); ++i) {
        const auto& p = prevs[i];
        if (p != kInputLayerKey && !entries_.contains(p)) {
            return Error{ErrorCode::InvalidNetwork,
                         "Layer " + layer.name + " refers to undeclared predecessor " + p};
        }
        if (std::find(prevs.begin(), prevs.begin() + static_cast<std::ptrdiff_t>(i), p)
                != prevs.begin() + static_cast<std::ptrdiff_t>(i)) {
            return Error{ErrorCode::InvalidNetwork,
                         "Layer " + layer.name + " lists predecessor " + p + " twice"};
        }
    }

    for (const auto& p : prevs) {
        if (p != kInputLayerKey) {
            entries_.at(p).nexts.push_back(layer.name);
        }
    }

    LayerName name = layer.name;
    order_.push_back(name);
    entries_.emplace(std::move(name), Entry{std::move(layer), std::move(prevs), {}});
    return {};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

const Network::Entry& Network::entry(std::string_view layer_name) const {
    auto it = entries_.find(std::string{layer_name});
    if (it == entries_.end()) {
        throw std::out_of_range("Network " + name_ + " has no layer " + std::string{layer_name});
    }
    return it->second;
}

bool Network::contains(std::string_view layer_name) const {
    return entries_.contains(std::string{layer_name});
}

const Layer& Network::layer(std::string_view layer_name) const {
    return entry(layer_name).layer;
}

const Layer* Network::find(std::string_view layer_name) const {
    auto it = entries_.find(std::string{layer_name});
    return it == entries_.end() ? nullptr : &it->second.layer;
}

const std::vector<LayerName>& Network::prev_layers(std::string_view layer_name) const {
    return entry(layer_name).prevs;
}

const std::vector<LayerName>& Network::next_layers(std::string_view layer_name) const {
    return entry(layer_name).nexts;
}

std::vector<LayerName> Network::first_layers() const {
    std::vector<LayerName> firsts;
    for (const auto& name : order_) {
        const auto& prevs = entry(name).prevs;
        bool only_input = std::all_of(prevs.begin(), prevs.end(),
                                      [](const LayerName& p) { return p == kInputLayerKey; });
        if (only_input) {
            firsts.push_back(name);
        }
    }
    return firsts;
}

std::vector<LayerName> Network::last_layers() const {
    std::vector<LayerName> lasts;
    for (const auto& name : order_) {
        if (entry(name).nexts.empty()) {
            lasts.push_back(name);
        }
    }
    return lasts;
}

}  // namespace pipeseg
