/**
 * @file scheduling_dag.cpp
 * @brief Layer merging and vertex adjacency.
 */

#include "pipeline/scheduling_dag.hpp"
#include "pipeline/topological_sort.hpp"

#include <algorithm>
#include <stdexcept>

namespace pipeseg {

// ─────────────────────────────────────────────
// Layer Merging
// ─────────────────────────────────────────────

Result<std::vector<Vertex>> merge_layers(const Network& network, Logger* logger) {
    std::vector<Vertex> vertices;

    for (const auto& layer_name : network) {
        const Layer& layer = network.layer(layer_name);

        if (!layer.mergeable()) {
            vertices.push_back({layer_name});
            continue;
        }

        const auto& prevs = network.prev_layers(layer_name);
        if (prevs.empty()) {
            return Error{ErrorCode::InvalidGraph,
                         "Mergeable layer " + layer_name + " has no predecessor"};
        }
        auto is_prev = [&prevs](const LayerName& name) {
            return std::find(prevs.begin(), prevs.end(), name) != prevs.end();
        };

        // Only the last layer of a vertex has its output available to a
        // merged consumer, and it must have no other consumer since the
        // merged layer overwrites it locally. Most recent vertex first.
        bool merged = false;
        for (auto idx = vertices.size(); idx-- > 0;) {
            auto& vertex = vertices[idx];
            const auto& tail = vertex.back();
            bool head_disjoint = std::none_of(vertex.begin(), vertex.end() - 1, is_prev);

            if (head_disjoint && is_prev(tail) && network.next_layers(tail).size() == 1) {
                if (logger != nullptr) {
                    logger->debug("Merge layer " + layer_name + " into vertex headed by "
                                  + vertex.front());
                }
                vertex.push_back(layer_name);
                merged = true;
                break;
            }
        }

        if (!merged) {
            vertices.push_back({layer_name});
        }
    }

    size_t total = 0;
    for (const auto& vertex : vertices) {
        total += vertex.size();
    }
    if (total != network.size()) {
        return Error{ErrorCode::InvalidGraph,
                     "Merged vertices hold " + std::to_string(total) + " layers, network has "
                     + std::to_string(network.size())};
    }

    return vertices;
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<SchedulingDAG> SchedulingDAG::build(const Network& network, Logger* logger) {
    auto merged = merge_layers(network, logger);
    if (!merged) {
        return merged.error();
    }

    auto ordered = topological_order(network, *merged);
    if (!ordered) {
        return ordered.error();
    }

    SchedulingDAG dag;
    dag.vertices_ = std::move(*ordered);

    for (size_t v = 0; v < dag.vertices_.size(); ++v) {
        for (const auto& layer_name : dag.vertices_[v]) {
            if (!dag.layer_to_vertex_.emplace(layer_name, static_cast<VertexIndex>(v)).second) {
                return Error{ErrorCode::InvalidGraph, "Layer " + layer_name + " is in two vertices"};
            }
        }
    }

    dag.prevs_.assign(dag.vertices_.size() + 1, {});
    dag.nexts_.assign(dag.vertices_.size() + 1, {});

    for (const auto& layer_name : network) {
        VertexIndex vidx = dag.layer_to_vertex_.at(layer_name);

        for (const auto& pl : network.prev_layers(layer_name)) {
            VertexIndex pvidx = pl == Network::kInputLayerKey ? kInputVertex
                                                              : dag.layer_to_vertex_.at(pl);
            if (pvidx != vidx) {
                dag.prevs_[dag.slot(vidx)].insert(pvidx);
            }
        }

        for (const auto& nl : network.next_layers(layer_name)) {
            VertexIndex nvidx = dag.layer_to_vertex_.at(nl);
            if (nvidx != vidx) {
                dag.nexts_[dag.slot(vidx)].insert(nvidx);
            }
        }
    }

    // The input vertex feeds every vertex that lists it as a predecessor.
    for (VertexIndex v = 0; v < static_cast<VertexIndex>(dag.vertices_.size()); ++v) {
        if (dag.prevs_[dag.slot(v)].contains(kInputVertex)) {
            dag.nexts_[dag.slot(kInputVertex)].insert(v);
        }
    }

    if (logger != nullptr) {
        logger->info("Scheduling DAG for " + network.name() + ": "
                     + std::to_string(network.size()) + " layers in "
                     + std::to_string(dag.vertices_.size()) + " vertices");
    }

    return dag;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

size_t SchedulingDAG::slot(VertexIndex idx) const {
    if (idx < kInputVertex || idx >= static_cast<VertexIndex>(vertices_.size())) {
        throw std::out_of_range("Vertex index " + std::to_string(idx) + " out of range");
    }
    return static_cast<size_t>(idx + 1);
}

const Vertex& SchedulingDAG::vertex(VertexIndex idx) const {
    if (idx < 0 || idx >= static_cast<VertexIndex>(vertices_.size())) {
        throw std::out_of_range("Vertex index " + std::to_string(idx) + " out of range");
    }
    return vertices_[static_cast<size_t>(idx)];
}

std::optional<VertexIndex> SchedulingDAG::vertex_of(std::string_view layer) const {
    auto it = layer_to_vertex_.find(std::string{layer});
    if (it == layer_to_vertex_.end()) return std::nullopt;
    return it->second;
}

std::vector<LayerName> SchedulingDAG::ordered_layers() const {
    std::vector<LayerName> layers;
    for (const auto& vertex : vertices_) {
        layers.insert(layers.end(), vertex.begin(), vertex.end());
    }
    return layers;
}

const VertexSet& SchedulingDAG::prevs(VertexIndex idx) const {
    return prevs_[slot(idx)];
}

const VertexSet& SchedulingDAG::nexts(VertexIndex idx) const {
    return nexts_[slot(idx)];
}

}  // namespace pipeseg
