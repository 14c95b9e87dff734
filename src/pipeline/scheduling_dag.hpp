/**
 * @file scheduling_dag.hpp
 * @brief Scheduling DAG: layers merged into vertices, in topological order.
 *
 * Layers without filters are folded into the vertex of the producer whose
 * output they consume in place, so one vertex may hold several layers.
 * Vertices are indexed 0..V-1 in scheduling order; kInputVertex (-1) stands
 * for the network input. Adjacency is built once and never changes.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "model/network.hpp"

#include <optional>
#include <set>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pipeseg {

using VertexSet = std::set<VertexIndex>;

/**
 * @brief Group the network's layers into (unordered) scheduling vertices.
 *
 * Filtered layers start a new vertex. A mergeable layer joins the most
 * recently created vertex whose last layer feeds it, whose other layers do
 * not feed it, and whose last layer has no other consumer; otherwise it
 * starts a new vertex.
 *
 * Errors: a mergeable layer without predecessors, or a layer count that
 * does not add up (ErrorCode::InvalidGraph).
 */
Result<std::vector<Vertex>> merge_layers(const Network& network, Logger* logger = nullptr);

class SchedulingDAG {
public:
    /**
     * @brief Merge, order and connect the layers of `network`.
     */
    static Result<SchedulingDAG> build(const Network& network, Logger* logger = nullptr);

    // ── Vertices ──────────────────────────────
    [[nodiscard]] size_t vertex_count() const noexcept { return vertices_.size(); }
    [[nodiscard]] const std::vector<Vertex>& vertices() const noexcept { return vertices_; }

    /// Throws std::out_of_range for an index outside 0..V-1.
    [[nodiscard]] const Vertex& vertex(VertexIndex idx) const;

    [[nodiscard]] std::optional<VertexIndex> vertex_of(std::string_view layer) const;

    /// All layer names, vertex by vertex, in scheduling order.
    [[nodiscard]] std::vector<LayerName> ordered_layers() const;

    // ── Adjacency ─────────────────────────────
    // Both accept kInputVertex. Throw std::out_of_range otherwise.
    [[nodiscard]] const VertexSet& prevs(VertexIndex idx) const;
    [[nodiscard]] const VertexSet& nexts(VertexIndex idx) const;

private:
    SchedulingDAG() = default;

    [[nodiscard]] size_t slot(VertexIndex idx) const;

    std::vector<Vertex> vertices_;
    // Slot 0 is kInputVertex, slot v+1 is vertex v.
    std::vector<VertexSet> prevs_;
    std::vector<VertexSet> nexts_;
    std::unordered_map<LayerName, VertexIndex> layer_to_vertex_;
};

}  // namespace pipeseg
