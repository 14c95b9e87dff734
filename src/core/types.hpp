/**
 * @file types.hpp
 * @brief Fundamental types used throughout PipeSeg.
 *
 * Defines layer names, vertex indices, vertex segments and segment layouts.
 * All types are plain values; tuples of names are modelled as vectors.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pipeseg {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using LayerName = std::string;
using VertexIndex = int32_t;

/// Index of the sentinel vertex that stands for the network's external input.
inline constexpr VertexIndex kInputVertex = -1;

// ─────────────────────────────────────────────
// Scheduling Vocabulary
// ─────────────────────────────────────────────

/// One or more merged layers scheduled as a unit, in merge order.
using Vertex = std::vector<LayerName>;

/// Strictly increasing vertex indices considered for pipelining together.
using VertexSegment = std::vector<VertexIndex>;

/// A pipeline stage: the layers sharing one slice of the resource.
using Stage = std::vector<LayerName>;

/// Stages of a candidate segment, in pipeline order.
using SegmentLayout = std::vector<Stage>;

// ─────────────────────────────────────────────
// Materialization Options
// ─────────────────────────────────────────────

/**
 * @brief Switches controlling how a vertex segment is turned into candidates.
 */
struct SegmentOptions {
    bool partition_interlayer = false;      ///< Spatial: one stage per vertex
    bool hw_gbuf_save_writeback = false;    ///< Temporal: all vertices in one stage

    auto operator<=>(const SegmentOptions&) const = default;
};

/**
 * @brief Render a layout as "[a b | c]" (stages separated by '|').
 */
[[nodiscard]] std::string to_string(const SegmentLayout& layout);

}  // namespace pipeseg
