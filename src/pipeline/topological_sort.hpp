/**
 * @file topological_sort.hpp
 * @brief Depth-first topological ordering of scheduling vertices.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "model/network.hpp"

#include <vector>

namespace pipeseg {

/**
 * @brief Order `vertices` (a partition of the network's layers) topologically.
 *
 * Runs a three-colored DFS from the vertices holding the network's first
 * layers, taken in reverse declaration order. Successor vertices of a vertex
 * are visited in the reverse order their layers are discovered, so that the
 * reversed postorder follows the declaration order where the graph leaves a
 * choice.
 *
 * Errors (ErrorCode::InvalidGraph): a layer in no vertex or in several, an
 * unknown layer name, a vertex-level cycle, or a vertex not reachable from
 * the first layers.
 */
Result<std::vector<Vertex>> topological_order(const Network& network,
                                              const std::vector<Vertex>& vertices);

}  // namespace pipeseg
