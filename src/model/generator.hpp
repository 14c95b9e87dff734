/**
 * @file generator.hpp
 * @brief Synthetic network generators for testing, benchmarking and the CLI.
 */

#pragma once

#include "model/network.hpp"

#include <random>

namespace pipeseg {

/**
 * @brief Factory for layer graphs with common CNN topologies.
 */
class NetworkGenerator {
public:
    /// Linear chain: layer_0 → layer_1 → ... → layer_{n-1}, all of `type`.
    static Network linear_chain(size_t num_layers, LayerType type = LayerType::Conv);

    /// ResNet-style bottleneck blocks after a conv + pool stem. The first
    /// block has a projection shortcut; the others use identity shortcuts.
    static Network residual_blocks(size_t num_blocks);

    /// GoogLeNet-style inception modules with four branches each; the
    /// branches of module m+1 consume all four outputs of module m.
    static Network inception(size_t num_modules);

    /// Random DAG: each layer picks earlier layers as predecessors with
    /// `edge_probability` (falling back to the previous layer), and is
    /// mergeable with `mergeable_probability`.
    static Network random_network(size_t num_layers,
                                  float edge_probability,
                                  float mergeable_probability,
                                  std::mt19937& rng);
};

}  // namespace pipeseg
