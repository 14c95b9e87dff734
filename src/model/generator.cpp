/**
 * @file generator.cpp
 * @brief Synthetic network generator: chain, residual, inception and random topologies.
 *
 * Generates layer graphs modelling common CNN structures:
 * - Linear chains (VGG-like stacks)
 * - Residual bottleneck blocks (ResNet)
 * - Multi-branch inception modules (GoogLeNet)
 * - Random DAGs (for stress testing and benchmarking)
 */

#include "model/generator.hpp"

#include <string>

namespace pipeseg {

namespace {

Layer make_layer(std::string name, LayerType type,
                 uint32_t nifm, uint32_t nofm, uint32_t size,
                 uint32_t filter = 1, uint32_t stride = 1) {
    return Layer{
        .name = std::move(name),
        .type = type,
        .nifm = nifm,
        .nofm = nofm,
        .hofm = size,
        .wofm = size,
        .hfil = filter,
        .wfil = filter,
        .stride = stride
    };
}

// Generated topologies are well-formed by construction; a failure here is a
// bug in this file.
void append(Network& net, Layer layer, std::vector<LayerName> prevs) {
    auto added = net.add_layer(std::move(layer), std::move(prevs));
    if (!added) {
        throw InvariantViolation("NetworkGenerator: " + added.error().message);
    }
}

void append(Network& net, Layer layer) {
    auto added = net.add_layer(std::move(layer));
    if (!added) {
        throw InvariantViolation("NetworkGenerator: " + added.error().message);
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear Chain: layer_0 → layer_1 → ... → layer_{n-1}
// ─────────────────────────────────────────────

Network NetworkGenerator::linear_chain(size_t num_layers, LayerType type) {
    Network net("chain");
    for (size_t i = 0; i < num_layers; ++i) {
        append(net, make_layer("layer_" + std::to_string(i), type, 64, 64, 28, 3));
    }
    return net;
}

// ─────────────────────────────────────────────
// Residual blocks:
//
//   conv1 → pool1 ─┬─ a → b → c ─┐
//                  └──── br ─────┴─ res
//
// Later blocks replace `br` with the block input itself.
// ─────────────────────────────────────────────

Network NetworkGenerator::residual_blocks(size_t num_blocks) {
    Network net("resnet");

    append(net, make_layer("conv1", LayerType::Conv, 3, 64, 112, 7, 2));
    append(net, make_layer("pool1", LayerType::Pooling, 64, 64, 56, 3, 2));

    LayerName prev = "pool1";
    uint32_t in_c = 64;
    constexpr uint32_t kMidC = 64;
    constexpr uint32_t kOutC = 256;

    for (size_t blk = 0; blk < num_blocks; ++blk) {
        std::string base = "blk" + std::to_string(blk) + "_";

        append(net, make_layer(base + "a", LayerType::Conv, in_c, kMidC, 56), {prev});
        append(net, make_layer(base + "b", LayerType::Conv, kMidC, kMidC, 56, 3));
        append(net, make_layer(base + "c", LayerType::Conv, kMidC, kOutC, 56));

        LayerName shortcut = prev;
        if (blk == 0) {
            append(net, make_layer(base + "br", LayerType::Conv, in_c, kOutC, 56), {prev});
            shortcut = base + "br";
        }

        append(net, make_layer(base + "res", LayerType::Eltwise, kOutC, kOutC, 56),
               {shortcut, base + "c"});
        prev = base + "res";
        in_c = kOutC;
    }

    return net;
}

// ─────────────────────────────────────────────
// Inception modules:
//
//            ┌─ 1x1 ──────────┐
//   inputs ──┼─ 1x1 → 3x3 ────┤
//            ├─ 1x1 → 5x5 ────┼── (next module / pool_out)
//            └─ pool → 1x1 ───┘
// ─────────────────────────────────────────────

Network NetworkGenerator::inception(size_t num_modules) {
    Network net("inception");

    append(net, make_layer("stem", LayerType::Conv, 3, 192, 28, 3));
    append(net, make_layer("stem_pool", LayerType::Pooling, 192, 192, 28, 3));

    std::vector<LayerName> inputs{"stem_pool"};
    uint32_t in_c = 192;

    for (size_t m = 0; m < num_modules; ++m) {
        std::string base = "inc" + std::to_string(m) + "_";

        append(net, make_layer(base + "1x1", LayerType::Conv, in_c, 64, 28), inputs);

        append(net, make_layer(base + "3x3_red", LayerType::Conv, in_c, 96, 28), inputs);
        append(net, make_layer(base + "3x3", LayerType::Conv, 96, 128, 28, 3));

        append(net, make_layer(base + "5x5_red", LayerType::Conv, in_c, 16, 28), inputs);
        append(net, make_layer(base + "5x5", LayerType::Conv, 16, 32, 28, 5));

        append(net, make_layer(base + "pool", LayerType::Pooling, in_c, in_c, 28, 3), inputs);
        append(net, make_layer(base + "pool_proj", LayerType::Conv, in_c, 32, 28));

        inputs = {base + "1x1", base + "3x3", base + "5x5", base + "pool_proj"};
        in_c = 64 + 128 + 32 + 32;
    }

    append(net, make_layer("pool_out", LayerType::Pooling, in_c, in_c, 1, 7), inputs);
    append(net, make_layer("fc", LayerType::FC, in_c, 1000, 1));

    return net;
}

// ─────────────────────────────────────────────
// Random DAG:
// Edges only go from lower to higher declaration index, so the result is
// acyclic, and every layer has at least one predecessor.
// ─────────────────────────────────────────────

Network NetworkGenerator::random_network(size_t num_layers,
                                         float edge_probability,
                                         float mergeable_probability,
                                         std::mt19937& rng) {
    Network net("random");
    std::uniform_real_distribution<float> coin(0.0f, 1.0f);

    for (size_t i = 0; i < num_layers; ++i) {
        std::vector<LayerName> prevs;
        for (size_t j = 0; j < i; ++j) {
            if (coin(rng) < edge_probability) {
                prevs.push_back("rand_" + std::to_string(j));
            }
        }
        if (prevs.empty()) {
            prevs.push_back(i == 0 ? LayerName{Network::kInputLayerKey}
                                   : "rand_" + std::to_string(i - 1));
        }

        LayerType type = LayerType::Conv;
        if (coin(rng) < mergeable_probability) {
            type = prevs.size() > 1 ? LayerType::Eltwise : LayerType::Pooling;
        }

        append(net, make_layer("rand_" + std::to_string(i), type, 32, 32, 14, 3), std::move(prevs));
    }

    return net;
}

}  // namespace pipeseg
