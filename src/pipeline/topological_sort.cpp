/**
 * @file topological_sort.cpp
 * @brief DFS postorder over scheduling vertices.
 *
 * The reverse of a DFS postorder is a topological order. The DFS runs on an
 * explicit frame stack so deep layer chains do not exhaust the call stack;
 * the visiting order is the one of the plain recursive formulation.
 */

#include "pipeline/topological_sort.hpp"

#include <algorithm>
#include <unordered_map>

namespace pipeseg {

namespace {

enum class Color : uint8_t { Unseen, InProgress, Done };

/// Index of the vertex holding each layer.
Result<std::unordered_map<LayerName, size_t>> index_layers(const Network& network,
                                                          const std::vector<Vertex>& vertices) {
    std::unordered_map<LayerName, size_t> owner;
    size_t assigned = 0;

    for (size_t v = 0; v < vertices.size(); ++v) {
        if (vertices[v].empty()) {
            return Error{ErrorCode::InvalidGraph, "Vertex " + std::to_string(v) + " is empty"};
        }
        for (const auto& layer : vertices[v]) {
            if (!network.contains(layer)) {
                return Error{ErrorCode::InvalidGraph, "Vertex holds unknown layer " + layer};
            }
            if (!owner.emplace(layer, v).second) {
                return Error{ErrorCode::InvalidGraph, "Layer " + layer + " is in two vertices"};
            }
            ++assigned;
        }
    }

    if (assigned != network.size()) {
        for (const auto& layer : network) {
            if (!owner.contains(layer)) {
                return Error{ErrorCode::InvalidGraph, "Layer " + layer + " is in no vertex"};
            }
        }
    }

    return owner;
}

/// Successor vertices of `vertex`, in the order they are to be visited.
std::vector<size_t> successor_vertices(const Network& network,
                                       const Vertex& vertex,
                                       const std::unordered_map<LayerName, size_t>& owner) {
    std::vector<LayerName> next_layers;
    for (const auto& layer : vertex) {
        for (const auto& nl : network.next_layers(layer)) {
            bool internal = std::find(vertex.begin(), vertex.end(), nl) != vertex.end();
            bool seen = std::find(next_layers.begin(), next_layers.end(), nl) != next_layers.end();
            if (!internal && !seen) {
                next_layers.push_back(nl);
            }
        }
    }

    // Reversed, so that the reversed postorder restores the declared order.
    std::vector<size_t> next_vertices;
    for (auto it = next_layers.rbegin(); it != next_layers.rend(); ++it) {
        size_t nv = owner.at(*it);
        if (std::find(next_vertices.begin(), next_vertices.end(), nv) == next_vertices.end()) {
            next_vertices.push_back(nv);
        }
    }
    return next_vertices;
}

}  // anonymous namespace

Result<std::vector<Vertex>> topological_order(const Network& network,
                                              const std::vector<Vertex>& vertices) {
    auto owner_result = index_layers(network, vertices);
    if (!owner_result) {
        return owner_result.error();
    }
    const auto& owner = *owner_result;

    std::vector<Color> color(vertices.size(), Color::Unseen);
    std::vector<size_t> postorder;
    postorder.reserve(vertices.size());

    struct Frame {
        size_t vertex;
        std::vector<size_t> successors;
        size_t next_idx;
    };

    auto first_layers = network.first_layers();
    for (auto start_it = first_layers.rbegin(); start_it != first_layers.rend(); ++start_it) {
        size_t start = owner.at(*start_it);
        if (color[start] != Color::Unseen) continue;

        std::vector<Frame> dfs_stack;
        color[start] = Color::InProgress;
        dfs_stack.push_back({start, successor_vertices(network, vertices[start], owner), 0});

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.back();

            if (frame.next_idx >= frame.successors.size()) {
                color[frame.vertex] = Color::Done;
                postorder.push_back(frame.vertex);
                dfs_stack.pop_back();
                continue;
            }

            size_t nv = frame.successors[frame.next_idx++];

            if (color[nv] == Color::InProgress) {
                return Error{ErrorCode::InvalidGraph,
                             "Cycle through layer " + vertices[nv].front()
                             + ": the network must be a DAG"};
            }
            if (color[nv] == Color::Done) continue;

            color[nv] = Color::InProgress;
            auto successors = successor_vertices(network, vertices[nv], owner);
            dfs_stack.push_back({nv, std::move(successors), 0});
        }
    }

    if (postorder.size() != vertices.size()) {
        for (size_t v = 0; v < vertices.size(); ++v) {
            if (color[v] == Color::Unseen) {
                return Error{ErrorCode::InvalidGraph,
                             "Layer " + vertices[v].front()
                             + " is not reachable from the network input"};
            }
        }
    }

    std::vector<Vertex> ordered;
    ordered.reserve(vertices.size());
    for (auto it = postorder.rbegin(); it != postorder.rend(); ++it) {
        ordered.push_back(vertices[*it]);
    }
    return ordered;
}

}  // namespace pipeseg
