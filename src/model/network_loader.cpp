/**
 * @file network_loader.cpp
 * @brief Network description loading using toml++.
 */

#include "model/network_loader.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pipeseg {

namespace {

Result<uint32_t> read_dim(const toml::table& layer_tbl, std::string_view key,
                          int64_t fallback, const std::string& layer_name) {
    auto value = layer_tbl[key].value_or(fallback);
    if (value <= 0 || value > static_cast<int64_t>(UINT32_MAX)) {
        return Error{ErrorCode::ParseError,
                     "Layer " + layer_name + ": " + std::string{key} + " must be positive"};
    }
    return static_cast<uint32_t>(value);
}

Result<Network> build_network(const toml::table& tbl) {
    std::string net_name = "network";
    if (auto header = tbl["network"]; header.is_table()) {
        net_name = header["name"].value_or(net_name);
    }

    Network net(net_name);

    const toml::array* layers = tbl["layers"].as_array();
    if (layers == nullptr || layers->empty()) {
        return Error{ErrorCode::ParseError, "Network " + net_name + " declares no [[layers]]"};
    }

    size_t index = 0;
    for (const auto& node : *layers) {
        const toml::table* layer_tbl = node.as_table();
        if (layer_tbl == nullptr) {
            return Error{ErrorCode::ParseError,
                         "layers[" + std::to_string(index) + "] is not a table"};
        }

        auto name = (*layer_tbl)["name"].value<std::string>();
        if (!name || name->empty()) {
            return Error{ErrorCode::ParseError,
                         "layers[" + std::to_string(index) + "] has no name"};
        }

        auto type_text = (*layer_tbl)["type"].value_or(std::string{"conv"});
        auto type = parse_layer_type(type_text);
        if (!type) {
            return Error{ErrorCode::ParseError,
                         "Layer " + *name + ": unknown type '" + type_text + "'"};
        }

        Layer layer{.name = *name, .type = *type};

        auto nifm = read_dim(*layer_tbl, "nifm", 1, *name);
        if (!nifm) return nifm.error();
        auto nofm = read_dim(*layer_tbl, "nofm", *nifm, *name);
        if (!nofm) return nofm.error();
        auto size = read_dim(*layer_tbl, "size", 1, *name);
        if (!size) return size.error();
        auto filter = read_dim(*layer_tbl, "filter", 1, *name);
        if (!filter) return filter.error();
        auto stride = read_dim(*layer_tbl, "stride", 1, *name);
        if (!stride) return stride.error();

        layer.nifm = *nifm;
        layer.nofm = *nofm;
        layer.hofm = layer.wofm = *size;
        layer.hfil = layer.wfil = *filter;
        layer.stride = *stride;

        Result<void> added;
        if (const toml::array* prevs_arr = (*layer_tbl)["prevs"].as_array()) {
            std::vector<LayerName> prevs;
            for (const auto& prev_node : *prevs_arr) {
                auto prev = prev_node.value<std::string>();
                if (!prev) {
                    return Error{ErrorCode::ParseError,
                                 "Layer " + *name + ": prevs must be strings"};
                }
                prevs.push_back(std::move(*prev));
            }
            added = net.add_layer(std::move(layer), std::move(prevs));
        } else {
            added = net.add_layer(std::move(layer));
        }
        if (!added) {
            return added.error();
        }

        ++index;
    }

    return net;
}

}  // anonymous namespace

Result<Network> parse_network(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return build_network(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Network> load_network(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Network file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return build_network(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error in "} + path.string() + ": "
                     + std::string{err.description()}};
    }
}

}  // namespace pipeseg
