/**
 * @file network_loader.hpp
 * @brief Network description files (TOML).
 *
 * Format:
 *   [network]
 *   name = "resnet_block"
 *
 *   [[layers]]
 *   name = "conv1"
 *   type = "conv"            # conv | fc | pool | eltwise | local_region
 *   nifm = 3
 *   nofm = 64
 *   size = 56                # output height and width
 *   filter = 3
 *   stride = 1
 *   prevs = ["__INPUT__"]    # optional, defaults to the previous layer
 */

#pragma once

#include "core/result.hpp"
#include "model/network.hpp"

#include <filesystem>
#include <string_view>

namespace pipeseg {

/**
 * @brief Load a network description from a TOML file.
 */
Result<Network> load_network(const std::filesystem::path& path);

/**
 * @brief Parse a network description from TOML text.
 */
Result<Network> parse_network(std::string_view toml_text);

}  // namespace pipeseg
