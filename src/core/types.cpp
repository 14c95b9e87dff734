/**
 * @file types.cpp
 * @brief Formatting helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

namespace pipeseg {

std::string to_string(const SegmentLayout& layout) {
    std::string out = "[";
    for (size_t s = 0; s < layout.size(); ++s) {
        if (s > 0) out += " |";
        for (size_t l = 0; l < layout[s].size(); ++l) {
            if (s > 0 || l > 0) out += ' ';
            out += layout[s][l];
        }
    }
    out += ']';
    return out;
}

}  // namespace pipeseg
