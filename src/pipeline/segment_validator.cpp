/**
 * @file segment_validator.cpp
 * @brief Stock segment validators.
 */

#include "pipeline/segment_validator.hpp"

namespace pipeseg {

// ── NodeBudgetValidator ──────────────────────

bool NodeBudgetValidator::accepts(const SegmentLayout& layout, const SegmentContext& context) {
    if (layout.empty()) return false;

    // Each spatial stage occupies at least one processing node.
    if (layout.size() > context.resource.proc_region.size()) {
        return false;
    }

    if (max_layers_ > 0) {
        size_t layers = 0;
        for (const auto& stage : layout) {
            layers += stage.size();
        }
        if (layers > max_layers_) return false;
    }

    return true;
}

}  // namespace pipeseg
