/**
 * @file pipeline_segment.cpp
 * @brief PipelineSegment construction and queries.
 */

#include "pipeline/pipeline_segment.hpp"
#include "pipeline/segment_validator.hpp"

namespace pipeseg {

// ── PipelineSegment ──────────────────────────

PipelineSegment::PipelineSegment(SegmentLayout layout, const SegmentContext& context,
                                 ISegmentValidator& validator)
    : layout_(std::move(layout))
    , context_(context)
    , valid_(validator.accepts(layout_, context_)) {}

size_t PipelineSegment::layer_count() const noexcept {
    size_t count = 0;
    for (const auto& stage : layout_) {
        count += stage.size();
    }
    return count;
}

std::vector<LayerName> PipelineSegment::layers() const {
    std::vector<LayerName> names;
    names.reserve(layer_count());
    for (const auto& stage : layout_) {
        names.insert(names.end(), stage.begin(), stage.end());
    }
    return names;
}

}  // namespace pipeseg
