/**
 * @file pipeline_segment.hpp
 * @brief Candidate pipeline segments and the context they are checked in.
 */

#pragma once

#include "core/types.hpp"
#include "model/network.hpp"
#include "model/resource.hpp"

#include <cstdint>
#include <string>

namespace pipeseg {

/**
 * @brief Everything a validator may look at besides the layout itself.
 *
 * The network is borrowed and must outlive every segment built with it.
 */
struct SegmentContext {
    const Network* network = nullptr;
    uint32_t batch_size = 1;
    Resource resource;
    double max_util_drop = 0.05;
};

class ISegmentValidator;

/**
 * @brief A layout of stages together with its validation verdict.
 */
class PipelineSegment {
public:
    /// Build the segment and ask `validator` whether it is feasible.
    PipelineSegment(SegmentLayout layout, const SegmentContext& context,
                    ISegmentValidator& validator);

    [[nodiscard]] const SegmentLayout& layout() const noexcept { return layout_; }
    [[nodiscard]] const SegmentContext& context() const noexcept { return context_; }
    [[nodiscard]] bool valid() const noexcept { return valid_; }

    [[nodiscard]] size_t stage_count() const noexcept { return layout_.size(); }
    [[nodiscard]] size_t layer_count() const noexcept;

    /// Layer names of all stages, in order.
    [[nodiscard]] std::vector<LayerName> layers() const;

    [[nodiscard]] std::string to_string() const { return pipeseg::to_string(layout_); }

private:
    SegmentLayout layout_;
    SegmentContext context_;
    bool valid_;
};

}  // namespace pipeseg
