/**
 * @file segment_validator.hpp
 * @brief Feasibility check applied to every candidate segment.
 *
 * The enumeration core only decides which groupings are structurally worth
 * evaluating; whether one actually fits the hardware is up to a validator.
 */

#pragma once

#include "pipeline/pipeline_segment.hpp"

#include <string_view>

namespace pipeseg {

/**
 * @brief Abstract validator (runtime polymorphism).
 */
class ISegmentValidator {
public:
    virtual ~ISegmentValidator() = default;

    [[nodiscard]] virtual bool accepts(const SegmentLayout& layout,
                                       const SegmentContext& context) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Accepts every candidate.
 */
class AcceptAllValidator : public ISegmentValidator {
public:
    [[nodiscard]] bool accepts(const SegmentLayout& /*layout*/,
                               const SegmentContext& /*context*/) override { return true; }
    [[nodiscard]] std::string_view name() const noexcept override { return "accept_all"; }
};

/**
 * @brief Rejects layouts that cannot get one processing node per stage, or
 *        that exceed a cap on layers per segment (0 = no cap).
 */
class NodeBudgetValidator : public ISegmentValidator {
public:
    explicit NodeBudgetValidator(uint32_t max_layers_per_segment = 0)
        : max_layers_(max_layers_per_segment) {}

    [[nodiscard]] bool accepts(const SegmentLayout& layout,
                               const SegmentContext& context) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "node_budget"; }

private:
    uint32_t max_layers_;
};

}  // namespace pipeseg
