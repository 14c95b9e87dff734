/**
 * @file inter_layer_pipeline.hpp
 * @brief Inter-layer pipeline: turns a network into candidate segments.
 *
 * Owns the scheduling DAG of a network and produces, on demand, every
 * pipeline segment that is structurally worth evaluating for a resource:
 *   1. each layer alone, occupying the whole resource;
 *   2. for each vertex segment from SegmentEnumerator, a spatial candidate
 *      (one stage per vertex) and/or a temporal candidate (all layers in one
 *      stage), depending on SegmentOptions.
 * Duplicate layouts are dropped and the rest are filtered by a validator.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "model/network.hpp"
#include "model/resource.hpp"
#include "pipeline/pipeline_segment.hpp"
#include "pipeline/scheduling_dag.hpp"
#include "pipeline/segment_enumerator.hpp"
#include "pipeline/segment_validator.hpp"

#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace pipeseg {

/**
 * @brief Counters for one segment generation pass.
 */
struct SegmentStreamStats {
    size_t vertex_segments = 0;     ///< vsegs produced by the enumerator
    size_t candidates = 0;          ///< layouts materialized, singletons included
    size_t duplicates = 0;          ///< layouts dropped as already produced
    size_t rejected = 0;            ///< layouts the validator refused
    size_t yielded = 0;             ///< segments handed to the caller

    auto operator<=>(const SegmentStreamStats&) const = default;
};

/**
 * @brief Lazy, finite sequence of accepted pipeline segments.
 *
 * Shares ownership of the network and DAG, so it stays usable if the
 * pipeline that created it goes away. The validator is borrowed and must
 * outlive the stream. next() throws InvariantViolation on internal
 * inconsistencies (see SegmentEnumerator) or when the validator rejects a
 * single-layer segment.
 */
class SegmentStream {
public:
    class iterator {
    public:
        using value_type = PipelineSegment;
        using difference_type = std::ptrdiff_t;

        iterator() = default;
        explicit iterator(SegmentStream* stream) : stream_(stream) { advance(); }

        const PipelineSegment& operator*() const { return *current_; }
        const PipelineSegment* operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        bool operator==(std::default_sentinel_t) const noexcept { return !current_.has_value(); }

    private:
        void advance() { current_ = stream_->next(); }

        SegmentStream* stream_ = nullptr;
        std::optional<PipelineSegment> current_;
    };

    /// Next accepted segment, or nullopt when the pass is complete.
    [[nodiscard]] std::optional<PipelineSegment> next();

    [[nodiscard]] iterator begin() { return iterator(this); }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    [[nodiscard]] const SegmentStreamStats& stats() const noexcept { return stats_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    friend class InterLayerPipeline;

    SegmentStream(std::shared_ptr<const Network> network,
                  std::shared_ptr<const SchedulingDAG> dag,
                  SegmentContext context,
                  SegmentOptions options,
                  ISegmentValidator& validator,
                  Logger logger);

    /// Materialize the enabled candidates of one vseg into pending_.
    void materialize(const VertexSegment& vseg);
    void enqueue(SegmentLayout layout);
    void finish();

    std::shared_ptr<const Network> network_;
    std::shared_ptr<const SchedulingDAG> dag_;
    SegmentContext context_;
    SegmentOptions options_;
    ISegmentValidator* validator_;
    Logger logger_;

    size_t next_layer_ = 0;
    SegmentEnumerator enumerator_;
    std::deque<SegmentLayout> pending_;
    std::set<SegmentLayout> seen_;
    SegmentStreamStats stats_;
    bool finished_ = false;
};

/**
 * @brief Inter-layer pipeline for one network, batch size and resource.
 */
class InterLayerPipeline {
public:
    static constexpr double kDefaultMaxUtilDrop = 0.05;

    /**
     * @brief Validate the arguments and build the scheduling DAG.
     *
     * Errors: ErrorCode::InvalidConfig for a null or empty network, a zero
     * batch size, an invalid resource or max_util_drop outside [0, 1];
     * ErrorCode::InvalidGraph when the layers do not form a DAG.
     */
    static Result<InterLayerPipeline> create(std::shared_ptr<const Network> network,
                                             uint32_t batch_size,
                                             Resource resource,
                                             double max_util_drop = kDefaultMaxUtilDrop,
                                             Logger logger = null_logger());

    // ── Queries ───────────────────────────────
    [[nodiscard]] const Network& network() const noexcept { return *network_; }
    [[nodiscard]] const SchedulingDAG& dag() const noexcept { return *dag_; }
    [[nodiscard]] uint32_t batch_size() const noexcept { return context_.batch_size; }
    [[nodiscard]] const Resource& resource() const noexcept { return context_.resource; }
    [[nodiscard]] double max_util_drop() const noexcept { return context_.max_util_drop; }

    /// Every layer once, in scheduling order.
    [[nodiscard]] std::vector<LayerName> ordered_layer_list() const;

    // ── Enumeration ───────────────────────────

    /// Raw vseg enumeration over the whole DAG. Valid while this pipeline lives.
    [[nodiscard]] SegmentEnumerator vertex_segments() const;

    /// Start an independent segment generation pass.
    [[nodiscard]] SegmentStream generate_segments(SegmentOptions options,
                                                  ISegmentValidator& validator) const;

private:
    InterLayerPipeline(std::shared_ptr<const Network> network,
                       std::shared_ptr<const SchedulingDAG> dag,
                       SegmentContext context,
                       Logger logger);

    std::shared_ptr<const Network> network_;
    std::shared_ptr<const SchedulingDAG> dag_;
    SegmentContext context_;
    Logger logger_;
};

}  // namespace pipeseg
