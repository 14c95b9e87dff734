/**
 * @file segment_enumerator.hpp
 * @brief Lazy enumeration of vertex segments worth pipelining.
 *
 * A vertex segment (vseg) grows by the next vertex index (the frontier) as
 * long as three rules hold:
 *
 *   R1  A non-empty vseg only takes a frontier that shares a dependency
 *       with it: some predecessor of the frontier is in the vseg or is a
 *       predecessor of a vseg member. Otherwise co-locating them is useless.
 *   R2  A frontier with several predecessors cannot join a vseg holding any
 *       of them; their outputs would not become available together.
 *   R3  For every member with several consumers, either all or none of its
 *       consumers are in the vseg; a subset cannot avoid the write-back.
 *
 * R1/R2 failures end the growth on the current branch. An R3 failure forces
 * the following vertices in until R3 holds again.
 */

#pragma once

#include "core/types.hpp"
#include "pipeline/scheduling_dag.hpp"

#include <optional>
#include <vector>

namespace pipeseg {

/**
 * @brief Pull-based generator over all rule-valid vsegs of a SchedulingDAG.
 *
 * Every vseg is produced before the searches that start right after it.
 * Each start index is searched once per enumerator (the exploration memo);
 * a fresh enumerator starts with a fresh memo. The DAG must outlive the
 * enumerator.
 *
 * next() throws InvariantViolation if the topological order breaks the
 * monotonicity R3 relies on.
 */
class SegmentEnumerator {
public:
    explicit SegmentEnumerator(const SchedulingDAG& dag);

    /// Next vseg, or nullopt when the enumeration is exhausted.
    [[nodiscard]] std::optional<VertexSegment> next();

    [[nodiscard]] size_t produced() const noexcept { return produced_; }
    [[nodiscard]] bool exhausted() const noexcept { return stack_.empty(); }

private:
    struct Frame {
        VertexIndex start;
        VertexIndex frontier;
        VertexSegment vseg;
        VertexSet done;             ///< Vertices already resident before this search
        bool descend = false;       ///< vseg was just produced; search after it next
    };

    /// Apply R1 and R2; append the frontier when both hold.
    bool try_extend(Frame& frame) const;

    /// R3 over the whole vseg.
    [[nodiscard]] bool consumers_closed(const VertexSegment& vseg, VertexIndex frontier) const;

    void mark_explored(VertexIndex start);

    const SchedulingDAG* dag_;
    VertexIndex vertex_count_;
    std::vector<Frame> stack_;
    std::vector<bool> explored_;
    size_t produced_ = 0;
};

}  // namespace pipeseg
