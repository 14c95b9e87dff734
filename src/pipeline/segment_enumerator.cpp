/**
 * @file segment_enumerator.cpp
 * @brief SegmentEnumerator: explicit-stack form of the recursive search.
 *
 * Recursive form, for reference:
 *
 *   search(start, done):
 *     vseg = ()
 *     for frontier in start..V-1:
 *       if R1 or R2 fails: break
 *       vseg += frontier
 *       if R3 fails: continue
 *       yield vseg
 *       if frontier+1 not explored: search(frontier+1, done ∪ vseg)
 *     mark start explored
 *
 * Each Frame below is one activation of search(); `descend` marks the point
 * right after a yield.
 */

#include "pipeline/segment_enumerator.hpp"

#include "core/result.hpp"

#include <algorithm>
#include <string>

namespace pipeseg {

namespace {

bool contains(const VertexSegment& vseg, VertexIndex v) {
    return std::binary_search(vseg.begin(), vseg.end(), v);
}

}  // anonymous namespace

SegmentEnumerator::SegmentEnumerator(const SchedulingDAG& dag)
    : dag_(&dag)
    , vertex_count_(static_cast<VertexIndex>(dag.vertex_count()))
    , explored_(dag.vertex_count() + 1, false) {
    // The network input is always resident.
    stack_.push_back(Frame{.start = 0, .frontier = 0, .vseg = {}, .done = {kInputVertex}});
}

std::optional<VertexSegment> SegmentEnumerator::next() {
    while (!stack_.empty()) {
        Frame& frame = stack_.back();

        if (frame.descend) {
            frame.descend = false;
            VertexIndex child = frame.frontier + 1;
            ++frame.frontier;

            if (!explored_[static_cast<size_t>(child)]) {
                VertexSet done = frame.done;
                done.insert(frame.vseg.begin(), frame.vseg.end());
                stack_.push_back(Frame{.start = child, .frontier = child, .vseg = {},
                                       .done = std::move(done)});
            }
            continue;
        }

        if (frame.frontier < vertex_count_ && try_extend(frame)) {
            if (consumers_closed(frame.vseg, frame.frontier)) {
                frame.descend = true;
                ++produced_;
                return frame.vseg;
            }
            // Some consumers are still missing; force in the next vertex.
            ++frame.frontier;
            continue;
        }

        mark_explored(frame.start);
        stack_.pop_back();
    }

    return std::nullopt;
}

bool SegmentEnumerator::try_extend(Frame& frame) const {
    const VertexIndex frontier = frame.frontier;
    if (frame.done.contains(frontier)) {
        throw InvariantViolation("Vertex " + std::to_string(frontier)
                                 + " is both resident and a segment frontier");
    }

    const auto& frontier_prevs = dag_->prevs(frontier);

    if (!frame.vseg.empty()) {
        // R1: share a dependency with the segment.
        bool share_deps = std::any_of(
            frontier_prevs.begin(), frontier_prevs.end(), [&](VertexIndex p) {
                if (contains(frame.vseg, p)) return true;
                return std::any_of(frame.vseg.begin(), frame.vseg.end(),
                                   [&](VertexIndex member) {
                                       return dag_->prevs(member).contains(p);
                                   });
            });
        if (!share_deps) return false;

        // R2: no coupled producers inside the segment.
        bool coupled_prevs = frontier_prevs.size() > 1
            && std::any_of(frontier_prevs.begin(), frontier_prevs.end(),
                           [&](VertexIndex p) { return contains(frame.vseg, p); });
        if (coupled_prevs) return false;
    }

    frame.vseg.push_back(frontier);
    return true;
}

bool SegmentEnumerator::consumers_closed(const VertexSegment& vseg, VertexIndex frontier) const {
    for (VertexIndex member : vseg) {
        const auto& nexts = dag_->nexts(member);
        auto inside = static_cast<size_t>(std::count_if(
            nexts.begin(), nexts.end(), [&](VertexIndex n) { return contains(vseg, n); }));

        if (inside == 0 || inside == nexts.size()) continue;

        // nexts is ordered, so the first outsider is the smallest.
        auto missing = *std::find_if(nexts.begin(), nexts.end(),
                                     [&](VertexIndex n) { return !contains(vseg, n); });
        if (missing <= frontier) {
            throw InvariantViolation("Consumer " + std::to_string(missing) + " of vertex "
                                     + std::to_string(member) + " precedes frontier "
                                     + std::to_string(frontier)
                                     + "; vertex order is not topological");
        }
        return false;
    }
    return true;
}

void SegmentEnumerator::mark_explored(VertexIndex start) {
    auto slot = static_cast<size_t>(start);
    if (explored_[slot]) {
        throw InvariantViolation("Start vertex " + std::to_string(start) + " searched twice");
    }
    explored_[slot] = true;
}

}  // namespace pipeseg
