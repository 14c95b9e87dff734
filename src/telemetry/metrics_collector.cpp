/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <sstream>

namespace pipeseg {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_dag_summary(const Network& network, const SchedulingDAG& dag) {
    size_t merged = 0;
    size_t widest = 0;
    for (const auto& vertex : dag.vertices()) {
        if (vertex.size() > 1) ++merged;
        widest = std::max(widest, vertex.size());
    }

    std::ostringstream oss;
    oss << R"({"event":"dag_summary")"
        << R"(,"network":")" << escape_json(network.name()) << "\""
        << R"(,"layers":)" << network.size()
        << R"(,"vertices":)" << dag.vertex_count()
        << R"(,"merged_vertices":)" << merged
        << R"(,"max_vertex_layers":)" << widest
        << R"(,"first_layers":)" << network.first_layers().size()
        << R"(,"last_layers":)" << network.last_layers().size()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_segment(const PipelineSegment& segment) {
    std::ostringstream oss;
    oss << R"({"event":"segment")"
        << R"(,"stages":[)";
    for (size_t s = 0; s < segment.layout().size(); ++s) {
        if (s > 0) oss << ",";
        oss << "[";
        const auto& stage = segment.layout()[s];
        for (size_t l = 0; l < stage.size(); ++l) {
            if (l > 0) oss << ",";
            oss << "\"" << escape_json(stage[l]) << "\"";
        }
        oss << "]";
    }
    oss << "]"
        << R"(,"layers":)" << segment.layer_count()
        << R"(,"valid":)" << (segment.valid() ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_stream_stats(const SegmentStreamStats& stats,
                                           std::chrono::microseconds elapsed) {
    std::ostringstream oss;
    oss << R"({"event":"segment_stream")"
        << R"(,"vertex_segments":)" << stats.vertex_segments
        << R"(,"candidates":)" << stats.candidates
        << R"(,"duplicates":)" << stats.duplicates
        << R"(,"rejected":)" << stats.rejected
        << R"(,"yielded":)" << stats.yielded
        << R"(,"duration_us":)" << elapsed.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << escape_json(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace pipeseg
