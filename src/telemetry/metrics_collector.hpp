/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "model/network.hpp"
#include "pipeline/inter_layer_pipeline.hpp"
#include "pipeline/pipeline_segment.hpp"
#include "pipeline/scheduling_dag.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace pipeseg {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * One object per line, always with an "event" field.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_dag_summary(const Network& network, const SchedulingDAG& dag);
    void record_segment(const PipelineSegment& segment);
    void record_stream_stats(const SegmentStreamStats& stats,
                             std::chrono::microseconds elapsed);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace pipeseg
