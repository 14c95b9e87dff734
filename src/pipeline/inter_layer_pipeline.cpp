/**
 * @file inter_layer_pipeline.cpp
 * @brief InterLayerPipeline construction and the segment stream.
 */

#include "pipeline/inter_layer_pipeline.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace pipeseg {

// ─────────────────────────────────────────────
// InterLayerPipeline
// ─────────────────────────────────────────────

Result<InterLayerPipeline> InterLayerPipeline::create(std::shared_ptr<const Network> network,
                                                      uint32_t batch_size,
                                                      Resource resource,
                                                      double max_util_drop,
                                                      Logger logger) {
    auto reject = [&logger](std::string message) {
        logger.error("Pipeline rejected: " + message);
        return make_error<InterLayerPipeline>(ErrorCode::InvalidConfig, std::move(message));
    };

    if (!network) {
        return reject("network is null");
    }
    if (network->empty()) {
        return reject("network '" + network->name() + "' has no layers");
    }
    if (batch_size == 0) {
        return reject("batch size must be positive");
    }
    if (!resource.is_valid()) {
        return reject("resource has a zero or negative dimension");
    }
    // NaN fails both comparisons, so test the accepted range positively.
    if (!(max_util_drop >= 0.0 && max_util_drop <= 1.0)) {
        return reject("max_util_drop must be within [0, 1], got "
                      + std::to_string(max_util_drop));
    }

    Logger dag_logger = logger.child("dag");
    auto dag = SchedulingDAG::build(*network, &dag_logger);
    if (!dag) {
        logger.error("Scheduling DAG for '" + network->name() + "' failed: "
                     + dag.error().message);
        return dag.error();
    }

    SegmentContext context{
        .network = network.get(),
        .batch_size = batch_size,
        .resource = resource,
        .max_util_drop = max_util_drop,
    };

    logger.info("Pipeline ready for '" + network->name() + "': "
                + std::to_string(network->size()) + " layers, "
                + std::to_string(dag->vertex_count()) + " vertices, batch "
                + std::to_string(batch_size));

    return InterLayerPipeline(std::move(network),
                              std::make_shared<const SchedulingDAG>(std::move(*dag)),
                              context, std::move(logger));
}

InterLayerPipeline::InterLayerPipeline(std::shared_ptr<const Network> network,
                                       std::shared_ptr<const SchedulingDAG> dag,
                                       SegmentContext context,
                                       Logger logger)
    : network_(std::move(network))
    , dag_(std::move(dag))
    , context_(context)
    , logger_(std::move(logger)) {}

std::vector<LayerName> InterLayerPipeline::ordered_layer_list() const {
    return dag_->ordered_layers();
}

SegmentEnumerator InterLayerPipeline::vertex_segments() const {
    return SegmentEnumerator(*dag_);
}

SegmentStream InterLayerPipeline::generate_segments(SegmentOptions options,
                                                    ISegmentValidator& validator) const {
    logger_.child("segments").debug(
        "Generating segments with validator " + std::string(validator.name())
        + (options.partition_interlayer ? ", spatial" : "")
        + (options.hw_gbuf_save_writeback ? ", temporal" : ""));
    return SegmentStream(network_, dag_, context_, options, validator,
                         logger_.child("segments"));
}

// ─────────────────────────────────────────────
// SegmentStream
// ─────────────────────────────────────────────

SegmentStream::SegmentStream(std::shared_ptr<const Network> network,
                             std::shared_ptr<const SchedulingDAG> dag,
                             SegmentContext context,
                             SegmentOptions options,
                             ISegmentValidator& validator,
                             Logger logger)
    : network_(std::move(network))
    , dag_(std::move(dag))
    , context_(context)
    , options_(options)
    , validator_(&validator)
    , logger_(std::move(logger))
    , enumerator_(*dag_) {}

std::optional<PipelineSegment> SegmentStream::next() {
    if (finished_) return std::nullopt;

    // Phase 1: every layer alone, in declaration order.
    const auto& names = network_->layer_names();
    if (next_layer_ < names.size()) {
        const LayerName& name = names[next_layer_++];
        SegmentLayout layout{{name}};
        seen_.insert(layout);
        ++stats_.candidates;

        PipelineSegment segment(std::move(layout), context_, *validator_);
        if (!segment.valid()) {
            throw InvariantViolation("Validator " + std::string(validator_->name())
                                     + " rejected single-layer segment " + name);
        }
        ++stats_.yielded;
        return segment;
    }

    // Phase 2: multi-layer candidates, one vseg at a time.
    const bool any_candidates = options_.partition_interlayer || options_.hw_gbuf_save_writeback;
    while (true) {
        while (!pending_.empty()) {
            SegmentLayout layout = std::move(pending_.front());
            pending_.pop_front();

            PipelineSegment segment(std::move(layout), context_, *validator_);
            if (segment.valid()) {
                ++stats_.yielded;
                return segment;
            }
            ++stats_.rejected;
            if (logger_.enabled(LogLevel::Debug)) {
                logger_.debug("Rejected " + segment.to_string());
            }
        }

        if (!any_candidates) break;

        auto vseg = enumerator_.next();
        if (!vseg) break;
        ++stats_.vertex_segments;
        materialize(*vseg);
    }

    finish();
    return std::nullopt;
}

void SegmentStream::materialize(const VertexSegment& vseg) {
    if (options_.partition_interlayer) {
        // Spatial: each vertex is its own stage on its own nodes.
        SegmentLayout spatial;
        spatial.reserve(vseg.size());
        for (VertexIndex v : vseg) {
            spatial.push_back(dag_->vertex(v));
        }
        enqueue(std::move(spatial));
    }

    if (options_.hw_gbuf_save_writeback) {
        // Temporal: all layers share one stage and time-multiplex the nodes.
        Stage stage;
        for (VertexIndex v : vseg) {
            const auto& layers = dag_->vertex(v);
            stage.insert(stage.end(), layers.begin(), layers.end());
        }
        enqueue(SegmentLayout{std::move(stage)});
    }
}

void SegmentStream::enqueue(SegmentLayout layout) {
    ++stats_.candidates;
    if (!seen_.insert(layout).second) {
        ++stats_.duplicates;
        return;
    }
    pending_.push_back(std::move(layout));
}

void SegmentStream::finish() {
    finished_ = true;
    logger_.info("Segment generation done: "
                 + std::to_string(stats_.yielded) + " yielded, "
                 + std::to_string(stats_.vertex_segments) + " vsegs, "
                 + std::to_string(stats_.candidates) + " candidates, "
                 + std::to_string(stats_.duplicates) + " duplicates, "
                 + std::to_string(stats_.rejected) + " rejected");
}

}  // namespace pipeseg
