#include "habitat_seg/pipeline/segmentation_context.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/inference/onnx_adapter.hpp"
#include "habitat_seg/inference/preprocess.hpp"

namespace habitat_seg::pipeline {

SegmentationContext SegmentationContext::create(const config::Config& cfg,
                                                const model::ModelConfig& model) {
    cfg.validate();
    model.validate();
    model.verify_checksum();

    inference::OnnxAdapterOptions opts;
    opts.input_channels = model.input_channels;
    opts.num_classes = model.num_classes;
    opts.preprocess = model.preprocess_params();
    opts.activation = model.activation_kind();
    opts.execution_provider = cfg.runtime.execution_provider;
    opts.device_id = cfg.runtime.device_id;
    opts.intra_op_threads = cfg.runtime.intra_op_threads;

    auto adapter = std::make_unique<inference::OnnxInferenceAdapter>(model.model_path, opts);
    return with_adapter(cfg, model, std::move(adapter));
}

SegmentationContext SegmentationContext::with_adapter(
        const config::Config& cfg, const model::ModelConfig& model,
        std::unique_ptr<inference::InferenceAdapter> adapter) {
    if (!adapter) {
        throw ConfigError("no inference adapter");
    }
    cfg.validate();

    const int k = adapter->num_classes();
    if (k < 1) {
        throw ValidationError("model.num_classes must be >= 1, adapter reports " + std::to_string(k));
    }
    if (k > 256) {
        throw ValidationError("at most 256 classes fit a uint8 label raster, got " + std::to_string(k));
    }
    if (!cfg.processing.band_order.empty() &&
        static_cast<int>(cfg.processing.band_order.size()) != adapter->input_channels()) {
        throw ValidationError("processing.band_order has " +
                              std::to_string(cfg.processing.band_order.size()) +
                              " entries, model expects " + std::to_string(adapter->input_channels()));
    }

    SegmentationContext ctx;
    ctx.config = cfg;
    ctx.model = model;
    ctx.decoder = tiling::make_label_decoder(model.decoder, model.binary_threshold, model.presence_channels);

    // One output channel carries p(class 1): argmax over it would always
    // pick 0, so decide on the channel itself at the activation's midpoint
    if (ctx.decoder->name() == "argmax" && k == 1) {
        const auto activation = model.activation_kind();
        if (activation == inference::Activation::SOFTMAX) {
            throw ValidationError("softmax over a single output channel is constant; use sigmoid or none");
        }
        ctx.decoder = std::make_unique<tiling::BinaryDecoder>(
            activation == inference::Activation::SIGMOID ? 0.5f : 0.0f);
    }

    if (ctx.decoder->name() == "legacy_presence_species" && k <= model.presence_channels) {
        throw ValidationError("legacy_presence_species needs more than " +
                              std::to_string(model.presence_channels) + " output channels, model has " +
                              std::to_string(k));
    }

    ctx.adapter = std::move(adapter);
    return ctx;
}

} // namespace habitat_seg::pipeline
