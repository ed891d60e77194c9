#include "habitat_seg/inference/onnx_adapter.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/utils.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>

namespace habitat_seg::inference {

namespace {

std::string shape_to_string(const std::vector<int64_t>& shape) {
    std::vector<std::string> parts;
    for (int64_t d : shape) parts.push_back(std::to_string(d));
    return "[" + core::join(parts, ", ") + "]";
}

// Square static size, or nullopt when both spatial dims are dynamic.
std::optional<int> tile_size_from_shape(const std::vector<int64_t>& shape) {
    if (shape.size() < 4) {
        throw InferenceError("model input must be [N, C, H, W], got " + shape_to_string(shape));
    }
    const int64_t h = shape[2];
    const int64_t w = shape[3];
    if (h <= 0 && w <= 0) return std::nullopt;
    if (h > 0 && (w <= 0 || w == h)) return static_cast<int>(h);
    if (w > 0 && h <= 0) return static_cast<int>(w);
    throw InferenceError("model input must be square or dynamic, got " + shape_to_string(shape));
}

} // namespace

OnnxInferenceAdapter::OnnxInferenceAdapter(const fs::path& model_path,
                                           const OnnxAdapterOptions& options)
    : options_(options),
      env_(ORT_LOGGING_LEVEL_WARNING, "habitat_seg"),
      memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
    if (options_.input_channels < 1) {
        throw ConfigError("input_channels must be >= 1");
    }
    if (!fs::exists(model_path)) {
        throw IOError("Model file not found: " + model_path.string());
    }
    try {
        initialize_session(model_path);
    } catch (const Ort::Exception& e) {
        throw InferenceError("cannot load " + model_path.string() + ": " + e.what());
    }
}

void OnnxInferenceAdapter::initialize_session(const fs::path& model_path) {
    session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    if (options_.intra_op_threads > 0) {
        session_options_.SetIntraOpNumThreads(options_.intra_op_threads);
    }

    if (core::to_lower(options_.execution_provider) == "cuda") {
        try {
            OrtCUDAProviderOptions cuda_options;
            cuda_options.device_id = options_.device_id;
            session_options_.AppendExecutionProvider_CUDA(cuda_options);
            active_provider_ = "cuda";
        } catch (const Ort::Exception& e) {
            std::cerr << "[ORT] CUDA execution provider unavailable, falling back to CPU: "
                      << e.what() << std::endl;
            active_provider_ = "cpu";
        }
    }

    session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), session_options_);

    if (session_->GetInputCount() < 1 || session_->GetOutputCount() < 1) {
        throw InferenceError("model has no inputs or outputs: " + model_path.string());
    }

    Ort::AllocatorWithDefaultOptions allocator;
    input_name_ = session_->GetInputNameAllocated(0, allocator).get();
    output_name_ = session_->GetOutputNameAllocated(0, allocator).get();

    const auto input_shape = session_->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    preferred_tile_size_ = tile_size_from_shape(input_shape);
    fixed_batch_ = input_shape[0] > 0 ? input_shape[0] : 0;
    if (input_shape[1] > 0 && input_shape[1] != options_.input_channels) {
        throw InferenceError("model expects " + std::to_string(input_shape[1]) +
                             " input channels, configured " +
                             std::to_string(options_.input_channels));
    }

    const auto output_shape = session_->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (output_shape.size() == 3) {
        num_classes_ = 1;
    } else if (output_shape.size() == 4 && output_shape[1] > 0) {
        num_classes_ = static_cast<int>(output_shape[1]);
    }
    if (options_.num_classes > 0) {
        if (num_classes_ > 0 && num_classes_ != options_.num_classes) {
            throw InferenceError("model outputs " + std::to_string(num_classes_) +
                                 " classes, configured " + std::to_string(options_.num_classes));
        }
        num_classes_ = options_.num_classes;
    }
    if (num_classes_ < 1) {
        throw InferenceError("cannot determine class count from output shape " +
                             shape_to_string(output_shape) + "; set num_classes");
    }
}

void OnnxInferenceAdapter::prepare(const ImageInfo& info) {
    pixel_type_ = info.pixel_type;
    if (!options_.preprocess.max_pixel_value.has_value() &&
        (info.pixel_type == PixelType::FLOAT32 || info.pixel_type == PixelType::FLOAT64)) {
        std::cerr << "[ORT] Warning: float input, pixel values are expected in [0, 1]" << std::endl;
    }
}

std::vector<Planes> OnnxInferenceAdapter::infer(const std::vector<Planes>& batch) {
    std::vector<Planes> results;
    results.reserve(batch.size());

    const size_t chunk = fixed_batch_ > 0 ? static_cast<size_t>(fixed_batch_) : batch.size();
    for (size_t i = 0; i < batch.size(); i += chunk) {
        const size_t end = std::min(batch.size(), i + chunk);
        std::vector<Planes> part(batch.begin() + static_cast<std::ptrdiff_t>(i),
                                 batch.begin() + static_cast<std::ptrdiff_t>(end));
        const size_t real = part.size();
        // Static batch dimension: pad the last chunk, drop the padded results
        while (fixed_batch_ > 0 && part.size() < chunk) {
            part.push_back(part.back());
        }
        auto out = run_chunk(part);
        out.resize(real);
        for (auto& r : out) results.push_back(std::move(r));
    }
    return results;
}

std::vector<Planes> OnnxInferenceAdapter::run_chunk(const std::vector<Planes>& chunk) {
    if (chunk.empty()) return {};

    std::vector<Planes> input = chunk;
    normalize_batch(input, options_.preprocess, pixel_type_);

    const int64_t n = static_cast<int64_t>(input.size());
    const int64_t c = options_.input_channels;
    const int64_t h = input.front().front().rows();
    const int64_t w = input.front().front().cols();
    const size_t plane_size = static_cast<size_t>(h * w);

    std::vector<float> buffer(static_cast<size_t>(n * c) * plane_size);
    for (int64_t b = 0; b < n; ++b) {
        const Planes& tile = input[static_cast<size_t>(b)];
        if (static_cast<int64_t>(tile.size()) != c) {
            throw InferenceError("tile has " + std::to_string(tile.size()) + " bands, model expects " +
                                 std::to_string(c));
        }
        for (int64_t ch = 0; ch < c; ++ch) {
            const Matrix2Df& plane = tile[static_cast<size_t>(ch)];
            if (plane.rows() != h || plane.cols() != w) {
                throw InferenceError("tiles in a batch must share one size");
            }
            std::memcpy(buffer.data() + static_cast<size_t>(b * c + ch) * plane_size, plane.data(),
                        plane_size * sizeof(float));
        }
    }

    const std::vector<int64_t> dims{n, c, h, w};
    std::vector<Ort::Value> outputs;
    try {
        Ort::Value tensor = Ort::Value::CreateTensor<float>(memory_info_, buffer.data(), buffer.size(),
                                                           dims.data(), dims.size());
        const char* input_names[] = {input_name_.c_str()};
        const char* output_names[] = {output_name_.c_str()};
        outputs = session_->Run(Ort::RunOptions{nullptr}, input_names, &tensor, 1, output_names, 1);
    } catch (const Ort::Exception& e) {
        throw InferenceError(std::string("ONNX Runtime run failed: ") + e.what());
    }

    if (outputs.empty()) {
        throw InferenceError("model produced no output");
    }
    const auto out_shape = outputs.front().GetTensorTypeAndShapeInfo().GetShape();
    int64_t k = 1;
    int64_t oh = 0;
    int64_t ow = 0;
    if (out_shape.size() == 4) {
        k = out_shape[1];
        oh = out_shape[2];
        ow = out_shape[3];
    } else if (out_shape.size() == 3) {
        oh = out_shape[1];
        ow = out_shape[2];
    } else {
        throw InferenceError("unexpected output shape " + shape_to_string(out_shape));
    }
    if (out_shape[0] != n || oh != h || ow != w || k != num_classes_) {
        throw InferenceError("output shape " + shape_to_string(out_shape) + " does not match input " +
                             shape_to_string(dims) + " with " + std::to_string(num_classes_) +
                             " classes");
    }

    const float* data = outputs.front().GetTensorData<float>();
    std::vector<Planes> results(static_cast<size_t>(n));
    for (int64_t b = 0; b < n; ++b) {
        Planes& logits = results[static_cast<size_t>(b)];
        logits.reserve(static_cast<size_t>(k));
        for (int64_t ch = 0; ch < k; ++ch) {
            const float* src = data + static_cast<size_t>(b * k + ch) * plane_size;
            logits.emplace_back(Eigen::Map<const Matrix2Df>(src, h, w));
        }
        apply_activation(logits, options_.activation);
    }
    return results;
}

} // namespace habitat_seg::inference
