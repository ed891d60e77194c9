#pragma once

#include "habitat_seg/inference/inference_adapter.hpp"
#include "habitat_seg/inference/preprocess.hpp"

#include <onnxruntime_cxx_api.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace habitat_seg::inference {

namespace fs = std::filesystem;

struct OnnxAdapterOptions {
    int input_channels = 3;
    int num_classes = 0;                    // 0 = read from the output shape
    PreprocessParams preprocess;
    Activation activation = Activation::NONE;
    std::string execution_provider = "cpu"; // cpu | cuda
    int device_id = 0;
    int intra_op_threads = 0;
};

// ONNX Runtime session over an NCHW float32 model. The first input and
// first output are used; output shape is [N, K, H, W] or [N, H, W] (K = 1).
class OnnxInferenceAdapter : public InferenceAdapter {
public:
    OnnxInferenceAdapter(const fs::path& model_path, const OnnxAdapterOptions& options);

    int num_classes() const override { return num_classes_; }
    int input_channels() const override { return options_.input_channels; }
    std::optional<int> preferred_tile_size() const override { return preferred_tile_size_; }

    void prepare(const ImageInfo& info) override;
    std::vector<Planes> infer(const std::vector<Planes>& batch) override;

    std::string name() const override { return "onnxruntime"; }
    const std::string& execution_provider() const { return active_provider_; }

private:
    void initialize_session(const fs::path& model_path);
    std::vector<Planes> run_chunk(const std::vector<Planes>& chunk);

    OnnxAdapterOptions options_;
    PixelType pixel_type_ = PixelType::UINT8;

    Ort::Env env_;
    Ort::SessionOptions session_options_;
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo memory_info_;

    std::string input_name_;
    std::string output_name_;
    std::string active_provider_ = "cpu";

    int num_classes_ = 0;
    int64_t fixed_batch_ = 0; // > 0 when the model's batch dimension is static
    std::optional<int> preferred_tile_size_;
};

} // namespace habitat_seg::inference
