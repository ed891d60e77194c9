#pragma once

#include "habitat_seg/inference/preprocess.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace habitat_seg::model {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Describes one revision of a segmentation model: where the ONNX file is,
// how to prepare inputs for it and how to turn its outputs into labels.
struct ModelConfig {
    std::string name;
    std::string revision;          // date based, e.g. "20250626"
    std::string description;
    fs::path model_path;           // absolute after load()
    std::string sha256;            // optional, hex

    int input_channels = 3;
    int num_classes = 0;           // 0 = from the model's output shape
    std::string activation = "none";        // none | sigmoid | softmax
    std::string normalization = "standard"; // see inference::Normalization
    std::vector<float> mean{0.485f, 0.456f, 0.406f};
    std::vector<float> stddev{0.229f, 0.224f, 0.225f}; // JSON key "std"
    std::optional<float> max_pixel_value;   // nullopt = "auto"
    int default_output_value = 0;  // label of uniform tiles

    std::string decoder = "argmax"; // argmax | binary | legacy_presence_species
    float binary_threshold = 0.0f;
    int presence_channels = 1;

    fs::path source_path;          // JSON file this was read from

    // `base_dir` resolves a relative model_path.
    static ModelConfig from_json(const json& j, const fs::path& base_dir = {});
    static ModelConfig load(const fs::path& path);

    json to_json() const;

    // Throws ValidationError naming the offending key.
    void validate() const;

    // Throws ValidationError when sha256 is set and the file does not match.
    void verify_checksum() const;

    inference::PreprocessParams preprocess_params() const;
    inference::Activation activation_kind() const;

    std::string id() const { return name + "@" + revision; }
};

} // namespace habitat_seg::model
