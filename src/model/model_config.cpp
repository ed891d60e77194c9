#include "habitat_seg/model/model_config.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/utils.hpp"
#include "habitat_seg/tiling/label_decoder.hpp"

namespace habitat_seg::model {

namespace {

std::vector<float> read_float_list(const json& j, const char* key) {
    if (!j.is_array()) {
        throw ConfigError(std::string(key) + " must be a list of numbers");
    }
    std::vector<float> out;
    for (const auto& v : j) {
        out.push_back(v.get<float>());
    }
    return out;
}

} // namespace

ModelConfig ModelConfig::from_json(const json& j, const fs::path& base_dir) {
    if (!j.is_object()) {
        throw ConfigError("model config must be a JSON object");
    }

    ModelConfig cfg;
    try {
        cfg.name = j.at("name").get<std::string>();
        cfg.revision = j.at("revision").get<std::string>();
        cfg.description = j.value("description", std::string());

        std::string model_file;
        if (j.contains("model_path")) {
            model_file = j["model_path"].get<std::string>();
        } else if (j.contains("model_filename")) {
            model_file = j["model_filename"].get<std::string>();
        } else {
            throw ConfigError("model config '" + cfg.name + "' has no model_path");
        }
        fs::path p(model_file);
        if (p.is_relative() && !base_dir.empty()) {
            p = base_dir / p;
        }
        cfg.model_path = p.lexically_normal();

        cfg.sha256 = core::to_lower(j.value("sha256", std::string()));
        cfg.input_channels = j.value("input_channels", cfg.input_channels);
        cfg.num_classes = j.value("num_classes", cfg.num_classes);

        if (j.contains("activation") && !j["activation"].is_null()) {
            cfg.activation = j["activation"].get<std::string>();
        }
        if (j.contains("normalization")) {
            cfg.normalization = j["normalization"].is_null() ? "none" : j["normalization"].get<std::string>();
        }
        if (j.contains("mean") && !j["mean"].is_null()) cfg.mean = read_float_list(j["mean"], "mean");
        if (j.contains("std") && !j["std"].is_null()) cfg.stddev = read_float_list(j["std"], "std");

        if (j.contains("max_pixel_value")) {
            const auto& m = j["max_pixel_value"];
            if (m.is_string()) {
                if (core::to_lower(m.get<std::string>()) != "auto") {
                    throw ConfigError("max_pixel_value must be a number or \"auto\"");
                }
                cfg.max_pixel_value.reset();
            } else if (!m.is_null()) {
                cfg.max_pixel_value = m.get<float>();
            }
        }

        cfg.default_output_value = j.value("default_output_value", cfg.default_output_value);
        cfg.decoder = j.value("decoder", cfg.decoder);
        cfg.binary_threshold = j.value("binary_threshold", cfg.binary_threshold);
        cfg.presence_channels = j.value("presence_channels", cfg.presence_channels);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Malformed model config: ") + e.what());
    }

    return cfg;
}

ModelConfig ModelConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Model config not found: " + path.string());
    }
    json j;
    try {
        j = json::parse(core::read_text(path));
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    ModelConfig cfg = from_json(j, path.parent_path());
    cfg.source_path = path;
    return cfg;
}

json ModelConfig::to_json() const {
    json j;
    j["name"] = name;
    j["revision"] = revision;
    j["description"] = description;
    j["model_path"] = model_path.string();
    if (!sha256.empty()) j["sha256"] = sha256;
    j["input_channels"] = input_channels;
    if (num_classes > 0) j["num_classes"] = num_classes;
    j["activation"] = activation;
    j["normalization"] = normalization;
    j["mean"] = mean;
    j["std"] = stddev;
    if (max_pixel_value.has_value()) {
        j["max_pixel_value"] = *max_pixel_value;
    } else {
        j["max_pixel_value"] = "auto";
    }
    j["default_output_value"] = default_output_value;
    j["decoder"] = decoder;
    j["binary_threshold"] = binary_threshold;
    j["presence_channels"] = presence_channels;
    return j;
}

void ModelConfig::validate() const {
    if (name.empty()) {
        throw ValidationError("model.name must not be empty");
    }
    if (revision.empty()) {
        throw ValidationError("model.revision must not be empty (" + name + ")");
    }
    if (input_channels < 1) {
        throw ValidationError("model.input_channels must be >= 1");
    }
    if (num_classes < 0) {
        throw ValidationError("model.num_classes must be >= 0");
    }
    if (default_output_value < 0 || default_output_value > 255) {
        throw ValidationError("model.default_output_value must be in [0, 255]");
    }
    if (max_pixel_value.has_value() && !(*max_pixel_value > 0.0f)) {
        throw ValidationError("model.max_pixel_value must be > 0");
    }

    try {
        const auto norm = inference::normalization_from_string(normalization);
        if (norm == inference::Normalization::STANDARD) {
            if (mean.size() != static_cast<size_t>(input_channels) ||
                stddev.size() != static_cast<size_t>(input_channels)) {
                throw ValidationError("model.mean/model.std need " + std::to_string(input_channels) +
                                      " values for standard normalization");
            }
            for (float s : stddev) {
                if (s == 0.0f) throw ValidationError("model.std values must be non-zero");
            }
        }
        activation_kind();
        tiling::make_label_decoder(decoder, binary_threshold, presence_channels);
    } catch (const ConfigError& e) {
        throw ValidationError(std::string("model: ") + e.what());
    }

    // A single presence channel is thresholded at 0, which only holds for raw logits
    if (core::to_lower(core::trim(decoder)) == "legacy_presence_species" && presence_channels == 1 &&
        activation_kind() != inference::Activation::NONE) {
        throw ValidationError("model.activation must be none for legacy_presence_species with "
                              "presence_channels 1, got " + activation);
    }
}

void ModelConfig::verify_checksum() const {
    if (sha256.empty()) return;
    const std::string actual = core::sha256_file(model_path);
    if (actual != sha256) {
        throw ValidationError("checksum mismatch for " + model_path.string() + ": expected " + sha256 +
                              ", got " + actual);
    }
}

inference::PreprocessParams ModelConfig::preprocess_params() const {
    inference::PreprocessParams params;
    params.max_pixel_value = max_pixel_value;
    params.normalization = inference::normalization_from_string(normalization);
    params.mean = mean;
    params.stddev = stddev;
    return params;
}

inference::Activation ModelConfig::activation_kind() const {
    return inference::activation_from_string(activation);
}

} // namespace habitat_seg::model
