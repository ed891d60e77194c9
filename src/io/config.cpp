#include "habitat_seg/config/configuration.hpp"
#include "habitat_seg/core/errors.hpp"

#include <fstream>
#include <sstream>

namespace habitat_seg::config {

static bool is_odd_or_zero(int v) {
    return v == 0 || (v % 2) != 0;
}

static void read_int_list(const YAML::Node& n, std::vector<int>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& it : n) {
            out.push_back(it.as<int>());
        }
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["processing"]) {
            auto p = node["processing"];
            if (p["crop_size"]) cfg.processing.crop_size = p["crop_size"].as<int>();
            if (p["stride"]) cfg.processing.stride = p["stride"].as<int>();
            if (p["batch_size"]) cfg.processing.batch_size = p["batch_size"].as<int>();
            read_int_list(p["band_order"], cfg.processing.band_order);
            if (p["fill_value"]) cfg.processing.fill_value = p["fill_value"].as<float>();
            if (p["window_function"]) cfg.processing.window_function = p["window_function"].as<std::string>();
            if (p["edge_aware_window"]) cfg.processing.edge_aware_window = p["edge_aware_window"].as<bool>();
            if (p["skip_uniform_tiles"]) cfg.processing.skip_uniform_tiles = p["skip_uniform_tiles"].as<bool>();
        }

        if (node["postprocess"]) {
            auto pp = node["postprocess"];
            if (pp["blur_kernel_size"]) cfg.postprocess.blur_kernel_size = pp["blur_kernel_size"].as<int>();
            if (pp["morph_kernel_size"]) cfg.postprocess.morph_kernel_size = pp["morph_kernel_size"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["nodata_value"]) cfg.output.nodata_value = o["nodata_value"].as<int>();
            if (o["write_manifest"]) cfg.output.write_manifest = o["write_manifest"].as<bool>();
            if (o["remove_on_failure"]) cfg.output.remove_on_failure = o["remove_on_failure"].as<bool>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["execution_provider"]) cfg.runtime.execution_provider = r["execution_provider"].as<std::string>();
            if (r["device_id"]) cfg.runtime.device_id = r["device_id"].as<int>();
            if (r["intra_op_threads"]) cfg.runtime.intra_op_threads = r["intra_op_threads"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["processing"]["crop_size"] = processing.crop_size;
    node["processing"]["stride"] = processing.stride;
    node["processing"]["batch_size"] = processing.batch_size;
    node["processing"]["band_order"] = YAML::Node(YAML::NodeType::Sequence);
    for (int b : processing.band_order) {
        node["processing"]["band_order"].push_back(b);
    }
    node["processing"]["fill_value"] = processing.fill_value;
    node["processing"]["window_function"] = processing.window_function;
    node["processing"]["edge_aware_window"] = processing.edge_aware_window;
    node["processing"]["skip_uniform_tiles"] = processing.skip_uniform_tiles;

    node["postprocess"]["blur_kernel_size"] = postprocess.blur_kernel_size;
    node["postprocess"]["morph_kernel_size"] = postprocess.morph_kernel_size;

    node["output"]["nodata_value"] = output.nodata_value;
    node["output"]["write_manifest"] = output.write_manifest;
    node["output"]["remove_on_failure"] = output.remove_on_failure;

    node["runtime"]["execution_provider"] = runtime.execution_provider;
    node["runtime"]["device_id"] = runtime.device_id;
    node["runtime"]["intra_op_threads"] = runtime.intra_op_threads;

    return node;
}

void Config::validate() const {
    if (processing.crop_size <= 0 || (processing.crop_size % 2) != 0) {
        throw ValidationError("processing.crop_size must be a positive even integer");
    }
    if (processing.stride < 0 || processing.stride > processing.crop_size) {
        throw ValidationError("processing.stride must be in [1, crop_size] (0 = crop_size / 2)");
    }
    if (processing.batch_size < 1) {
        throw ValidationError("processing.batch_size must be >= 1");
    }
    for (int b : processing.band_order) {
        if (b < 1) {
            throw ValidationError("processing.band_order entries must be >= 1 (bands are 1-based)");
        }
    }
    const auto& wf = processing.window_function;
    if (wf != "bartlett_hann" && wf != "hann" && wf != "triangular" && wf != "blackman") {
        throw ValidationError("processing.window_function must be one of bartlett_hann, hann, triangular, blackman");
    }

    if (postprocess.blur_kernel_size < 0 || !is_odd_or_zero(postprocess.blur_kernel_size)) {
        throw ValidationError("postprocess.blur_kernel_size must be odd or 0");
    }
    if (postprocess.morph_kernel_size < 0 || !is_odd_or_zero(postprocess.morph_kernel_size)) {
        throw ValidationError("postprocess.morph_kernel_size must be odd or 0");
    }

    if (output.nodata_value < 0 || output.nodata_value > 255) {
        throw ValidationError("output.nodata_value must be in [0,255]");
    }

    if (runtime.execution_provider != "cpu" && runtime.execution_provider != "cuda") {
        throw ValidationError("runtime.execution_provider must be 'cpu' or 'cuda'");
    }
    if (runtime.device_id < 0) {
        throw ValidationError("runtime.device_id must be >= 0");
    }
    if (runtime.intra_op_threads < 0) {
        throw ValidationError("runtime.intra_op_threads must be >= 0");
    }
}

} // namespace habitat_seg::config
