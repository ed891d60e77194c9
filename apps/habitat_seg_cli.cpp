#include "habitat_seg/config/configuration.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/events.hpp"
#include "habitat_seg/core/utils.hpp"
#include "habitat_seg/io/band_writer.hpp"
#include "habitat_seg/io/tile_reader.hpp"
#include "habitat_seg/model/model_registry.hpp"
#include "habitat_seg/pipeline/segmentation_context.hpp"
#include "habitat_seg/pipeline/segmentation_runner.hpp"
#include "habitat_seg/postprocess/label_filter.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace habitat_seg;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_sigint(int) {
    g_stop_requested.store(true);
}

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

struct SegmentOptions {
    std::string config_path;
    std::string model;
    std::string models_dir = "models";
    std::string revision;
    std::string input;
    std::string output;
    std::string events_path;
    std::optional<int> batch_size;
    std::optional<int> crop_size;
    std::optional<int> stride;
    std::string band_order;
    std::optional<int> blur_kernel;
    std::optional<int> morph_kernel;
    std::string provider;
};

model::ModelConfig resolve_model(const std::string& model_arg, const std::string& models_dir,
                                 const std::string& revision) {
    const fs::path as_path(model_arg);
    if (core::ends_with(core::to_lower(model_arg), ".json") && fs::exists(as_path)) {
        return model::ModelConfig::load(as_path);
    }
    const auto registry = model::ModelRegistry::from_config_dir(models_dir);
    if (revision.empty()) {
        return registry.get(model_arg);
    }
    return registry.get(model_arg, revision);
}

config::Config load_config(const std::string& path) {
    if (path.empty()) {
        return config::Config{};
    }
    return config::Config::load(path);
}

std::string config_to_yaml_text(const config::Config& cfg) {
    YAML::Emitter out;
    out << cfg.to_yaml();
    return out.c_str();
}

void remove_partial_output(const fs::path& output) {
    std::error_code ec;
    if (fs::exists(output, ec) && fs::remove(output, ec)) {
        std::cerr << "[FAILED] removed partial output " << output.string() << std::endl;
    } else if (ec) {
        std::cerr << "[FAILED] cannot remove partial output " << output.string() << ": "
                  << ec.message() << std::endl;
    }
}

// ============================================================================
// segment <input> <output> --model <name|json> [options]
// ============================================================================
int cmd_segment(const SegmentOptions& opt) {
    config::Config cfg;
    model::ModelConfig model_cfg;
    try {
        cfg = load_config(opt.config_path);
        if (opt.batch_size) cfg.processing.batch_size = *opt.batch_size;
        if (opt.crop_size) cfg.processing.crop_size = *opt.crop_size;
        if (opt.stride) cfg.processing.stride = *opt.stride;
        if (!opt.band_order.empty()) cfg.processing.band_order = core::parse_int_list(opt.band_order);
        if (opt.blur_kernel) cfg.postprocess.blur_kernel_size = *opt.blur_kernel;
        if (opt.morph_kernel) cfg.postprocess.morph_kernel_size = *opt.morph_kernel;
        if (!opt.provider.empty()) cfg.runtime.execution_provider = core::to_lower(opt.provider);
        cfg.validate();

        model_cfg = resolve_model(opt.model, opt.models_dir, opt.revision);
    } catch (const HabitatSegError& e) {
        std::cerr << "[INIT] " << e.what() << std::endl;
        return 2;
    }

    std::ofstream events_file;
    core::EventEmitter emitter;
    if (!opt.events_path.empty()) {
        events_file.open(opt.events_path, std::ios::out | std::ios::app);
        if (!events_file) {
            std::cerr << "[INIT] Cannot open events file: " << opt.events_path << std::endl;
            return 2;
        }
        emitter.set_stream(&events_file);
    }

    const fs::path output(opt.output);
    const std::string started_at = core::get_iso_timestamp();
    json manifest;
    manifest["input"] = opt.input;
    manifest["output"] = opt.output;
    manifest["model"] = model_cfg.to_json();
    manifest["config_yaml"] = config_to_yaml_text(cfg);
    manifest["started_at"] = started_at;

    int exit_code = 0;
    bool output_opened = false;
    try {
        auto ctx = pipeline::SegmentationContext::create(cfg, model_cfg);
        auto reader = io::open_tile_reader(opt.input);

        std::cout << "[INIT] " << opt.input << ": " << reader->height() << "x" << reader->width()
                  << ", " << reader->num_bands() << " bands, "
                  << pixel_type_to_string(reader->pixel_type()) << std::endl;
        std::cout << "[INIT] model " << model_cfg.id() << " (" << ctx.adapter->num_classes()
                  << " classes)" << std::endl;

        auto sink = io::open_band_writer(output, reader->height(), reader->width());
        output_opened = true;

        std::unique_ptr<postprocess::PostprocessingBandWriter> filtered;
        io::BandWriter* writer = sink.get();
        if (cfg.postprocess.enabled()) {
            filtered = std::make_unique<postprocess::PostprocessingBandWriter>(*sink, cfg.postprocess);
            writer = filtered.get();
        }

        pipeline::SegmentationRunner runner(ctx, &emitter, &std::cout);
        const auto summary = runner.run(*reader, *writer, &g_stop_requested);
        reader->close();

        manifest["status"] = "ok";
        manifest["summary"] = summary.to_json();
    } catch (const StopRequested& e) {
        std::cerr << "[FAILED] " << e.what() << std::endl;
        manifest["status"] = "aborted";
        manifest["error"] = e.what();
        exit_code = 130;
    } catch (const ConfigError& e) {
        std::cerr << "[FAILED] " << e.what() << std::endl;
        manifest["status"] = "error";
        manifest["error"] = e.what();
        exit_code = 2;
    } catch (const ValidationError& e) {
        std::cerr << "[FAILED] " << e.what() << std::endl;
        manifest["status"] = "error";
        manifest["error"] = e.what();
        exit_code = 2;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] " << e.what() << std::endl;
        manifest["status"] = "error";
        manifest["error"] = e.what();
        exit_code = 1;
    }

    if (exit_code != 0 && output_opened && cfg.output.remove_on_failure) {
        remove_partial_output(output);
    }

    if (cfg.output.write_manifest) {
        manifest["finished_at"] = core::get_iso_timestamp();
        const fs::path manifest_path = fs::path(opt.output + ".run.json");
        try {
            core::write_text(manifest_path, manifest.dump(2) + "\n");
        } catch (const IOError& e) {
            std::cerr << "[DONE] " << e.what() << std::endl;
            if (exit_code == 0) exit_code = 1;
        }
    }
    return exit_code;
}

// ============================================================================
// models [--models-dir D]
// ============================================================================
int cmd_models(const std::string& models_dir) {
    try {
        const auto registry = model::ModelRegistry::from_config_dir(models_dir);
        json result = json::array();
        for (const auto& [name, revision] : registry.list_models()) {
            const auto& m = registry.get(name, revision);
            result.push_back({
                {"name", name},
                {"revision", revision},
                {"latest", revision == registry.latest_revision(name)},
                {"description", m.description},
                {"input_channels", m.input_channels}
            });
        }
        print_json(result);
    } catch (const HabitatSegError& e) {
        std::cerr << "models: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

// ============================================================================
// revisions <name> [--models-dir D]
// ============================================================================
int cmd_revisions(const std::string& name, const std::string& models_dir) {
    try {
        const auto registry = model::ModelRegistry::from_config_dir(models_dir);
        json result;
        result["name"] = name;
        result["revisions"] = registry.revisions(name);
        result["latest"] = registry.latest_revision(name);
        print_json(result);
    } catch (const HabitatSegError& e) {
        std::cerr << "revisions: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

// ============================================================================
// validate-config --path <path> [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();
    result["path"] = path;

    try {
        const config::Config cfg = config::Config::load(path);
        cfg.validate();
        if (!cfg.postprocess.enabled()) {
            result["warnings"].push_back("post-processing is disabled");
        }
        result["valid"] = true;
    } catch (const HabitatSegError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"habitat_seg: tiled semantic segmentation of large rasters"};
    app.require_subcommand(1);

    SegmentOptions seg;
    auto segment_cmd = app.add_subcommand("segment", "Segment an image into a label raster");
    segment_cmd->add_option("input", seg.input, "Input raster (FITS, TIFF, PNG)")->required();
    segment_cmd->add_option("output", seg.output, "Output label raster")->required();
    segment_cmd->add_option("--model,-m", seg.model, "Model name or model config JSON")->required();
    segment_cmd->add_option("--config,-c", seg.config_path, "Path to config.yaml");
    segment_cmd->add_option("--models-dir", seg.models_dir, "Directory of model config JSON files")
        ->default_val("models");
    segment_cmd->add_option("--revision,-r", seg.revision, "Model revision (default: latest)");
    segment_cmd->add_option("--batch-size,-b", seg.batch_size, "Tiles per inference batch");
    segment_cmd->add_option("--crop-size,-z", seg.crop_size, "Tile size in pixels (even)");
    segment_cmd->add_option("--stride", seg.stride, "Tile stride (default: crop size / 2)");
    segment_cmd->add_option("--band-order", seg.band_order, "1-based band order, e.g. 3,2,1");
    segment_cmd->add_option("--blur-kernel", seg.blur_kernel, "Median blur kernel (odd or 0)");
    segment_cmd->add_option("--morph-kernel", seg.morph_kernel, "Open/close kernel (odd or 0)");
    segment_cmd->add_option("--provider", seg.provider, "Execution provider: cpu | cuda");
    segment_cmd->add_option("--events", seg.events_path, "Append JSON-line events to this file");

    std::string models_dir = "models";
    auto models_cmd = app.add_subcommand("models", "List registered models");
    models_cmd->add_option("--models-dir", models_dir, "Directory of model config JSON files")
        ->default_val("models");

    std::string revisions_name;
    auto revisions_cmd = app.add_subcommand("revisions", "List revisions of a model");
    revisions_cmd->add_option("name", revisions_name, "Model name")->required();
    revisions_cmd->add_option("--models-dir", models_dir, "Directory of model config JSON files")
        ->default_val("models");

    std::string validate_path;
    bool strict_exit = false;
    auto validate_cmd = app.add_subcommand("validate-config", "Validate a config.yaml");
    validate_cmd->add_option("--path", validate_path, "Path to config.yaml")->required();
    validate_cmd->add_flag("--strict-exit-codes", strict_exit, "Exit 1 when invalid");

    CLI11_PARSE(app, argc, argv);

    if (segment_cmd->parsed()) {
        std::signal(SIGINT, handle_sigint);
        return cmd_segment(seg);
    }
    if (models_cmd->parsed()) {
        return cmd_models(models_dir);
    }
    if (revisions_cmd->parsed()) {
        return cmd_revisions(revisions_name, models_dir);
    }
    if (validate_cmd->parsed()) {
        return cmd_validate_config(validate_path, strict_exit);
    }
    return 1;
}
