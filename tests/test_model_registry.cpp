#include "habitat_seg/model/model_registry.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/utils.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace habitat_seg;
using namespace habitat_seg::model;
using habitat_seg::testing::TempDir;

namespace {

void write_model_json(const TempDir& dir, const std::string& file, const std::string& name,
                      const std::string& revision, const std::string& extra = "") {
    std::string text = "{\n  \"name\": \"" + name + "\",\n  \"revision\": \"" + revision +
                       "\",\n  \"model_path\": \"" + name + "_" + revision + ".onnx\"";
    if (!extra.empty()) text += ",\n  " + extra;
    text += "\n}\n";
    core::write_text(dir / file, text);
}

} // namespace

TEST_CASE("registry_loads_directory_and_picks_latest_revision") {
    TempDir dir;
    write_model_json(dir, "kelp_a.json", "kelp-rgb", "20231214");
    write_model_json(dir, "kelp_b.json", "kelp-rgb", "20250626");
    write_model_json(dir, "mussel.json", "mussels-rgb", "20240101");
    core::write_text(dir / "notes.txt", "ignored");

    const auto reg = ModelRegistry::from_config_dir(dir.path());
    REQUIRE(reg.size() == 3);
    REQUIRE(reg.list_model_names() == std::vector<std::string>{"kelp-rgb", "mussels-rgb"});
    REQUIRE(reg.revisions("kelp-rgb") == std::vector<std::string>{"20231214", "20250626"});
    REQUIRE(reg.latest_revision("kelp-rgb") == "20250626");
    REQUIRE(reg.get("kelp-rgb").revision == "20250626");
    REQUIRE(reg.get("kelp-rgb", "20231214").revision == "20231214");
    REQUIRE(reg.contains("mussels-rgb"));
    REQUIRE_FALSE(reg.contains("mussels-rgb", "20250101"));
}

TEST_CASE("registry_unknown_name_or_revision_throws") {
    TempDir dir;
    write_model_json(dir, "kelp.json", "kelp-rgb", "20250626");
    const auto reg = ModelRegistry::from_config_dir(dir.path());

    REQUIRE_THROWS_AS(reg.get("seagrass"), ConfigError);
    REQUIRE_THROWS_AS(reg.get("kelp-rgb", "19990101"), ConfigError);
    REQUIRE_THROWS_AS(reg.revisions("seagrass"), ConfigError);
    REQUIRE_THROWS_AS(ModelRegistry::from_config_dir(dir / "missing"), ConfigError);
}

TEST_CASE("model_config_resolves_relative_model_path") {
    TempDir dir;
    write_model_json(dir, "kelp.json", "kelp-rgb", "20250626",
                     "\"num_classes\": 3, \"activation\": \"softmax\", \"max_pixel_value\": \"auto\"");

    const ModelConfig cfg = ModelConfig::load(dir / "kelp.json");
    REQUIRE(cfg.model_path == (dir.path() / "kelp-rgb_20250626.onnx").lexically_normal());
    REQUIRE(cfg.source_path == dir / "kelp.json");
    REQUIRE(cfg.num_classes == 3);
    REQUIRE(cfg.activation_kind() == inference::Activation::SOFTMAX);
    REQUIRE_FALSE(cfg.max_pixel_value.has_value());
    REQUIRE(cfg.id() == "kelp-rgb@20250626");
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("model_config_reads_preprocessing_fields") {
    const json j = json::parse(R"({
        "name": "kelp-ps8b",
        "revision": "20240722",
        "model_filename": "/models/kelp.onnx",
        "input_channels": 4,
        "normalization": "min_max_per_channel",
        "max_pixel_value": 4096,
        "decoder": "legacy_presence_species",
        "presence_channels": 2
    })");
    const ModelConfig cfg = ModelConfig::from_json(j, "/ignored");
    REQUIRE(cfg.model_path == fs::path("/models/kelp.onnx"));
    REQUIRE(cfg.input_channels == 4);
    REQUIRE(cfg.max_pixel_value.value() == 4096.0f);

    const auto params = cfg.preprocess_params();
    REQUIRE(params.normalization == inference::Normalization::MIN_MAX_PER_CHANNEL);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("model_config_validation_names_offending_key") {
    ModelConfig cfg;
    cfg.name = "kelp-rgb";
    cfg.revision = "20250626";
    cfg.input_channels = 4;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg.input_channels = 3;
    cfg.decoder = "crf";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg.decoder = "legacy_presence_species";
    cfg.presence_channels = 1;
    cfg.activation = "sigmoid";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    cfg.activation = "none";
    REQUIRE_NOTHROW(cfg.validate());
    cfg.presence_channels = 2;
    cfg.activation = "softmax";
    REQUIRE_NOTHROW(cfg.validate());

    REQUIRE_THROWS_AS(ModelConfig::from_json(json::parse(R"({"name": "x", "revision": "1"})")),
                      ConfigError);
    REQUIRE_THROWS_AS(ModelConfig::from_json(json::parse(R"({"name": 5, "revision": "1"})")),
                      ConfigError);
}

TEST_CASE("sha256_of_known_input") {
    const std::vector<uint8_t> abc{'a', 'b', 'c'};
    REQUIRE(core::sha256_bytes(abc) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("model_checksum_verification") {
    TempDir dir;
    core::write_text(dir / "model.onnx", "abc");

    ModelConfig cfg;
    cfg.model_path = dir / "model.onnx";
    REQUIRE_NOTHROW(cfg.verify_checksum());

    cfg.sha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    REQUIRE_NOTHROW(cfg.verify_checksum());

    cfg.sha256 = std::string(64, '0');
    REQUIRE_THROWS_AS(cfg.verify_checksum(), ValidationError);
}
