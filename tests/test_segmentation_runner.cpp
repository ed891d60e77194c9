#include "habitat_seg/pipeline/segmentation_runner.hpp"
#include "habitat_seg/io/tile_reader.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace habitat_seg;
using namespace habitat_seg::testing;
using habitat_seg::pipeline::SegmentationRunner;
using json = nlohmann::json;

namespace {

std::vector<json> parse_events(const std::string& text) {
    std::vector<json> events;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) events.push_back(json::parse(line));
    }
    return events;
}

std::vector<std::string> event_types(const std::vector<json>& events) {
    std::vector<std::string> types;
    for (const auto& e : events) types.push_back(e["type"].get<std::string>());
    return types;
}

bool has_event(const std::vector<json>& events, const std::string& type) {
    for (const auto& e : events) {
        if (e["type"] == type) return true;
    }
    return false;
}

void require_contiguous_bands(const RecordingBandWriter& writer, int height) {
    int expected = 0;
    for (const auto& [start, rows] : writer.bands) {
        REQUIRE(start == expected);
        REQUIRE(rows > 0);
        expected += rows;
    }
    REQUIRE(expected == height);
}

// Smooth per-pixel logits so overlapping tiles genuinely disagree.
FakeAdapter::TileFn wavy_logits_fn(int num_classes) {
    return [num_classes](const Planes& tile) {
        Planes out;
        for (int k = 0; k < num_classes; ++k) {
            Matrix2Df p = tile.front().unaryExpr([k](float v) {
                return std::cos(0.013f * v + static_cast<float>(k));
            });
            out.push_back(p);
        }
        return out;
    };
}

} // namespace

TEST_CASE("runner_constant_logits_blend_to_the_same_value") {
    const int height = 300;
    const int width = 200;
    auto cfg = small_config(64, 32);
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(1, 1, constant_logits_fn(1, 1.0f)));
    auto decoder = std::make_unique<RecordingDecoder>();
    RecordingDecoder* recording = decoder.get();
    ctx.decoder = std::move(decoder);

    io::MatTileReader reader(index_ramp(height, width));
    RecordingBandWriter writer(height, width);
    SegmentationRunner runner(ctx);
    const auto summary = runner.run(reader, writer);

    REQUIRE(summary.state == RunState::DONE);
    REQUIRE(recording->decoded == static_cast<long long>(height) * width);
    REQUIRE(recording->min_value == Catch::Approx(1.0f).margin(1e-5));
    REQUIRE(recording->max_value == Catch::Approx(1.0f).margin(1e-5));
    REQUIRE(summary.nodata_pixels == 0);
}

TEST_CASE("runner_image_smaller_than_crop_uses_one_padded_tile") {
    auto cfg = small_config(1024, 512);
    FakeAdapter* fake = nullptr;
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(3, 1, one_hot_fn(3, [](const Planes&) {
        return 2;
    })), &fake);

    io::MatTileReader reader(index_ramp(500, 500));
    RecordingBandWriter writer(500, 500);
    SegmentationRunner runner(ctx);
    const auto summary = runner.run(reader, writer);

    REQUIRE(summary.tiles_total == 1);
    REQUIRE(fake->tiles_seen == 1);
    REQUIRE(fake->tile_shapes.front() == std::make_pair(1024, 1024));
    REQUIRE(writer.close_called);
    REQUIRE(writer.complete());
    REQUIRE(writer.raster.minCoeff() == 2);
    REQUIRE(writer.raster.maxCoeff() == 2);
}

TEST_CASE("runner_overlap_switches_class_once_between_tile_centres") {
    // Two tiles on one row: columns [0,64) vote class 0, [32,96) vote class 1
    auto cfg = small_config(64, 32);
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(2, 1, one_hot_fn(2, [](const Planes& t) {
        return t.front()(0, 0) == 0.0f ? 0 : 1;
    })));

    io::MatTileReader reader(column_ramp(64, 96));
    RecordingBandWriter writer(64, 96);
    SegmentationRunner runner(ctx);
    const auto summary = runner.run(reader, writer);
    REQUIRE(summary.tiles_total == 2);

    for (int r = 0; r < 64; ++r) {
        for (int c = 0; c <= 44; ++c) REQUIRE(writer.raster(r, c) == 0);
        for (int c = 52; c < 96; ++c) REQUIRE(writer.raster(r, c) == 1);

        int transitions = 0;
        for (int c = 1; c < 96; ++c) {
            if (writer.raster(r, c) != writer.raster(r, c - 1)) ++transitions;
        }
        REQUIRE(transitions == 1);
    }
}

TEST_CASE("runner_output_is_deterministic") {
    auto cfg = small_config(64, 48);
    cfg.processing.batch_size = 3;

    auto run_once = [&cfg]() {
        auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(4, 1, wavy_logits_fn(4)));
        io::MatTileReader reader(index_ramp(150, 130));
        RecordingBandWriter writer(150, 130);
        SegmentationRunner runner(ctx);
        runner.run(reader, writer);
        return writer.raster;
    };

    const LabelMatrix first = run_once();
    const LabelMatrix second = run_once();
    REQUIRE(first == second);
    REQUIRE(first.maxCoeff() > first.minCoeff());
}

TEST_CASE("runner_writes_contiguous_bands_with_bounded_residency") {
    const int height = 3000;
    const int width = 64;
    auto cfg = small_config(64, 32);
    cfg.processing.batch_size = 5;
    FakeAdapter* fake = nullptr;
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(2, 1, wavy_logits_fn(2)), &fake);

    io::MatTileReader reader(column_ramp(height, width));
    RecordingBandWriter writer(height, width);
    SegmentationRunner runner(ctx);
    const auto summary = runner.run(reader, writer);

    require_contiguous_bands(writer, height);
    REQUIRE(writer.bands.size() > 10);
    REQUIRE(summary.bands_written == static_cast<int>(writer.bands.size()));
    REQUIRE(summary.peak_resident_rows <= 64 + 32);
    REQUIRE(fake->max_batch <= 5);
    REQUIRE(fake->tiles_seen == summary.tiles_total);
}

TEST_CASE("runner_stop_flag_set_before_start_aborts") {
    auto cfg = small_config(64);
    FakeAdapter* fake = nullptr;
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 0.0f)), &fake);

    io::MatTileReader reader(index_ramp(128, 128));
    RecordingBandWriter writer(128, 128);
    SegmentationRunner runner(ctx);
    std::atomic<bool> stop{true};

    REQUIRE_THROWS_AS(runner.run(reader, writer, &stop), StopRequested);
    REQUIRE(runner.state() == RunState::FAILED);
    REQUIRE(fake->calls == 0);
    REQUIRE(writer.rows_written() == 0);
    REQUIRE_FALSE(writer.close_called);
}

TEST_CASE("runner_stop_flag_set_mid_run_aborts") {
    auto cfg = small_config(64, 32);
    FakeAdapter* fake = nullptr;
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 0.0f)), &fake);

    io::MatTileReader reader(index_ramp(512, 128));
    RecordingBandWriter writer(512, 128);
    std::ostringstream events_out;
    core::EventEmitter events(&events_out);
    SegmentationRunner runner(ctx, &events);

    std::atomic<bool> stop{false};
    runner.set_progress_callback([&stop](int done, int) {
        if (done >= 4) stop.store(true);
    });

    REQUIRE_THROWS_AS(runner.run(reader, writer, &stop), StopRequested);
    REQUIRE(runner.state() == RunState::FAILED);
    REQUIRE(fake->tiles_seen == 4);
    REQUIRE(writer.rows_written() < 512);
    REQUIRE_FALSE(writer.close_called);

    const auto log = parse_events(events_out.str());
    REQUIRE(log.back()["type"] == "run_end");
    REQUIRE(log.back()["success"] == false);
    REQUIRE(log.back()["status"] == "aborted");
}

TEST_CASE("runner_inference_failure_propagates") {
    auto cfg = small_config(64, 32);
    auto adapter = std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 1.0f));
    adapter->fail_on_call = 2;
    auto ctx = make_context(cfg, std::move(adapter));

    io::MatTileReader reader(index_ramp(256, 256));
    RecordingBandWriter writer(256, 256);
    std::ostringstream events_out;
    core::EventEmitter events(&events_out);
    SegmentationRunner runner(ctx, &events);

    REQUIRE_THROWS_AS(runner.run(reader, writer), InferenceError);
    REQUIRE(runner.state() == RunState::FAILED);
    REQUIRE_FALSE(writer.close_called);

    const auto log = parse_events(events_out.str());
    REQUIRE(has_event(log, "error"));
    REQUIRE(log.back()["type"] == "run_end");
    REQUIRE(log.back()["status"] == "error");
}

TEST_CASE("runner_wrong_logit_count_is_an_inference_error") {
    auto cfg = small_config(64);
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(3, 1, constant_logits_fn(2, 1.0f)));

    io::MatTileReader reader(index_ramp(64, 64));
    RecordingBandWriter writer(64, 64);
    SegmentationRunner runner(ctx);
    REQUIRE_THROWS_AS(runner.run(reader, writer), InferenceError);
}

TEST_CASE("runner_emits_states_in_order") {
    auto cfg = small_config(64, 32);
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 1.0f)));

    io::MatTileReader reader(index_ramp(200, 100));
    RecordingBandWriter writer(200, 100);
    std::ostringstream events_out;
    core::EventEmitter events(&events_out);
    SegmentationRunner runner(ctx, &events);
    runner.set_run_id("test-run");
    const auto summary = runner.run(reader, writer);
    REQUIRE(summary.run_id == "test-run");

    const auto log = parse_events(events_out.str());
    REQUIRE(log.front()["type"] == "run_start");
    REQUIRE(log.back()["type"] == "run_end");
    REQUIRE(log.back()["success"] == true);

    std::vector<std::string> started;
    for (const auto& e : log) {
        REQUIRE(e["run_id"] == "test-run");
        if (e["type"] == "state_start") started.push_back(e["state_name"].get<std::string>());
    }
    REQUIRE(started == std::vector<std::string>{"INIT", "STREAMING", "FINAL_FLUSH", "DONE"});

    const auto types = event_types(log);
    REQUIRE(std::count(types.begin(), types.end(), "band_written") == summary.bands_written);
    REQUIRE(runner.state() == RunState::DONE);
}

TEST_CASE("runner_model_preferred_tile_size_wins") {
    auto cfg = small_config(64);
    auto adapter = std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 1.0f));
    adapter->preferred = 32;
    FakeAdapter* fake = nullptr;
    auto ctx = make_context(cfg, std::move(adapter), &fake);

    io::MatTileReader reader(index_ramp(100, 100));
    RecordingBandWriter writer(100, 100);
    std::ostringstream events_out;
    core::EventEmitter events(&events_out);
    SegmentationRunner runner(ctx, &events);
    const auto summary = runner.run(reader, writer);

    REQUIRE(summary.crop_size == 32);
    REQUIRE(summary.stride == 16);
    for (const auto& shape : fake->tile_shapes) {
        REQUIRE(shape == std::make_pair(32, 32));
    }
    REQUIRE(has_event(parse_events(events_out.str()), "warning"));
}

TEST_CASE("runner_skips_uniform_tiles") {
    auto cfg = small_config(64, 32);
    cfg.processing.skip_uniform_tiles = true;
    FakeAdapter* fake = nullptr;
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(3, 1, one_hot_fn(3, [](const Planes&) {
        return 1;
    })), &fake);
    ctx.model.default_output_value = 2;

    // Left half constant, right half a ramp
    cv::Mat image = column_ramp(128, 256);
    image(cv::Rect(0, 0, 128, 128)).setTo(cv::Scalar(0));

    io::MatTileReader reader(image);
    RecordingBandWriter writer(128, 256);
    SegmentationRunner runner(ctx);
    const auto summary = runner.run(reader, writer);

    REQUIRE(summary.tiles_skipped > 0);
    REQUIRE(summary.tiles_inferred > 0);
    REQUIRE(summary.tiles_skipped + summary.tiles_inferred == summary.tiles_total);
    REQUIRE(fake->tiles_seen == summary.tiles_inferred);
    REQUIRE(writer.raster(64, 10) == 2);
    REQUIRE(writer.raster(64, 250) == 1);
}

TEST_CASE("runner_plain_window_keeps_border_weight_positive") {
    auto cfg = small_config(64, 32);
    cfg.processing.edge_aware_window = false;
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 1.0f)));

    io::MatTileReader reader(index_ramp(128, 128));
    RecordingBandWriter writer(128, 128);
    std::ostringstream events_out;
    core::EventEmitter events(&events_out);
    SegmentationRunner runner(ctx, &events);
    const auto summary = runner.run(reader, writer);

    REQUIRE(summary.nodata_pixels == 0);
    REQUIRE(writer.raster(0, 0) == 0);
    REQUIRE(writer.raster(127, 127) == 0);
    REQUIRE_FALSE(has_event(parse_events(events_out.str()), "warning"));
}

TEST_CASE("runner_stride_equal_to_crop_leaves_no_nodata") {
    for (bool edge_aware : {true, false}) {
        auto cfg = small_config(32, 32);
        cfg.processing.edge_aware_window = edge_aware;
        auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(1, 1, constant_logits_fn(1, 1.0f)));

        io::MatTileReader reader(index_ramp(96, 80));
        RecordingBandWriter writer(96, 80);
        SegmentationRunner runner(ctx);
        const auto summary = runner.run(reader, writer);

        REQUIRE(summary.state == RunState::DONE);
        REQUIRE(summary.tiles_total == 9);
        REQUIRE(summary.nodata_pixels == 0);
        // Row and column 32 start interior tiles
        REQUIRE(writer.raster(32, 10) == 1);
        REQUIRE(writer.raster(10, 32) == 1);
        REQUIRE(writer.raster.maxCoeff() == 1);
        REQUIRE(writer.raster.minCoeff() == 1);
    }
}

TEST_CASE("runner_single_class_model_decodes_as_binary") {
    // One output channel: positive logits left of column 40, negative right
    auto cfg = small_config(32, 16);
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(1, 1, [](const Planes& tile) {
        Planes out;
        out.push_back(tile.front().unaryExpr([](float c) { return c < 40.0f ? 2.0f : -2.0f; }));
        return out;
    }));
    REQUIRE(ctx.decoder->name() == "binary");

    io::MatTileReader reader(column_ramp(48, 80));
    RecordingBandWriter writer(48, 80);
    SegmentationRunner runner(ctx);
    runner.run(reader, writer);

    for (int r = 0; r < 48; ++r) {
        REQUIRE(writer.raster(r, 0) == 1);
        REQUIRE(writer.raster(r, 39) == 1);
        REQUIRE(writer.raster(r, 40) == 0);
        REQUIRE(writer.raster(r, 79) == 0);
    }
}

TEST_CASE("runner_validates_band_order_and_output_size") {
    auto cfg = small_config(64);
    cfg.processing.band_order = {1, 2};
    REQUIRE_THROWS_AS(make_context(cfg, std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 1.0f))),
                      ValidationError);

    cfg.processing.band_order = {3};
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 1.0f)));
    io::MatTileReader reader(index_ramp(64, 64));
    RecordingBandWriter writer(64, 64);
    SegmentationRunner runner(ctx);
    REQUIRE_THROWS_AS(runner.run(reader, writer), ValidationError);
    REQUIRE(runner.state() == RunState::FAILED);

    cfg.processing.band_order.clear();
    auto ctx2 = make_context(cfg, std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 1.0f)));
    RecordingBandWriter wrong(64, 32);
    SegmentationRunner runner2(ctx2);
    REQUIRE_THROWS_AS(runner2.run(reader, wrong), ValidationError);
}

TEST_CASE("runner_passes_image_info_to_adapter") {
    auto cfg = small_config(64);
    FakeAdapter* fake = nullptr;
    auto ctx = make_context(cfg, std::make_unique<FakeAdapter>(2, 1, constant_logits_fn(2, 1.0f)), &fake);

    io::MatTileReader reader(index_ramp(70, 90));
    RecordingBandWriter writer(70, 90);
    SegmentationRunner runner(ctx);
    runner.run(reader, writer);

    REQUIRE(fake->prepare_calls == 1);
    REQUIRE(fake->prepared_info.height == 70);
    REQUIRE(fake->prepared_info.width == 90);
    REQUIRE(fake->prepared_info.pixel_type == PixelType::FLOAT32);
}

TEST_CASE("context_rejects_too_many_classes") {
    auto cfg = small_config(64);
    REQUIRE_THROWS_AS(make_context(cfg, std::make_unique<FakeAdapter>(300, 1, constant_logits_fn(300, 0.0f))),
                      ValidationError);
    REQUIRE_THROWS_AS(make_context(cfg, std::make_unique<FakeAdapter>(0, 1, constant_logits_fn(0, 0.0f))),
                      ValidationError);
    REQUIRE_THROWS_AS(make_context(cfg, std::make_unique<FakeAdapter>(1, 1, constant_logits_fn(1, 0.0f)),
                                   nullptr, "legacy_presence_species"),
                      ValidationError);
}

TEST_CASE("context_single_class_threshold_follows_activation") {
    auto cfg = small_config(64);
    const float low = 0.4f;
    const float high = 0.6f;
    const float neg = -0.1f;

    auto raw = pipeline::SegmentationContext::with_adapter(
        cfg, test_model(), std::make_unique<FakeAdapter>(1, 1, constant_logits_fn(1, 0.0f)));
    REQUIRE(raw.decoder->name() == "binary");
    REQUIRE(raw.decoder->decode(&low, 1) == 1);
    REQUIRE(raw.decoder->decode(&neg, 1) == 0);

    auto model = test_model();
    model.activation = "sigmoid";
    auto probs = pipeline::SegmentationContext::with_adapter(
        cfg, model, std::make_unique<FakeAdapter>(1, 1, constant_logits_fn(1, 0.0f)));
    REQUIRE(probs.decoder->decode(&low, 1) == 0);
    REQUIRE(probs.decoder->decode(&high, 1) == 1);

    model.activation = "softmax";
    REQUIRE_THROWS_AS(pipeline::SegmentationContext::with_adapter(
                          cfg, model, std::make_unique<FakeAdapter>(1, 1, constant_logits_fn(1, 0.0f))),
                      ValidationError);
}
