#include "habitat_seg/pipeline/segmentation_runner.hpp"
#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/utils.hpp"
#include "habitat_seg/inference/preprocess.hpp"
#include "habitat_seg/tiling/accumulation_register.hpp"
#include "habitat_seg/tiling/window_function.hpp"
#include "habitat_seg/tiling/window_planner.hpp"

#include <algorithm>
#include <chrono>
#include <memory>

namespace habitat_seg::pipeline {

using json = nlohmann::json;

namespace {

std::vector<int> resolve_band_order(const std::vector<int>& configured, int input_channels,
                                    int num_bands) {
    std::vector<int> order = configured;
    if (order.empty()) {
        for (int b = 1; b <= input_channels; ++b) order.push_back(b);
    }
    if (static_cast<int>(order.size()) != input_channels) {
        throw ValidationError("processing.band_order has " + std::to_string(order.size()) +
                              " entries, model expects " + std::to_string(input_channels));
    }
    for (int b : order) {
        if (b < 1 || b > num_bands) {
            throw ValidationError("processing.band_order entry " + std::to_string(b) +
                                  " is invalid for an image with " + std::to_string(num_bands) +
                                  " bands");
        }
    }
    return order;
}

Planes constant_logits(const tiling::LabelDecoder& decoder, int label, int num_classes, int size) {
    std::vector<float> values(static_cast<size_t>(num_classes));
    decoder.encode(static_cast<uint8_t>(label), values.data(), num_classes);
    Planes planes;
    planes.reserve(values.size());
    for (float v : values) {
        planes.push_back(Matrix2Df::Constant(size, size, v));
    }
    return planes;
}

} // namespace

json RunSummary::to_json() const {
    json j;
    j["run_id"] = run_id;
    j["state"] = run_state_to_string(state);
    j["height"] = height;
    j["width"] = width;
    j["num_classes"] = num_classes;
    j["crop_size"] = crop_size;
    j["stride"] = stride;
    j["tiles_total"] = tiles_total;
    j["tiles_inferred"] = tiles_inferred;
    j["tiles_skipped"] = tiles_skipped;
    j["bands_written"] = bands_written;
    j["peak_resident_rows"] = peak_resident_rows;
    j["nodata_pixels"] = nodata_pixels;
    j["elapsed_seconds"] = elapsed_seconds;
    return j;
}

SegmentationRunner::SegmentationRunner(SegmentationContext& ctx, core::EventEmitter* events,
                                       std::ostream* log)
    : ctx_(ctx), events_(events ? events : &null_events_), log_(log) {
    if (!ctx_.adapter || !ctx_.decoder) {
        throw ConfigError("segmentation context is missing its adapter or decoder");
    }
}

void SegmentationRunner::enter(const std::string& run_id, RunState state) {
    state_ = state;
    events_->state_start(run_id, state);
}

void SegmentationRunner::log_line(RunState state, const std::string& message) const {
    if (!log_) return;
    *log_ << "[" << run_state_to_string(state) << "] " << message << std::endl;
}

void SegmentationRunner::fail(const std::string& run_id, RunState during, const std::string& status,
                              const std::string& message, RunSummary& summary) {
    events_->state_end(run_id, during, status, {{"error", message}});
    events_->error(run_id, message);
    enter(run_id, RunState::FAILED);
    summary.state = RunState::FAILED;
    events_->run_end(run_id, false, status, summary.to_json());
    log_line(RunState::FAILED, message);
}

RunSummary SegmentationRunner::run(io::TileReader& reader, io::BandWriter& writer,
                                   const std::atomic<bool>* stop_flag) {
    const auto t0 = std::chrono::steady_clock::now();
    auto elapsed = [&t0]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    };

    const auto& proc = ctx_.config.processing;
    auto& adapter = *ctx_.adapter;
    const auto& decoder = *ctx_.decoder;

    RunSummary summary;
    summary.run_id = run_id_.empty() ? core::get_run_id() : run_id_;
    summary.height = reader.height();
    summary.width = reader.width();
    summary.num_classes = adapter.num_classes();
    const std::string& run_id = summary.run_id;
    const int height = summary.height;
    const int width = summary.width;
    const int num_classes = summary.num_classes;

    events_->run_start(run_id, {
        {"model", ctx_.model.id()},
        {"adapter", adapter.name()},
        {"height", height},
        {"width", width},
        {"bands", reader.num_bands()},
        {"pixel_type", pixel_type_to_string(reader.pixel_type())}
    });

    // --- INIT ---
    enter(run_id, RunState::INIT);

    std::unique_ptr<tiling::WindowPlanner> planner;
    std::unique_ptr<tiling::WindowCache> masks;
    std::unique_ptr<tiling::AccumulationRegister> reg;
    std::vector<int> band_order;
    Planes uniform_logits;
    int crop = proc.crop_size;

    try {
        if (writer.height() != height || writer.width() != width) {
            throw ValidationError("output raster is " + std::to_string(writer.height()) + "x" +
                                  std::to_string(writer.width()) + ", input is " +
                                  std::to_string(height) + "x" + std::to_string(width));
        }
        if (writer.rows_written() != 0 || writer.closed()) {
            throw PipelineError("band writer has already been used");
        }

        const auto preferred = adapter.preferred_tile_size();
        if (preferred.has_value() && *preferred != crop) {
            const std::string msg = "Specified tile size " + std::to_string(crop) +
                                    " does not match model preferred size " +
                                    std::to_string(*preferred) + ", using " +
                                    std::to_string(*preferred);
            events_->warning(run_id, msg);
            log_line(RunState::INIT, msg);
            crop = *preferred;
        }
        const int stride = proc.stride > 0 ? proc.stride : crop / 2;

        band_order = resolve_band_order(proc.band_order, adapter.input_channels(), reader.num_bands());

        planner = std::make_unique<tiling::WindowPlanner>(height, width, crop, stride);
        if (!tiling::validate_full_coverage(*planner)) {
            throw PipelineError("window plan does not cover the " + std::to_string(height) + "x" +
                                std::to_string(width) + " image");
        }

        masks = std::make_unique<tiling::WindowCache>(
            crop, tiling::window_kind_from_string(proc.window_function), proc.edge_aware_window);
        reg = std::make_unique<tiling::AccumulationRegister>(
            width, height, num_classes, crop, planner->stride(), decoder,
            static_cast<uint8_t>(ctx_.config.output.nodata_value));

        if (proc.skip_uniform_tiles) {
            uniform_logits = constant_logits(decoder, ctx_.model.default_output_value, num_classes, crop);
        }

        adapter.prepare(reader.info());

        summary.crop_size = crop;
        summary.stride = planner->stride();
        summary.tiles_total = static_cast<int>(planner->size());

        events_->state_end(run_id, RunState::INIT, "ok", {
            {"crop_size", crop},
            {"stride", planner->stride()},
            {"tile_rows", planner->rows()},
            {"tile_cols", planner->cols()},
            {"tiles_total", summary.tiles_total},
            {"register_height", reg->register_height()},
            {"band_order", band_order}
        });
        log_line(RunState::INIT, std::to_string(summary.tiles_total) + " tiles of " +
                                 std::to_string(crop) + "px, stride " +
                                 std::to_string(planner->stride()));
    } catch (const std::exception& e) {
        summary.elapsed_seconds = elapsed();
        fail(run_id, RunState::INIT, "error", e.what(), summary);
        throw;
    }

    // --- STREAMING ---
    enter(run_id, RunState::STREAMING);

    auto flush = [&](int up_to_row) {
        tiling::FinalizedBand band = reg->finalize_band(up_to_row);
        if (band.empty()) return;
        writer.write_rows(band.row_start, band.labels);
        ++summary.bands_written;
        events_->band_written(run_id, band.row_start, band.rows(), height);
    };

    try {
        const size_t total = planner->size();
        const size_t batch_size = static_cast<size_t>(std::max(1, proc.batch_size));
        int tiles_done = 0;
        int last_logged_pct = -1;

        for (size_t first = 0; first < total; first += batch_size) {
            if (stop_flag && stop_flag->load()) {
                throw StopRequested();
            }

            const size_t last = std::min(total, first + batch_size);
            std::vector<TileWindow> windows;
            std::vector<Planes> logits(last - first);
            std::vector<Planes> to_infer;
            std::vector<size_t> infer_slots;

            for (size_t i = first; i < last; ++i) {
                const TileWindow w = planner->at(i);
                windows.push_back(w);
                Planes tile = reader.read_window(w.row_start, w.col_start, crop, crop, band_order,
                                                 proc.fill_value);
                if (proc.skip_uniform_tiles && inference::is_uniform_tile(tile)) {
                    logits[i - first] = uniform_logits;
                    ++summary.tiles_skipped;
                } else {
                    infer_slots.push_back(i - first);
                    to_infer.push_back(std::move(tile));
                }
            }

            if (!to_infer.empty()) {
                std::vector<Planes> out = adapter.infer(to_infer);
                if (out.size() != to_infer.size()) {
                    throw InferenceError("adapter returned " + std::to_string(out.size()) +
                                         " results for " + std::to_string(to_infer.size()) + " tiles");
                }
                for (size_t j = 0; j < out.size(); ++j) {
                    const Planes& planes = out[j];
                    if (static_cast<int>(planes.size()) != num_classes) {
                        throw InferenceError("adapter returned " + std::to_string(planes.size()) +
                                             " class planes, expected " + std::to_string(num_classes));
                    }
                    for (const auto& p : planes) {
                        if (p.rows() != crop || p.cols() != crop) {
                            throw InferenceError("adapter changed the tile size to " +
                                                 std::to_string(p.rows()) + "x" +
                                                 std::to_string(p.cols()));
                        }
                    }
                    logits[infer_slots[j]] = std::move(out[j]);
                }
                summary.tiles_inferred += static_cast<int>(out.size());
            }

            for (size_t j = 0; j < windows.size(); ++j) {
                const TileWindow& w = windows[j];
                if (w.row_start > reg->base_row()) {
                    flush(w.row_start);
                }
                reg->accumulate(w, logits[j], masks->get(edges_of(w, height, width)));
                ++tiles_done;
            }

            events_->tile_progress(run_id, tiles_done, static_cast<int>(total));
            if (progress_) progress_(tiles_done, static_cast<int>(total));

            const int pct = static_cast<int>(100LL * tiles_done / static_cast<long long>(total));
            if (pct / 10 != last_logged_pct / 10) {
                last_logged_pct = pct;
                log_line(RunState::STREAMING, std::to_string(tiles_done) + "/" +
                                              std::to_string(total) + " tiles (" +
                                              std::to_string(pct) + "%)");
            }
        }

        summary.peak_resident_rows = reg->peak_resident_rows();
        events_->state_end(run_id, RunState::STREAMING, "ok", {
            {"tiles_inferred", summary.tiles_inferred},
            {"tiles_skipped", summary.tiles_skipped},
            {"rows_written", writer.rows_written()}
        });
    } catch (const StopRequested& e) {
        summary.elapsed_seconds = elapsed();
        fail(run_id, RunState::STREAMING, "aborted", e.what(), summary);
        throw;
    } catch (const std::exception& e) {
        summary.elapsed_seconds = elapsed();
        fail(run_id, RunState::STREAMING, "error", e.what(), summary);
        throw;
    }

    // --- FINAL_FLUSH ---
    enter(run_id, RunState::FINAL_FLUSH);
    try {
        flush(height);
        if (!reg->complete() || writer.rows_written() != height) {
            throw InternalConsistencyError("final flush ended at row " +
                                           std::to_string(writer.rows_written()) + " of " +
                                           std::to_string(height));
        }
        writer.close();

        summary.nodata_pixels = reg->nodata_pixel_count();
        summary.peak_resident_rows = reg->peak_resident_rows();
        if (summary.nodata_pixels > 0) {
            const std::string msg = std::to_string(summary.nodata_pixels) +
                                    " pixels received no weight and were set to nodata (" +
                                    std::to_string(ctx_.config.output.nodata_value) + ")";
            events_->warning(run_id, msg);
            log_line(RunState::FINAL_FLUSH, msg);
        }
        events_->state_end(run_id, RunState::FINAL_FLUSH, "ok", {
            {"bands_written", summary.bands_written},
            {"nodata_pixels", summary.nodata_pixels}
        });
    } catch (const std::exception& e) {
        summary.elapsed_seconds = elapsed();
        fail(run_id, RunState::FINAL_FLUSH, "error", e.what(), summary);
        throw;
    }

    // --- DONE ---
    enter(run_id, RunState::DONE);
    summary.state = RunState::DONE;
    summary.elapsed_seconds = elapsed();
    events_->state_end(run_id, RunState::DONE, "ok");
    events_->run_end(run_id, true, "ok", summary.to_json());
    log_line(RunState::DONE, std::to_string(height) + "x" + std::to_string(width) + " labels written in " +
                             std::to_string(summary.elapsed_seconds) + " s");
    return summary;
}

} // namespace habitat_seg::pipeline
