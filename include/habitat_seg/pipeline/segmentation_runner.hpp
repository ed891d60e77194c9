#pragma once

#include "habitat_seg/core/events.hpp"
#include "habitat_seg/core/types.hpp"
#include "habitat_seg/io/band_writer.hpp"
#include "habitat_seg/io/tile_reader.hpp"
#include "habitat_seg/pipeline/segmentation_context.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace habitat_seg::pipeline {

struct RunSummary {
    std::string run_id;
    RunState state = RunState::INIT;
    int height = 0;
    int width = 0;
    int num_classes = 0;
    int crop_size = 0;
    int stride = 0;
    int tiles_total = 0;
    int tiles_inferred = 0;
    int tiles_skipped = 0;
    int bands_written = 0;
    int peak_resident_rows = 0;
    int64_t nodata_pixels = 0;
    double elapsed_seconds = 0.0;

    nlohmann::json to_json() const;
};

using ProgressCallback = std::function<void(int tiles_done, int tiles_total)>;

// Streams one image through planner, inference and accumulation register
// into a band writer:
//
//   INIT -> STREAMING -> FINAL_FLUSH -> DONE
//
// Any failure moves to FAILED and the exception is rethrown after an error
// event; a set stop flag fails the run with StopRequested. Rows reach the
// writer exactly once, contiguous and in increasing order.
class SegmentationRunner {
public:
    explicit SegmentationRunner(SegmentationContext& ctx, core::EventEmitter* events = nullptr,
                                std::ostream* log = nullptr);

    void set_progress_callback(ProgressCallback cb) { progress_ = std::move(cb); }
    void set_run_id(const std::string& run_id) { run_id_ = run_id; }

    RunSummary run(io::TileReader& reader, io::BandWriter& writer,
                   const std::atomic<bool>* stop_flag = nullptr);

    RunState state() const { return state_; }

private:
    void enter(const std::string& run_id, RunState state);
    void fail(const std::string& run_id, RunState during, const std::string& status,
              const std::string& message, RunSummary& summary);
    void log_line(RunState state, const std::string& message) const;

    SegmentationContext& ctx_;
    core::EventEmitter* events_;
    core::EventEmitter null_events_;
    std::ostream* log_;
    ProgressCallback progress_;
    std::string run_id_;
    RunState state_ = RunState::INIT;
};

} // namespace habitat_seg::pipeline
