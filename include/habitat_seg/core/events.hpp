#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace habitat_seg::core {

using json = nlohmann::json;

// Line-delimited JSON events for progress consumers (GUI, log files).
class EventEmitter {
public:
    explicit EventEmitter(std::ostream* out = nullptr);

    void set_stream(std::ostream* out) { out_ = out; }

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra = json::object());

    void state_start(const std::string& run_id, RunState state);
    void state_end(const std::string& run_id, RunState state, const std::string& status,
                   const json& extra = json::object());

    void tile_progress(const std::string& run_id, int tiles_done, int tiles_total);
    void band_written(const std::string& run_id, int row_start, int rows, int height);

    void warning(const std::string& run_id, const std::string& message);
    void error(const std::string& run_id, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream* out_;
};

} // namespace habitat_seg::core
