#include "habitat_seg/core/events.hpp"
#include "habitat_seg/core/utils.hpp"

namespace habitat_seg::core {

EventEmitter::EventEmitter(std::ostream* out) : out_(out) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    if (!out_) return;
    *out_ << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::state_start(const std::string& run_id, RunState state) {
    json event = base_event("state_start", run_id);
    event["state"] = run_state_to_int(state);
    event["state_name"] = run_state_to_string(state);
    emit(event);
}

void EventEmitter::state_end(const std::string& run_id, RunState state,
                             const std::string& status, const json& extra) {
    json event = base_event("state_end", run_id);
    event["state"] = run_state_to_int(state);
    event["state_name"] = run_state_to_string(state);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::tile_progress(const std::string& run_id, int tiles_done, int tiles_total) {
    json event = base_event("tile_progress", run_id);
    event["current"] = tiles_done;
    event["total"] = tiles_total;
    event["progress"] = tiles_total > 0
        ? static_cast<float>(tiles_done) / static_cast<float>(tiles_total)
        : 1.0f;
    emit(event);
}

void EventEmitter::band_written(const std::string& run_id, int row_start, int rows, int height) {
    json event = base_event("band_written", run_id);
    event["row_start"] = row_start;
    event["rows"] = rows;
    event["height"] = height;
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace habitat_seg::core
