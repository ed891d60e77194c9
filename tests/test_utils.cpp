#include "habitat_seg/core/errors.hpp"
#include "habitat_seg/core/events.hpp"
#include "habitat_seg/core/utils.hpp"

#include "test_support.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace habitat_seg;
using habitat_seg::testing::TempDir;

TEST_CASE("string_helpers") {
    REQUIRE(core::to_lower("Bartlett_HANN") == "bartlett_hann");
    REQUIRE(core::trim("  cuda \t") == "cuda");
    REQUIRE(core::trim("   ").empty());
    REQUIRE(core::ends_with("model.JSON", ".JSON"));
    REQUIRE_FALSE(core::ends_with("a", ".json"));
    REQUIRE(core::split("a,b,,c", ',') == std::vector<std::string>{"a", "b", "", "c"});
    REQUIRE(core::join({"x", "y"}, ", ") == "x, y");
}

TEST_CASE("iso_timestamp_is_utc_with_milliseconds") {
    const std::string ts = core::get_iso_timestamp();
    REQUIRE(ts.size() == 24);
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}

TEST_CASE("run_ids_are_distinct") {
    REQUIRE(core::get_run_id() != core::get_run_id());
}

TEST_CASE("list_files_with_extension_is_sorted_and_case_insensitive") {
    TempDir dir;
    core::write_text(dir / "b.json", "{}");
    core::write_text(dir / "a.JSON", "{}");
    core::write_text(dir / "c.yaml", "");

    const auto files = core::list_files_with_extension(dir.path(), ".json");
    REQUIRE(files.size() == 2);
    REQUIRE(files[0].filename() == "a.JSON");
    REQUIRE(files[1].filename() == "b.json");
    REQUIRE(core::list_files_with_extension(dir / "missing", ".json").empty());
}

TEST_CASE("text_files_round_trip_and_missing_file_throws") {
    TempDir dir;
    core::write_text(dir / "note.txt", "kelp\n");
    REQUIRE(core::read_text(dir / "note.txt") == "kelp\n");
    REQUIRE_THROWS_AS(core::read_text(dir / "absent.txt"), IOError);
    REQUIRE_THROWS_AS(core::sha256_file(dir / "absent.onnx"), IOError);
}

TEST_CASE("event_emitter_writes_json_lines") {
    std::ostringstream out;
    core::EventEmitter events(&out);
    events.state_start("r1", RunState::STREAMING);
    events.tile_progress("r1", 3, 12);
    events.warning("r1", "careful");

    std::istringstream in(out.str());
    std::string line;
    std::vector<nlohmann::json> parsed;
    while (std::getline(in, line)) parsed.push_back(nlohmann::json::parse(line));

    REQUIRE(parsed.size() == 3);
    REQUIRE(parsed[0]["type"] == "state_start");
    REQUIRE(parsed[0]["state_name"] == "STREAMING");
    REQUIRE(parsed[0]["state"] == 1);
    REQUIRE(parsed[1]["current"] == 3);
    REQUIRE(parsed[1]["total"] == 12);
    REQUIRE(parsed[2]["message"] == "careful");
    for (const auto& e : parsed) {
        REQUIRE(e["run_id"] == "r1");
        REQUIRE(e.contains("ts"));
    }
}

TEST_CASE("event_emitter_without_stream_is_silent") {
    core::EventEmitter events;
    REQUIRE_NOTHROW(events.error("r1", "nobody listens"));
}
