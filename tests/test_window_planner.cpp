#include "habitat_seg/tiling/window_planner.hpp"
#include "habitat_seg/core/errors.hpp"

#include <set>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace habitat_seg;
using namespace habitat_seg::tiling;

TEST_CASE("planner_2048_square_with_crop_1024_yields_nine_windows") {
    WindowPlanner planner(2048, 2048, 1024, 512);

    REQUIRE(planner.size() == 9);
    REQUIRE(planner.row_starts() == std::vector<int>{0, 512, 1024});
    REQUIRE(planner.col_starts() == std::vector<int>{0, 512, 1024});

    const TileWindow last = planner.at(planner.size() - 1);
    REQUIRE(last.row_start == 1024);
    REQUIRE(last.row_end == 2048);
    REQUIRE(last.col_end == 2048);
}

TEST_CASE("planner_defaults_stride_to_half_crop") {
    WindowPlanner planner(3000, 1000, 512);
    REQUIRE(planner.stride() == 256);
}

TEST_CASE("planner_shifts_last_tile_inward") {
    WindowPlanner planner(1000, 700, 256, 128);
    REQUIRE(planner.row_starts().back() == 1000 - 256);
    REQUIRE(planner.col_starts().back() == 700 - 256);
    for (const TileWindow& w : planner) {
        REQUIRE(w.height() == 256);
        REQUIRE(w.width() == 256);
        REQUIRE(w.row_start >= 0);
        REQUIRE(w.row_end <= 1000);
        REQUIRE(w.col_end <= 700);
    }
}

TEST_CASE("planner_short_axis_gets_single_tile") {
    WindowPlanner planner(500, 500, 1024, 512);
    REQUIRE(planner.size() == 1);
    const TileWindow w = planner.at(0);
    REQUIRE(w.row_start == 0);
    REQUIRE(w.col_start == 0);
    REQUIRE(w.row_end == 500);
    REQUIRE(w.col_end == 500);

    WindowPlanner strip(100, 3000, 256);
    REQUIRE(strip.rows() == 1);
    REQUIRE(strip.tile_height() == 100);
    REQUIRE(strip.tile_width() == 256);
}

TEST_CASE("planner_order_is_row_major_with_increasing_row_starts") {
    WindowPlanner planner(900, 900, 200, 100);
    int prev_row = -1;
    int prev_col = -1;
    int prev_band = 0;
    for (const TileWindow& w : planner) {
        if (w.band_index == prev_band && prev_row >= 0) {
            REQUIRE(w.row_start == prev_row);
            REQUIRE(w.col_start > prev_col);
        } else if (prev_row >= 0) {
            REQUIRE(w.band_index == prev_band + 1);
            REQUIRE(w.row_start > prev_row);
            REQUIRE(w.col_index == 0);
        }
        prev_row = w.row_start;
        prev_col = w.col_start;
        prev_band = w.band_index;
    }
}

TEST_CASE("planner_iteration_is_restartable") {
    WindowPlanner planner(777, 555, 128, 64);
    std::vector<std::pair<int, int>> first;
    std::vector<std::pair<int, int>> second;
    for (const TileWindow& w : planner) first.emplace_back(w.row_start, w.col_start);
    for (const TileWindow& w : planner) second.emplace_back(w.row_start, w.col_start);
    REQUIRE(first == second);
    REQUIRE(first.size() == planner.size());
}

TEST_CASE("planner_windows_cover_every_pixel") {
    const int h = 333;
    const int w = 517;
    WindowPlanner planner(h, w, 64, 48);
    REQUIRE(validate_full_coverage(planner));

    std::vector<char> covered(static_cast<size_t>(h) * w, 0);
    for (const TileWindow& win : planner) {
        for (int r = win.row_start; r < win.row_end; ++r) {
            for (int c = win.col_start; c < win.col_end; ++c) {
                covered[static_cast<size_t>(r) * w + c] = 1;
            }
        }
    }
    for (char c : covered) {
        REQUIRE(c == 1);
    }
}

TEST_CASE("planner_rejects_invalid_parameters") {
    REQUIRE_THROWS_AS(WindowPlanner(100, 100, 0), ConfigError);
    REQUIRE_THROWS_AS(WindowPlanner(100, 100, 63), ConfigError);
    REQUIRE_THROWS_AS(WindowPlanner(100, 100, 64, 65), ConfigError);
    REQUIRE_THROWS_AS(WindowPlanner(0, 100, 64), ConfigError);
    REQUIRE_THROWS_AS(WindowPlanner(100, -1, 64), ConfigError);
}

TEST_CASE("planner_stride_equal_to_crop_tiles_without_overlap") {
    WindowPlanner planner(256, 256, 64, 64);
    REQUIRE(planner.row_starts() == std::vector<int>{0, 64, 128, 192});
    REQUIRE(validate_full_coverage(planner));
}
