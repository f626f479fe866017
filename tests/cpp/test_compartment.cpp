#include <catch2/catch_test_macros.hpp>
#include "str8ts/compartment.hpp"
#include "sample_puzzles.hpp"
#include <map>
#include <vector>

using namespace str8ts;
using namespace str8ts_test;

// Helper: 行 row の色を文字列で設定（'W' / 'B'）
static void set_row_colors(Grid& g, size_t row, const char* pattern) {
    for (size_t col = 0; col < Grid::N; ++col) {
        g.set_color(row, col, pattern[col] == 'B' ? CellColor::Black : CellColor::White);
    }
}

// ============================================================================
// Basic segmentation
// ============================================================================

TEST_CASE("All white grid", "[compartment]") {
    Grid g;
    auto rows = find_row_compartments(g);
    auto cols = find_column_compartments(g);

    REQUIRE(rows.size() == 9);
    REQUIRE(cols.size() == 9);
    for (size_t r = 0; r < 9; ++r) {
        REQUIRE(rows[r].axis == Axis::Row);
        REQUIRE(rows[r].line == r);
        REQUIRE(rows[r].size() == 9);
        REQUIRE(rows[r].cells.front() == Grid::index_of(r, 0));
        REQUIRE(rows[r].cells.back() == Grid::index_of(r, 8));
    }
    REQUIRE(cols[3].axis == Axis::Column);
    REQUIRE(cols[3].cells == std::vector<size_t>{3, 12, 21, 30, 39, 48, 57, 66, 75});
}

TEST_CASE("All black grid", "[compartment]") {
    auto g = all_black();
    REQUIRE(find_compartments(g).empty());
}

TEST_CASE("Row split by black cells", "[compartment]") {
    Grid g = all_black();

    SECTION("black in the middle") {
        set_row_colors(g, 2, "WWWBWWBBW");
        auto rows = find_row_compartments(g);
        REQUIRE(rows.size() == 3);
        REQUIRE(rows[0].cells == std::vector<size_t>{18, 19, 20});
        REQUIRE(rows[1].cells == std::vector<size_t>{22, 23});
        REQUIRE(rows[2].cells == std::vector<size_t>{26});
        for (const auto& c : rows) {
            REQUIRE(c.line == 2);
        }
    }

    SECTION("black at both ends") {
        set_row_colors(g, 0, "BWWWWWWWB");
        auto rows = find_row_compartments(g);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].size() == 7);
        REQUIRE(rows[0].cells.front() == 1);
        REQUIRE(rows[0].cells.back() == 7);
    }
}

TEST_CASE("Singleton compartments", "[compartment]") {
    Grid g = all_black();
    set_row_colors(g, 0, "WBWBWBWBW");

    auto rows = find_row_compartments(g);
    REQUIRE(rows.size() == 5);
    for (size_t k = 0; k < rows.size(); ++k) {
        REQUIRE(rows[k].size() == 1);
        REQUIRE(rows[k].cells[0] == 2 * k);
    }

    // 各 White セルは列方向でも長さ1のコンパートメントになる
    auto cols = find_column_compartments(g);
    REQUIRE(cols.size() == 5);
    for (const auto& c : cols) {
        REQUIRE(c.size() == 1);
        REQUIRE(c.axis == Axis::Column);
    }
}

TEST_CASE("Column order follows rows", "[compartment]") {
    Grid g;
    g.set_color(4, 6, CellColor::Black);
    auto cols = find_column_compartments(g);
    REQUIRE(cols.size() == 10);
    // 列 6 は行 4 で分割される
    REQUIRE(cols[6].line == 6);
    REQUIRE(cols[6].cells == std::vector<size_t>{6, 15, 24, 33});
    REQUIRE(cols[7].line == 6);
    REQUIRE(cols[7].cells == std::vector<size_t>{51, 60, 69, 78});
}

TEST_CASE("Rows come before columns", "[compartment]") {
    Grid g;
    auto all = find_compartments(g);
    REQUIRE(all.size() == 18);
    for (size_t i = 0; i < 9; ++i) {
        REQUIRE(all[i].axis == Axis::Row);
        REQUIRE(all[i + 9].axis == Axis::Column);
    }
}

// ============================================================================
// Coverage and maximality
// ============================================================================

TEST_CASE("Every white cell is covered once per axis", "[compartment][property]") {
    auto g = latin_puzzle();
    auto all = find_compartments(g);

    std::map<size_t, int> row_hits;
    std::map<size_t, int> col_hits;
    for (const auto& c : all) {
        for (size_t i : c.cells) {
            REQUIRE(g.cell(i).is_white());
            (c.axis == Axis::Row ? row_hits : col_hits)[i]++;
        }
    }
    for (size_t i = 0; i < Grid::CELL_COUNT; ++i) {
        int expected = g.cell(i).is_white() ? 1 : 0;
        REQUIRE(row_hits[i] == expected);
        REQUIRE(col_hits[i] == expected);
    }
}

TEST_CASE("Compartments are contiguous and maximal", "[compartment][property]") {
    auto g = latin_puzzle();

    for (const auto& c : find_compartments(g)) {
        REQUIRE(!c.cells.empty());
        const size_t step = (c.axis == Axis::Row) ? 1 : Grid::N;
        for (size_t k = 1; k < c.cells.size(); ++k) {
            REQUIRE(c.cells[k] == c.cells[k - 1] + step);
        }

        // 前後は Black セルか盤端
        size_t first = c.cells.front();
        size_t last = c.cells.back();
        size_t first_pos = (c.axis == Axis::Row) ? Grid::col_of(first) : Grid::row_of(first);
        size_t last_pos = (c.axis == Axis::Row) ? Grid::col_of(last) : Grid::row_of(last);
        if (first_pos > 0) {
            REQUIRE(g.cell(first - step).is_black());
        }
        if (last_pos < Grid::N - 1) {
            REQUIRE(g.cell(last + step).is_black());
        }
    }
}
