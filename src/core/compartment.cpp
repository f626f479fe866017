#include "str8ts/compartment.hpp"
#include <utility>

namespace str8ts {

namespace {

/**
 * @brief 1 本のライン（行または列）を走査してコンパートメントを追加
 */
void scan_line(const Grid& grid, Axis axis, size_t line, std::vector<Compartment>& out) {
    Compartment current{axis, line, {}};
    for (size_t pos = 0; pos < Grid::N; ++pos) {
        size_t index = (axis == Axis::Row) ? Grid::index_of(line, pos)
                                           : Grid::index_of(pos, line);
        if (grid.cell(index).is_black()) {
            if (!current.cells.empty()) {
                out.push_back(current);
                current.cells.clear();
            }
        } else {
            current.cells.push_back(index);
        }
    }
    // ライン末尾が White なら残りを追加
    if (!current.cells.empty()) {
        out.push_back(std::move(current));
    }
}

} // namespace

std::vector<Compartment> find_row_compartments(const Grid& grid) {
    std::vector<Compartment> result;
    for (size_t row = 0; row < Grid::N; ++row) {
        scan_line(grid, Axis::Row, row, result);
    }
    return result;
}

std::vector<Compartment> find_column_compartments(const Grid& grid) {
    std::vector<Compartment> result;
    for (size_t col = 0; col < Grid::N; ++col) {
        scan_line(grid, Axis::Column, col, result);
    }
    return result;
}

std::vector<Compartment> find_compartments(const Grid& grid) {
    auto result = find_row_compartments(grid);
    auto cols = find_column_compartments(grid);
    result.insert(result.end(), cols.begin(), cols.end());
    return result;
}

} // namespace str8ts
