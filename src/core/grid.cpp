#include "str8ts/grid.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace str8ts {

void Grid::check_index(size_t index) {
    if (index >= CELL_COUNT) {
        throw std::out_of_range("Cell index out of range: " + std::to_string(index));
    }
}

size_t Grid::checked_index(size_t row, size_t col) {
    if (row >= N || col >= N) {
        throw std::out_of_range("Cell position out of range: (" + std::to_string(row) +
                                "," + std::to_string(col) + ")");
    }
    return index_of(row, col);
}

const Cell& Grid::cell(size_t row, size_t col) const {
    return cells_[checked_index(row, col)];
}

const Cell& Grid::cell(size_t index) const {
    check_index(index);
    return cells_[index];
}

void Grid::set_cell(size_t row, size_t col, Cell cell) {
    cells_[checked_index(row, col)] = cell;
}

void Grid::set_cell(size_t index, Cell cell) {
    check_index(index);
    cells_[index] = cell;
}

void Grid::set_color(size_t row, size_t col, CellColor color) {
    set_color(checked_index(row, col), color);
}

void Grid::set_color(size_t index, CellColor color) {
    check_index(index);
    cells_[index].color = color;
}

void Grid::set_value(size_t row, size_t col, CellValue value) {
    set_value(checked_index(row, col), value);
}

void Grid::set_value(size_t index, CellValue value) {
    check_index(index);
    cells_[index].value = value;
}

void Grid::toggle_color(size_t row, size_t col) {
    toggle_color(checked_index(row, col));
}

void Grid::toggle_color(size_t index) {
    check_index(index);
    auto& c = cells_[index];
    c.color = c.is_white() ? CellColor::Black : CellColor::White;
}

void Grid::clear_all() {
    cells_.fill(Cell());
}

void Grid::clear_values() {
    for (auto& c : cells_) {
        c.value = CellValue::Empty;
    }
}

void Grid::copy_from(const Grid& other) {
    cells_ = other.cells_;
}

size_t Grid::white_count() const {
    return static_cast<size_t>(std::count_if(cells_.begin(), cells_.end(),
                                             [](const Cell& c) { return c.is_white(); }));
}

bool Grid::is_filled() const {
    return std::none_of(cells_.begin(), cells_.end(),
                        [](const Cell& c) { return c.is_white() && c.is_empty(); });
}

std::string Grid::to_string() const {
    std::ostringstream oss;
    for (size_t row = 0; row < N; ++row) {
        for (size_t col = 0; col < N; ++col) {
            oss << cells_[index_of(row, col)] << " ";
        }
        oss << "\n";
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Grid& grid) {
    return os << grid.to_string();
}

} // namespace str8ts
