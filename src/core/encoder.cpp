#include "str8ts/encoder.hpp"
#include "str8ts/errors.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <utility>

namespace str8ts {

namespace {

const char* axis_name(Axis axis) {
    return axis == Axis::Row ? "row" : "column";
}

size_t line_cell(Axis axis, size_t line, size_t pos) {
    return axis == Axis::Row ? Grid::index_of(line, pos) : Grid::index_of(pos, line);
}

/**
 * @brief x 変数を作成（ヒントは上下限に埋め込む）
 */
void add_cell_variables(const Grid& grid, Encoding& enc) {
    for (size_t i = 0; i < Grid::CELL_COUNT; ++i) {
        enc.x[i].fill(SIZE_MAX);
        const Cell& cell = grid.cell(i);
        if (!cell.is_white()) continue;

        for (CellValue k : cell_values(false)) {
            double lb = 0.0;
            double ub = 1.0;
            if (!cell.is_empty()) {
                // ヒントと一致する値は 1 に固定、それ以外は 0 に固定
                lb = ub = (cell.value == k) ? 1.0 : 0.0;
            }
            enc.x[i][to_int(k) - 1] = enc.model.add_binary_variable(
                "x_" + std::to_string(i) + "_" + std::to_string(to_int(k)), lb, ub);
        }
    }
}

/**
 * @brief y 変数を作成
 *
 * 連続列が収まらない最小値についても変数は作成し、0 に固定する。
 */
void add_compartment_variables(Encoding& enc) {
    enc.y.resize(enc.compartments.size());
    for (size_t c = 0; c < enc.compartments.size(); ++c) {
        size_t length = enc.compartments[c].size();
        for (CellValue k : cell_values(false)) {
            double ub = straight_fits(length, to_int(k)) ? 1.0 : 0.0;
            enc.y[c][to_int(k) - 1] = enc.model.add_binary_variable(
                "y_" + std::to_string(c) + "_" + std::to_string(to_int(k)), 0.0, ub);
        }
    }
}

/**
 * @brief 各 White セルはちょうど1つの数字を持つ
 */
void add_cell_constraints(const Grid& grid, Encoding& enc) {
    for (size_t i = 0; i < Grid::CELL_COUNT; ++i) {
        if (!grid.cell(i).is_white()) continue;
        std::vector<LinearTerm> terms;
        for (CellValue k : cell_values(false)) {
            terms.emplace_back(enc.x_var(i, k), 1.0);
        }
        enc.model.add_constraint("cell_" + std::to_string(i), std::move(terms), 1.0, 1.0);
    }
}

/**
 * @brief 行（列）内の一意性と Black セルの数字による除外
 */
void add_line_constraints(const Grid& grid, Encoding& enc, Axis axis, size_t line) {
    const std::string prefix = std::string(axis_name(axis)) + "_" + std::to_string(line);

    // White セル同士で同じ数字を使わない
    for (CellValue k : cell_values(false)) {
        std::vector<LinearTerm> terms;
        for (size_t pos = 0; pos < Grid::N; ++pos) {
            size_t i = line_cell(axis, line, pos);
            if (grid.cell(i).is_white()) {
                terms.emplace_back(enc.x_var(i, k), 1.0);
            }
        }
        enc.model.add_constraint(prefix + "_" + std::to_string(to_int(k)),
                                 std::move(terms), -kInfinity, 1.0);
    }

    // Black セルの数字（重複は不正な入力）
    std::set<CellValue> black_values;
    for (size_t pos = 0; pos < Grid::N; ++pos) {
        const Cell& cell = grid.cell(line_cell(axis, line, pos));
        if (cell.is_black() && !cell.is_empty()) {
            if (!black_values.insert(cell.value).second) {
                throw InvalidPuzzleError("There are duplicate values in the black cells of " +
                                         std::string(axis_name(axis)) + " " +
                                         std::to_string(line) + "!");
            }
        }
    }

    // Black セルの数字は同じ行（列）の White セルで使えない
    for (CellValue k : black_values) {
        for (size_t pos = 0; pos < Grid::N; ++pos) {
            size_t i = line_cell(axis, line, pos);
            if (!grid.cell(i).is_white()) continue;
            enc.model.add_constraint(
                prefix + "_black_" + std::to_string(to_int(k)) + "_" + std::to_string(i),
                {{enc.x_var(i, k), 1.0}}, -kInfinity, 0.0);
        }
    }
}

/**
 * @brief コンパートメント制約
 *
 * - 最小値はちょうど1つ: sum_k y[c][k] = 1
 * - 最小値 k なら k, ..., k+L-1 の各値がコンパートメント内に現れる:
 *   sum_{i in c} x[i][v] - y[c][k] >= 0
 */
void add_compartment_constraints(Encoding& enc) {
    for (size_t c = 0; c < enc.compartments.size(); ++c) {
        const auto& compartment = enc.compartments[c];
        const size_t length = compartment.size();

        std::vector<LinearTerm> min_terms;
        for (CellValue k : cell_values(false)) {
            min_terms.emplace_back(enc.y_var(c, k), 1.0);
        }
        enc.model.add_constraint("min_" + std::to_string(c), std::move(min_terms), 1.0, 1.0);

        for (CellValue k : cell_values(false)) {
            if (!straight_fits(length, to_int(k))) {
                break;
            }
            const int first = to_int(k);
            const int last = first + static_cast<int>(length) - 1;
            for (int v = first; v <= last; ++v) {
                std::vector<LinearTerm> terms;
                terms.reserve(length + 1);
                for (size_t i : compartment.cells) {
                    terms.emplace_back(enc.x_var(i, to_cell_value(v)), 1.0);
                }
                terms.emplace_back(enc.y_var(c, k), -1.0);
                enc.model.add_constraint("straight_" + std::to_string(c) + "_" +
                                             std::to_string(first) + "_" + std::to_string(v),
                                         std::move(terms), 0.0, kInfinity);
            }
        }
    }
}

} // namespace

Encoding encode(const Grid& grid) {
    return encode(grid, find_compartments(grid));
}

Encoding encode(const Grid& grid, std::vector<Compartment> compartments) {
    Encoding enc;
    enc.compartments = std::move(compartments);

    add_cell_variables(grid, enc);
    add_compartment_variables(enc);

    add_cell_constraints(grid, enc);
    for (size_t line = 0; line < Grid::N; ++line) {
        add_line_constraints(grid, enc, Axis::Row, line);
    }
    for (size_t line = 0; line < Grid::N; ++line) {
        add_line_constraints(grid, enc, Axis::Column, line);
    }
    add_compartment_constraints(enc);

    return enc;
}

} // namespace str8ts
