#include "str8ts/extractor.hpp"
#include "str8ts/errors.hpp"
#include <string>

namespace str8ts {

Grid extract_solution(const Grid& grid, const Encoding& encoding,
                      const std::vector<double>& values) {
    if (values.size() != encoding.model.num_variables()) {
        throw InternalError("Solution has " + std::to_string(values.size()) +
                            " values but the model has " +
                            std::to_string(encoding.model.num_variables()) + " variables");
    }

    Grid solved;
    for (size_t i = 0; i < Grid::CELL_COUNT; ++i) {
        const Cell& cell = grid.cell(i);
        if (!cell.is_white()) {
            solved.set_cell(i, cell);
            continue;
        }
        Cell result(CellColor::White, CellValue::Empty);
        for (CellValue k : cell_values(false)) {
            // ソルバーの浮動小数点誤差を許容
            if (values[encoding.x_var(i, k)] >= 0.5) {
                result.value = k;
            }
        }
        solved.set_cell(i, result);
    }

    for (size_t i = 0; i < Grid::CELL_COUNT; ++i) {
        const Cell& cell = solved.cell(i);
        if (cell.is_white() && cell.is_empty()) {
            throw InternalError("Cell with index " + std::to_string(i) + " has no value!");
        }
    }
    return solved;
}

} // namespace str8ts
