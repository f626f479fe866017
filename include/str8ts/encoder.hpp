/**
 * @file encoder.hpp
 * @brief 盤面から 0-1 線形モデルへのエンコーディング
 */
#ifndef STR8TS_ENCODER_HPP
#define STR8TS_ENCODER_HPP

#include "str8ts/compartment.hpp"
#include "str8ts/grid.hpp"
#include "str8ts/linear_model.hpp"
#include <array>
#include <cstddef>
#include <vector>

namespace str8ts {

/**
 * @brief エンコード結果
 *
 * 変数:
 * - x[i][k-1]: White セル i が数字 k を持つ（Black セルは SIZE_MAX）
 * - y[c][k-1]: コンパートメント c の最小値が k
 */
struct Encoding {
    LinearModel model;
    std::vector<Compartment> compartments;
    std::array<std::array<size_t, 9>, Grid::CELL_COUNT> x;
    std::vector<std::array<size_t, 9>> y;

    /**
     * @brief x 変数のインデックス
     * @pre value != CellValue::Empty
     */
    size_t x_var(size_t cell, CellValue value) const { return x[cell][to_int(value) - 1]; }

    /**
     * @brief y 変数のインデックス
     * @pre value != CellValue::Empty
     */
    size_t y_var(size_t compartment, CellValue value) const {
        return y[compartment][to_int(value) - 1];
    }
};

/**
 * @brief 長さ length のコンパートメントが最小値 k から始まれるか
 *
 * 連続列 k, ..., k + length - 1 が 9 を超えないこと。
 */
inline bool straight_fits(size_t length, int k) {
    return length <= static_cast<size_t>(9 - k + 1);
}

/**
 * @brief 盤面をエンコード（コンパートメントも内部で検出）
 * @throws InvalidPuzzleError 同一行・列の Black セルに重複した数字がある場合
 */
Encoding encode(const Grid& grid);

/**
 * @brief 検出済みのコンパートメントを使って盤面をエンコード
 * @throws InvalidPuzzleError 同一行・列の Black セルに重複した数字がある場合
 */
Encoding encode(const Grid& grid, std::vector<Compartment> compartments);

} // namespace str8ts

#endif // STR8TS_ENCODER_HPP
