/**
 * @file compartment.hpp
 * @brief コンパートメント（行・列内の連続する White セル列）の検出
 */
#ifndef STR8TS_COMPARTMENT_HPP
#define STR8TS_COMPARTMENT_HPP

#include "str8ts/grid.hpp"
#include <cstddef>
#include <vector>

namespace str8ts {

/**
 * @brief コンパートメントの向き
 */
enum class Axis {
    Row,
    Column
};

/**
 * @brief コンパートメント
 *
 * 同一行（または列）内で Black セル・盤端に挟まれた極大な White セル列。
 * cells は行コンパートメントなら列の昇順、列コンパートメントなら行の昇順。
 */
struct Compartment {
    Axis axis;
    size_t line;                // 行番号または列番号
    std::vector<size_t> cells;  // フラットインデックス

    size_t size() const { return cells.size(); }
};

/**
 * @brief 全行のコンパートメントを検出
 */
std::vector<Compartment> find_row_compartments(const Grid& grid);

/**
 * @brief 全列のコンパートメントを検出
 */
std::vector<Compartment> find_column_compartments(const Grid& grid);

/**
 * @brief 全コンパートメントを検出（行 → 列の順）
 *
 * 各 White セルはちょうど1つの行コンパートメントと
 * ちょうど1つの列コンパートメントに属する。
 */
std::vector<Compartment> find_compartments(const Grid& grid);

} // namespace str8ts

#endif // STR8TS_COMPARTMENT_HPP
