/**
 * @file grid.hpp
 * @brief 9x9 盤面クラス
 */
#ifndef STR8TS_GRID_HPP
#define STR8TS_GRID_HPP

#include "str8ts/cell.hpp"
#include <array>
#include <cstddef>
#include <ostream>
#include <string>

namespace str8ts {

/**
 * @brief Str8ts の盤面
 *
 * 81 セルを行優先で保持する。セルは (row, col) または
 * フラットインデックス index = row * 9 + col で参照する。
 */
class Grid {
public:
    static constexpr size_t N = 9;
    static constexpr size_t CELL_COUNT = N * N;

    /**
     * @brief 全セル White / Empty の盤面を作成
     */
    Grid() = default;

    static size_t index_of(size_t row, size_t col) { return row * N + col; }
    static size_t row_of(size_t index) { return index / N; }
    static size_t col_of(size_t index) { return index % N; }

    // ===== 参照 =====

    /**
     * @brief セルを取得
     * @throws std::out_of_range 範囲外の場合
     */
    const Cell& cell(size_t row, size_t col) const;
    const Cell& cell(size_t index) const;

    // ===== 編集 =====

    void set_cell(size_t row, size_t col, Cell cell);
    void set_cell(size_t index, Cell cell);
    void set_color(size_t row, size_t col, CellColor color);
    void set_color(size_t index, CellColor color);
    void set_value(size_t row, size_t col, CellValue value);
    void set_value(size_t index, CellValue value);

    /**
     * @brief セルの色を反転（値は保持）
     */
    void toggle_color(size_t row, size_t col);
    void toggle_color(size_t index);

    /**
     * @brief 全セルを White / Empty に戻す
     */
    void clear_all();

    /**
     * @brief 全セルの値を Empty にする（色は保持）
     */
    void clear_values();

    /**
     * @brief 別の盤面の内容をコピー
     */
    void copy_from(const Grid& other);

    // ===== 集計 =====

    size_t white_count() const;
    size_t black_count() const { return CELL_COUNT - white_count(); }

    /**
     * @brief 全 White セルに値が入っているか
     */
    bool is_filled() const;

    const std::array<Cell, CELL_COUNT>& cells() const { return cells_; }

    bool operator==(const Grid& other) const { return cells_ == other.cells_; }
    bool operator!=(const Grid& other) const { return !(*this == other); }

    /**
     * @brief デバッグ表示用の文字列（"White(5) Black( ) ..." 形式）
     */
    std::string to_string() const;

private:
    static void check_index(size_t index);
    static size_t checked_index(size_t row, size_t col);

    std::array<Cell, CELL_COUNT> cells_{};
};

std::ostream& operator<<(std::ostream& os, const Grid& grid);

} // namespace str8ts

#endif // STR8TS_GRID_HPP
