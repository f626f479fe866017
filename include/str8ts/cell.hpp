/**
 * @file cell.hpp
 * @brief セルの色・値の定義
 */
#ifndef STR8TS_CELL_HPP
#define STR8TS_CELL_HPP

#include <cstdint>
#include <ostream>
#include <vector>

namespace str8ts {

/**
 * @brief セルの色
 *
 * White: 1〜9 の数字を埋めるセル
 * Black: 壁（任意で数字を持ち、行・列の除外制約としてのみ働く）
 */
enum class CellColor : uint8_t {
    White,
    Black
};

/**
 * @brief セルの値（Empty は One より小さい）
 */
enum class CellValue : uint8_t {
    Empty = 0,
    One,
    Two,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine
};

/**
 * @brief 整数から値に変換（1〜9 以外は Empty）
 */
CellValue to_cell_value(int digit);

/**
 * @brief 文字から値に変換（'1'〜'9' 以外は Empty）
 */
CellValue to_cell_value(char c);

/**
 * @brief 値を整数に変換（Empty は 0）
 */
inline int to_int(CellValue value) { return static_cast<int>(value); }

/**
 * @brief 値を文字に変換（Empty は ' '）
 */
char to_char(CellValue value);

/**
 * @brief 値の列挙
 * @param with_empty true なら先頭に Empty を含める
 * @return [Empty,] One, ..., Nine
 */
std::vector<CellValue> cell_values(bool with_empty);

/**
 * @brief セル（色と値の組）
 */
struct Cell {
    CellColor color = CellColor::White;
    CellValue value = CellValue::Empty;

    Cell() = default;
    Cell(CellColor c, CellValue v) : color(c), value(v) {}

    bool is_white() const { return color == CellColor::White; }
    bool is_black() const { return color == CellColor::Black; }
    bool is_empty() const { return value == CellValue::Empty; }

    bool operator==(const Cell& other) const {
        return color == other.color && value == other.value;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, CellColor color);
std::ostream& operator<<(std::ostream& os, CellValue value);
std::ostream& operator<<(std::ostream& os, const Cell& cell);

} // namespace str8ts

#endif // STR8TS_CELL_HPP
