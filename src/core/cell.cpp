#include "str8ts/cell.hpp"

namespace str8ts {

CellValue to_cell_value(int digit) {
    if (digit < 1 || digit > 9) {
        return CellValue::Empty;
    }
    return static_cast<CellValue>(digit);
}

CellValue to_cell_value(char c) {
    if (c < '1' || c > '9') {
        return CellValue::Empty;
    }
    return static_cast<CellValue>(c - '0');
}

char to_char(CellValue value) {
    if (value == CellValue::Empty) {
        return ' ';
    }
    return static_cast<char>('0' + to_int(value));
}

std::vector<CellValue> cell_values(bool with_empty) {
    std::vector<CellValue> values;
    values.reserve(10);
    for (int v = with_empty ? 0 : 1; v <= 9; ++v) {
        values.push_back(static_cast<CellValue>(v));
    }
    return values;
}

std::ostream& operator<<(std::ostream& os, CellColor color) {
    return os << (color == CellColor::White ? "White" : "Black");
}

std::ostream& operator<<(std::ostream& os, CellValue value) {
    return os << to_char(value);
}

std::ostream& operator<<(std::ostream& os, const Cell& cell) {
    return os << cell.color << "(" << cell.value << ")";
}

} // namespace str8ts
