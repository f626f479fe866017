/**
 * @file puzzle.hpp
 * @brief パズルファイルの読み書き
 */
#ifndef STR8TS_IO_PUZZLE_HPP
#define STR8TS_IO_PUZZLE_HPP

#include "str8ts/grid.hpp"
#include <string>

namespace str8ts {
namespace io {

/**
 * @brief パズルファイルをパース
 * @param filename ファイル名
 * @return パースされた盤面
 * @throws std::runtime_error ファイルが開けない場合、パースエラー時
 */
Grid parse_file(const std::string& filename);

/**
 * @brief パズル文字列をパース
 * @param input 入力文字列
 * @return パースされた盤面
 * @throws std::runtime_error パースエラー時
 */
Grid parse_string(const std::string& input);

/**
 * @brief 盤面をパズルファイル形式の文字列に変換
 *
 * parse_string() で読み戻せる。
 */
std::string format_grid(const Grid& grid);

} // namespace io
} // namespace str8ts

#endif // STR8TS_IO_PUZZLE_HPP
