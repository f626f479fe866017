/**
 * @file extractor.hpp
 * @brief 実行可能解から盤面への復元
 */
#ifndef STR8TS_EXTRACTOR_HPP
#define STR8TS_EXTRACTOR_HPP

#include "str8ts/encoder.hpp"
#include "str8ts/grid.hpp"
#include <vector>

namespace str8ts {

/**
 * @brief 解を盤面に書き戻した新しい盤面を作成
 *
 * White セルには x 変数の値が 0.5 以上の数字を、
 * Black セルには元の (color, value) をそのまま設定する。
 *
 * @param grid 元の盤面（変更しない）
 * @param encoding grid のエンコード結果
 * @param values encoding.model の変数順に並んだ値
 * @return 解かれた盤面
 * @throws InternalError White セルが空のまま残った場合
 */
Grid extract_solution(const Grid& grid, const Encoding& encoding,
                      const std::vector<double>& values);

} // namespace str8ts

#endif // STR8TS_EXTRACTOR_HPP
