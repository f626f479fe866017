/**
 * @file errors.hpp
 * @brief 例外クラス
 */
#ifndef STR8TS_ERRORS_HPP
#define STR8TS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace str8ts {

/**
 * @brief 不正なパズル入力（同一行・列の Black セルに同じ数字がある等）
 *
 * 解なしではなく、入力パズル自体が矛盾していることを表す。
 */
class InvalidPuzzleError : public std::logic_error {
public:
    explicit InvalidPuzzleError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief 内部整合性エラー（解の復元で White セルが空のまま等）
 *
 * エンコーディングの不具合を示す。通常の動作では発生しない。
 */
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief 外部 MIP ソルバーの呼び出し失敗
 */
class SolverError : public std::runtime_error {
public:
    explicit SolverError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace str8ts

#endif // STR8TS_ERRORS_HPP
