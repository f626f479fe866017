/**
 * @file linear_model.hpp
 * @brief ソルバー非依存の 0-1 線形モデル（変数・線形制約の管理）
 */
#ifndef STR8TS_LINEAR_MODEL_HPP
#define STR8TS_LINEAR_MODEL_HPP

#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace str8ts {

/**
 * @brief 無限大（線形制約の片側を開放するのに使用）
 */
constexpr double kInfinity = std::numeric_limits<double>::infinity();

/**
 * @brief 0-1 変数
 */
struct BinaryVariable {
    std::string name;
    double lb;  // lower bound (0 or 1)
    double ub;  // upper bound (0 or 1)

    bool is_fixed() const { return lb == ub; }
};

/**
 * @brief 線形制約の項（変数インデックスと係数）
 */
using LinearTerm = std::pair<size_t, double>;

/**
 * @brief 線形制約 lhs <= sum(coeff * x) <= rhs
 *
 * <= は lhs = -kInfinity、>= は rhs = kInfinity、= は lhs == rhs で表す。
 */
struct LinearConstraint {
    std::string name;
    std::vector<LinearTerm> terms;
    double lhs;
    double rhs;

    /**
     * @brief 割り当てに対する左辺値を計算
     */
    double activity(const std::vector<double>& values) const;
};

/**
 * @brief 0-1 線形モデル
 *
 * 目的関数は持たない（実行可能解を求める充足問題として扱う）。
 * 外部 MIP ソルバーへ渡す前の中間表現。
 */
class LinearModel {
public:
    LinearModel() = default;

    // ===== 変数・制約管理 =====

    /**
     * @brief 0-1 変数を作成して登録
     * @param name 変数名
     * @param lb 下限（0 または 1）
     * @param ub 上限（0 または 1）
     * @return 変数のインデックス
     * @throws std::invalid_argument 上下限が不正な場合
     */
    size_t add_binary_variable(std::string name, double lb = 0.0, double ub = 1.0);

    /**
     * @brief 線形制約を追加
     * @param name 制約名
     * @param terms 項のリスト
     * @param lhs 左辺の下限（-kInfinity 可）
     * @param rhs 右辺の上限（kInfinity 可）
     * @return 制約のインデックス
     * @throws std::out_of_range 未登録の変数を参照した場合
     * @throws std::invalid_argument lhs > rhs の場合
     */
    size_t add_constraint(std::string name, std::vector<LinearTerm> terms,
                          double lhs, double rhs);

    /**
     * @brief 変数リストを取得
     */
    const std::vector<BinaryVariable>& variables() const { return variables_; }

    /**
     * @brief 制約リストを取得
     */
    const std::vector<LinearConstraint>& constraints() const { return constraints_; }

    /**
     * @brief IDで変数を取得
     * @throws std::out_of_range
     */
    const BinaryVariable& variable(size_t id) const;

    /**
     * @brief 名前から変数インデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t find_variable_index(const std::string& name) const;

    size_t num_variables() const { return variables_.size(); }
    size_t num_constraints() const { return constraints_.size(); }

    /**
     * @brief 割り当てが全ての上下限・制約を満たすか確認
     * @param values 変数ごとの値（variables() と同じ順）
     * @param tolerance 許容誤差
     */
    bool is_feasible(const std::vector<double>& values, double tolerance = 1e-6) const;

    /**
     * @brief 最初に違反している制約のインデックス
     * @return 違反がなければ SIZE_MAX
     */
    size_t first_violated_constraint(const std::vector<double>& values,
                                     double tolerance = 1e-6) const;

private:
    std::vector<BinaryVariable> variables_;
    std::vector<LinearConstraint> constraints_;
    std::map<std::string, size_t> name_to_id_;
};

} // namespace str8ts

#endif // STR8TS_LINEAR_MODEL_HPP
