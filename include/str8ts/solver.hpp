/**
 * @file solver.hpp
 * @brief Str8ts ソルバー（コンパートメント検出 → エンコード → MIP 求解 → 復元）
 */
#ifndef STR8TS_SOLVER_HPP
#define STR8TS_SOLVER_HPP

#include "str8ts/grid.hpp"
#include "str8ts/mip_solver.hpp"
#include <cstddef>
#include <memory>
#include <optional>

namespace str8ts {

/**
 * @brief ソルバー統計情報（直前の solve() のもの）
 */
struct SolverStats {
    size_t white_cells = 0;
    size_t compartments = 0;
    size_t variables = 0;
    size_t fixed_variables = 0;
    size_t constraints = 0;
    double solve_seconds = 0.0;
};

/**
 * @brief Str8ts ソルバー
 *
 * 入力盤面は変更せず、解けた場合は新しい盤面を返す。
 * 呼び出し間で状態を共有しない（統計情報と最後の状態のみ保持）。
 */
class Solver {
public:
    /**
     * @brief SCIP バックエンドでソルバーを作成
     */
    Solver();

    /**
     * @brief 任意のバックエンドでソルバーを作成
     */
    explicit Solver(std::unique_ptr<MipSolver> backend);

    /**
     * @brief パズルを解く
     * @param puzzle 入力盤面
     * @return 解けた盤面、解がなければ std::nullopt
     * @throws InvalidPuzzleError 入力が矛盾している場合
     * @throws InternalError 解の復元に失敗した場合
     * @throws SolverError バックエンドの呼び出しに失敗した場合
     */
    std::optional<Grid> solve(const Grid& puzzle);

    /**
     * @brief 直前の solve() でのバックエンドの状態
     *
     * solve() は Optimal 以外を全て「解なし」として扱うが、
     * 解なし (Infeasible) と打ち切り (Limit) はここで区別できる。
     */
    MipStatus last_status() const { return last_status_; }

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief 詳細出力を有効/無効にする
     */
    void set_verbose(bool verbose);

    /**
     * @brief 時間制限を設定（秒、0 以下で無制限）
     */
    void set_time_limit(double seconds) { backend_->set_time_limit(seconds); }

    const MipSolver& backend() const { return *backend_; }

private:
    std::unique_ptr<MipSolver> backend_;
    MipStatus last_status_ = MipStatus::Unknown;
    SolverStats stats_;
    bool verbose_ = false;
};

/**
 * @brief 解がパズルの規則を満たすか確認
 *
 * - Black セルとヒントが保持されている
 * - 全 White セルに値がある
 * - 行・列内で White セル同士、White セルと Black セルの数字が重複しない
 * - 各コンパートメントの数字が連続している
 */
bool is_valid_solution(const Grid& puzzle, const Grid& solved);

} // namespace str8ts

#endif // STR8TS_SOLVER_HPP
