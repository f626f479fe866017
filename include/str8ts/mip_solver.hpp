/**
 * @file mip_solver.hpp
 * @brief 外部 MIP ソルバーのインターフェース
 */
#ifndef STR8TS_MIP_SOLVER_HPP
#define STR8TS_MIP_SOLVER_HPP

#include "str8ts/linear_model.hpp"
#include <ostream>
#include <vector>

namespace str8ts {

/**
 * @brief 求解結果の状態
 */
enum class MipStatus {
    Optimal,     // 実行可能解が見つかった（目的関数は定数）
    Infeasible,  // 解が存在しない
    Limit,       // 時間制限などで打ち切り
    Unknown,     // 不明
    Error        // ソルバー内部のエラー
};

const char* to_string(MipStatus status);
std::ostream& operator<<(std::ostream& os, MipStatus status);

/**
 * @brief 求解結果
 *
 * values は status == Optimal のときのみ有効で、
 * LinearModel::variables() と同じ順に並ぶ。
 */
struct MipResult {
    MipStatus status = MipStatus::Unknown;
    std::vector<double> values;
};

/**
 * @brief MIP ソルバーの基底クラス
 *
 * LinearModel を受け取り、1回だけ求解する（リトライはしない）。
 */
class MipSolver {
public:
    virtual ~MipSolver() = default;

    /**
     * @brief ソルバー名を取得
     */
    virtual const char* name() const = 0;

    /**
     * @brief モデルを解く
     * @throws SolverError ソルバーの呼び出しに失敗した場合
     */
    virtual MipResult solve(const LinearModel& model) = 0;

    /**
     * @brief 詳細出力を有効/無効にする
     */
    virtual void set_verbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief 時間制限を設定（秒、0 以下で無制限）
     */
    virtual void set_time_limit(double seconds) { time_limit_ = seconds; }

    bool verbose() const { return verbose_; }
    double time_limit() const { return time_limit_; }

protected:
    bool verbose_ = false;
    double time_limit_ = 0.0;
};

} // namespace str8ts

#endif // STR8TS_MIP_SOLVER_HPP
