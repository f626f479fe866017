/**
 * @file scip_solver.hpp
 * @brief SCIP による MIP ソルバー実装
 */
#ifndef STR8TS_SCIP_SOLVER_HPP
#define STR8TS_SCIP_SOLVER_HPP

#include "str8ts/mip_solver.hpp"

namespace str8ts {

/**
 * @brief SCIP バックエンド
 *
 * solve() のたびに SCIP インスタンスを作成し、終了時に解放する。
 */
class ScipSolver : public MipSolver {
public:
    ScipSolver() = default;

    const char* name() const override { return "SCIP"; }

    MipResult solve(const LinearModel& model) override;
};

} // namespace str8ts

#endif // STR8TS_SCIP_SOLVER_HPP
