#include "str8ts/scip_solver.hpp"
#include "str8ts/errors.hpp"
#include <scip/scip.h>
#include <scip/scipdefplugins.h>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace str8ts {

namespace {

void check_retcode(SCIP_RETCODE retcode, const char* call) {
    if (retcode != SCIP_OKAY) {
        throw SolverError("SCIP call failed with return code " +
                          std::to_string(static_cast<int>(retcode)) + ": " + call);
    }
}

#define STR8TS_SCIP_CALL(x) check_retcode((x), #x)

/**
 * @brief SCIP 環境と、作成した変数・制約の所有者
 *
 * デストラクタで全て解放する（例外送出時も含む）。
 */
struct ScipInstance {
    SCIP* scip = nullptr;
    std::vector<SCIP_VAR*> vars;
    std::vector<SCIP_CONS*> conss;

    ScipInstance() { STR8TS_SCIP_CALL(SCIPcreate(&scip)); }

    ScipInstance(const ScipInstance&) = delete;
    ScipInstance& operator=(const ScipInstance&) = delete;

    ~ScipInstance() {
        if (!scip) return;
        bool ok = true;
        for (auto& var : vars) {
            ok = (SCIPreleaseVar(scip, &var) == SCIP_OKAY) && ok;
        }
        for (auto& cons : conss) {
            ok = (SCIPreleaseCons(scip, &cons) == SCIP_OKAY) && ok;
        }
        ok = (SCIPfree(&scip) == SCIP_OKAY) && ok;
        if (!ok) {
            std::cerr << "% [scip] failed to release SCIP resources\n";
        }
    }
};

double to_scip_bound(SCIP* scip, double value) {
    if (std::isinf(value)) {
        return value > 0 ? SCIPinfinity(scip) : -SCIPinfinity(scip);
    }
    return value;
}

MipStatus to_mip_status(SCIP_STATUS status) {
    switch (status) {
        case SCIP_STATUS_OPTIMAL:
            return MipStatus::Optimal;
        case SCIP_STATUS_INFEASIBLE:
            return MipStatus::Infeasible;
        case SCIP_STATUS_USERINTERRUPT:
        case SCIP_STATUS_NODELIMIT:
        case SCIP_STATUS_TOTALNODELIMIT:
        case SCIP_STATUS_STALLNODELIMIT:
        case SCIP_STATUS_TIMELIMIT:
        case SCIP_STATUS_MEMLIMIT:
        case SCIP_STATUS_GAPLIMIT:
        case SCIP_STATUS_SOLLIMIT:
        case SCIP_STATUS_BESTSOLLIMIT:
        case SCIP_STATUS_RESTARTLIMIT:
            return MipStatus::Limit;
        default:
            return MipStatus::Unknown;
    }
}

} // namespace

MipResult ScipSolver::solve(const LinearModel& model) {
    ScipInstance inst;
    SCIP* scip = inst.scip;

    STR8TS_SCIP_CALL(SCIPincludeDefaultPlugins(scip));
    STR8TS_SCIP_CALL(SCIPcreateProbBasic(scip, "Str8ts"));
    // 充足問題なので目的関数は 0、向きは任意
    STR8TS_SCIP_CALL(SCIPsetObjsense(scip, SCIP_OBJSENSE_MINIMIZE));
    STR8TS_SCIP_CALL(SCIPsetIntParam(scip, "display/verblevel", verbose_ ? 4 : 0));
    if (time_limit_ > 0.0) {
        STR8TS_SCIP_CALL(SCIPsetRealParam(scip, "limits/time", time_limit_));
    }

    if (verbose_) {
        std::cerr << "% [verbose] building SCIP problem: " << model.num_variables()
                  << " variables, " << model.num_constraints() << " constraints\n";
    }

    inst.vars.reserve(model.num_variables());
    for (const auto& v : model.variables()) {
        SCIP_VAR* var = nullptr;
        STR8TS_SCIP_CALL(SCIPcreateVarBasic(scip, &var, v.name.c_str(), v.lb, v.ub, 0.0,
                                            SCIP_VARTYPE_BINARY));
        inst.vars.push_back(var);
        STR8TS_SCIP_CALL(SCIPaddVar(scip, var));
    }

    inst.conss.reserve(model.num_constraints());
    for (const auto& c : model.constraints()) {
        SCIP_CONS* cons = nullptr;
        STR8TS_SCIP_CALL(SCIPcreateConsBasicLinear(scip, &cons, c.name.c_str(), 0, nullptr, nullptr,
                                                   to_scip_bound(scip, c.lhs),
                                                   to_scip_bound(scip, c.rhs)));
        inst.conss.push_back(cons);
        for (const auto& [var_idx, coeff] : c.terms) {
            STR8TS_SCIP_CALL(SCIPaddCoefLinear(scip, cons, inst.vars[var_idx], coeff));
        }
        STR8TS_SCIP_CALL(SCIPaddCons(scip, cons));
    }

    STR8TS_SCIP_CALL(SCIPsolve(scip));

    MipResult result;
    result.status = to_mip_status(SCIPgetStatus(scip));
    if (verbose_) {
        std::cerr << "% [verbose] SCIP finished: status=" << result.status
                  << " time=" << SCIPgetSolvingTime(scip) << "s"
                  << " nodes=" << SCIPgetNNodes(scip) << "\n";
    }
    if (result.status != MipStatus::Optimal) {
        return result;
    }

    SCIP_SOL* sol = SCIPgetBestSol(scip);
    if (!sol && !inst.vars.empty()) {
        result.status = MipStatus::Unknown;
        return result;
    }
    result.values.reserve(inst.vars.size());
    for (SCIP_VAR* var : inst.vars) {
        result.values.push_back(SCIPgetSolVal(scip, sol, var));
    }
    return result;
}

} // namespace str8ts
