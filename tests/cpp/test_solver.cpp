#include <catch2/catch_test_macros.hpp>
#include "str8ts/solver.hpp"
#include "str8ts/encoder.hpp"
#include "str8ts/errors.hpp"
#include "sample_puzzles.hpp"
#include <memory>
#include <stdexcept>

using namespace str8ts;
using namespace str8ts_test;

namespace {

/**
 * @brief 固定の状態を返すバックエンド
 */
class StatusBackend : public MipSolver {
public:
    explicit StatusBackend(MipStatus status) : status_(status) {}

    const char* name() const override { return "status"; }

    MipResult solve(const LinearModel&) override {
        ++calls;
        MipResult result;
        result.status = status_;
        return result;
    }

    int calls = 0;

private:
    MipStatus status_;
};

/**
 * @brief 既知の解答を返すバックエンド
 *
 * 変数の並びは White/Black の配置だけで決まるので、
 * 解答盤面をエンコードした変数値をそのまま返せる。
 */
class KnownSolutionBackend : public MipSolver {
public:
    explicit KnownSolutionBackend(Grid solution) : solution_(solution) {}

    const char* name() const override { return "known"; }

    MipResult solve(const LinearModel& model) override {
        auto enc = encode(solution_);
        MipResult result;
        result.status = MipStatus::Optimal;
        result.values = assignment_from(enc, solution_);
        REQUIRE(result.values.size() == model.num_variables());
        return result;
    }

private:
    Grid solution_;
};

} // namespace

// ============================================================================
// Solver pipeline with stub backends
// ============================================================================

TEST_CASE("Solver returns the backend solution", "[solver]") {
    Solver solver(std::make_unique<KnownSolutionBackend>(latin_solution()));
    auto puzzle = latin_puzzle();

    auto solved = solver.solve(puzzle);
    REQUIRE(solved.has_value());
    REQUIRE(*solved == latin_solution());
    REQUIRE(solver.last_status() == MipStatus::Optimal);
    REQUIRE(puzzle == latin_puzzle());
}

TEST_CASE("Solver collapses non-optimal statuses", "[solver]") {
    auto puzzle = latin_puzzle();

    SECTION("infeasible") {
        Solver solver(std::make_unique<StatusBackend>(MipStatus::Infeasible));
        REQUIRE(!solver.solve(puzzle).has_value());
        REQUIRE(solver.last_status() == MipStatus::Infeasible);
    }

    SECTION("limit") {
        Solver solver(std::make_unique<StatusBackend>(MipStatus::Limit));
        REQUIRE(!solver.solve(puzzle).has_value());
        REQUIRE(solver.last_status() == MipStatus::Limit);
    }

    SECTION("unknown") {
        Solver solver(std::make_unique<StatusBackend>(MipStatus::Unknown));
        REQUIRE(!solver.solve(puzzle).has_value());
        REQUIRE(solver.last_status() == MipStatus::Unknown);
    }
}

TEST_CASE("Solver makes one backend call per solve", "[solver]") {
    auto backend = std::make_unique<StatusBackend>(MipStatus::Infeasible);
    auto* raw = backend.get();
    Solver solver(std::move(backend));

    REQUIRE(!solver.solve(Grid()).has_value());
    REQUIRE(raw->calls == 1);
    REQUIRE(!solver.solve(Grid()).has_value());
    REQUIRE(raw->calls == 2);
}

TEST_CASE("Solver forwards configuration to the backend", "[solver]") {
    Solver solver(std::make_unique<StatusBackend>(MipStatus::Infeasible));
    solver.set_verbose(true);
    solver.set_time_limit(2.5);
    REQUIRE(solver.backend().verbose());
    REQUIRE(solver.backend().time_limit() == 2.5);
}

TEST_CASE("Solver statistics", "[solver]") {
    Solver solver(std::make_unique<StatusBackend>(MipStatus::Infeasible));
    Grid g;
    g.set_value(0, CellValue::One);
    solver.solve(g);

    const auto& s = solver.stats();
    REQUIRE(s.white_cells == 81);
    REQUIRE(s.compartments == 18);
    REQUIRE(s.variables == 891);
    REQUIRE(s.constraints == 423);
    // ヒント 1 セル分の x (9) + 長さ 9 の y (18 * 8)
    REQUIRE(s.fixed_variables == 9 + 18 * 8);
}

TEST_CASE("Solver propagates malformed input", "[solver][error]") {
    Solver solver(std::make_unique<StatusBackend>(MipStatus::Optimal));
    Grid g;
    g.set_cell(0, 0, Cell(CellColor::Black, CellValue::Four));
    g.set_cell(0, 8, Cell(CellColor::Black, CellValue::Four));
    REQUIRE_THROWS_AS(solver.solve(g), InvalidPuzzleError);
}

TEST_CASE("Solver reports an encoding mismatch", "[solver][error]") {
    // Optimal だが値がない: 復元時の内部エラー
    Solver solver(std::make_unique<StatusBackend>(MipStatus::Optimal));
    REQUIRE_THROWS_AS(solver.solve(latin_puzzle()), InternalError);
}

TEST_CASE("Solver requires a backend", "[solver][error]") {
    REQUIRE_THROWS_AS(Solver(std::unique_ptr<MipSolver>()), std::invalid_argument);
}

// ============================================================================
// is_valid_solution
// ============================================================================

TEST_CASE("is_valid_solution", "[solver][validation]") {
    auto puzzle = latin_puzzle();

    SECTION("known solution") {
        REQUIRE(is_valid_solution(puzzle, latin_solution()));
        REQUIRE(is_valid_solution(Grid(), all_white_solution()));
        REQUIRE(is_valid_solution(all_black(), all_black()));
    }

    SECTION("unsolved puzzle") {
        REQUIRE(!is_valid_solution(puzzle, puzzle));
    }

    SECTION("clue changed") {
        auto bad = latin_solution();
        bad.set_value(8, CellValue::Two);
        REQUIRE(!is_valid_solution(puzzle, bad));
    }

    SECTION("black cell changed") {
        auto bad = latin_solution();
        bad.set_value(0, CellValue::Empty);
        REQUIRE(!is_valid_solution(puzzle, bad));
    }

    SECTION("color changed") {
        auto bad = latin_solution();
        bad.set_color(1, CellColor::Black);
        REQUIRE(!is_valid_solution(puzzle, bad));
    }

    SECTION("white repeats a black clue") {
        Grid p = all_black();
        p.set_cell(0, 0, Cell(CellColor::Black, CellValue::Three));
        p.set_color(0, 4, CellColor::White);
        Grid s = p;
        s.set_value(0, 4, CellValue::Three);
        REQUIRE(!is_valid_solution(p, s));
        s.set_value(0, 4, CellValue::Four);
        REQUIRE(is_valid_solution(p, s));
    }

    SECTION("straight broken") {
        Grid p = all_black();
        p.set_color(2, 3, CellColor::White);
        p.set_color(2, 4, CellColor::White);
        Grid s = p;
        s.set_value(2, 3, CellValue::One);
        s.set_value(2, 4, CellValue::Three);
        REQUIRE(!is_valid_solution(p, s));
        s.set_value(2, 3, CellValue::Two);
        REQUIRE(is_valid_solution(p, s));
    }
}
