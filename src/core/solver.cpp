#include "str8ts/solver.hpp"
#include "str8ts/compartment.hpp"
#include "str8ts/encoder.hpp"
#include "str8ts/extractor.hpp"
#include "str8ts/scip_solver.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <set>
#include <stdexcept>

namespace str8ts {

Solver::Solver() : Solver(std::make_unique<ScipSolver>()) {}

Solver::Solver(std::unique_ptr<MipSolver> backend) : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("Solver requires a MIP backend");
    }
}

void Solver::set_verbose(bool verbose) {
    verbose_ = verbose;
    backend_->set_verbose(verbose);
}

std::optional<Grid> Solver::solve(const Grid& puzzle) {
    stats_ = SolverStats();
    last_status_ = MipStatus::Unknown;

    auto compartments = find_compartments(puzzle);
    if (verbose_) {
        std::cerr << "% [verbose] " << compartments.size() << " compartments\n";
        for (const auto& c : compartments) {
            std::cerr << "% [verbose]   " << (c.axis == Axis::Row ? "row " : "col ") << c.line
                      << ":";
            for (size_t index : c.cells) {
                std::cerr << " (" << Grid::row_of(index) << "," << Grid::col_of(index) << ")";
            }
            std::cerr << "\n";
        }
    }

    Encoding enc = encode(puzzle, std::move(compartments));

    stats_.white_cells = puzzle.white_count();
    stats_.compartments = enc.compartments.size();
    stats_.variables = enc.model.num_variables();
    stats_.fixed_variables = static_cast<size_t>(
        std::count_if(enc.model.variables().begin(), enc.model.variables().end(),
                      [](const BinaryVariable& v) { return v.is_fixed(); }));
    stats_.constraints = enc.model.num_constraints();

    auto start = std::chrono::steady_clock::now();
    MipResult result = backend_->solve(enc.model);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    stats_.solve_seconds = elapsed.count();
    last_status_ = result.status;

    if (result.status != MipStatus::Optimal) {
        if (verbose_) {
            std::cerr << "% [verbose] no solution (" << result.status << ")\n";
        }
        return std::nullopt;
    }

    if (verbose_ && result.values.size() == enc.model.num_variables()) {
        size_t violated = enc.model.first_violated_constraint(result.values, 1e-4);
        if (violated != SIZE_MAX) {
            std::cerr << "% [verbose] warning: backend solution violates "
                      << enc.model.constraints()[violated].name << "\n";
        }
    }

    return extract_solution(puzzle, enc, result.values);
}

bool is_valid_solution(const Grid& puzzle, const Grid& solved) {
    for (size_t i = 0; i < Grid::CELL_COUNT; ++i) {
        const Cell& in = puzzle.cell(i);
        const Cell& out = solved.cell(i);
        if (in.color != out.color) return false;
        if (in.is_black() && in.value != out.value) return false;
        if (in.is_white()) {
            if (out.is_empty()) return false;
            if (!in.is_empty() && in.value != out.value) return false;
        }
    }

    // 行・列内で数字（White と Black のヒント）が重複しない
    for (size_t line = 0; line < Grid::N; ++line) {
        std::set<CellValue> row_seen;
        std::set<CellValue> col_seen;
        for (size_t pos = 0; pos < Grid::N; ++pos) {
            const Cell& r = solved.cell(line, pos);
            const Cell& c = solved.cell(pos, line);
            if (!r.is_empty() && !row_seen.insert(r.value).second) return false;
            if (!c.is_empty() && !col_seen.insert(c.value).second) return false;
        }
    }

    // コンパートメントの数字が連続している
    for (const auto& compartment : find_compartments(solved)) {
        std::set<int> digits;
        for (size_t i : compartment.cells) {
            digits.insert(to_int(solved.cell(i).value));
        }
        if (digits.size() != compartment.size()) return false;
        if (*digits.rbegin() - *digits.begin() + 1 != static_cast<int>(compartment.size())) {
            return false;
        }
    }
    return true;
}

} // namespace str8ts
