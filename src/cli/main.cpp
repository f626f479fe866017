#include "str8ts/io/puzzle.hpp"
#include "str8ts/solver.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-c] [-t SEC] <puzzle-file>\n";
    std::cerr << "  -s      Print solver statistics to stderr\n";
    std::cerr << "  -v      Verbose mode (print compartments and SCIP output)\n";
    std::cerr << "  -c      Check the solution against the puzzle rules\n";
    std::cerr << "  -t SEC  Time limit in seconds\n";
}

bool g_print_stats = false;
bool g_verbose = false;
bool g_check = false;

void print_stats(const str8ts::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "% Stats: white_cells=" << s.white_cells
              << " compartments=" << s.compartments
              << " variables=" << s.variables
              << " fixed=" << s.fixed_variables
              << " constraints=" << s.constraints
              << " status=" << solver.last_status()
              << " time=" << s.solve_seconds << "s"
              << "\n";
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;
    double time_limit = 0.0;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-c") == 0) {
            g_check = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            time_limit = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto puzzle = str8ts::io::parse_file(filename);

        str8ts::Solver solver;
        solver.set_verbose(g_verbose);
        solver.set_time_limit(time_limit);

        auto solved = solver.solve(puzzle);
        print_stats(solver);

        if (!solved) {
            if (solver.last_status() == str8ts::MipStatus::Infeasible) {
                std::cout << "=====UNSATISFIABLE=====\n";
            } else {
                std::cout << "=====UNKNOWN=====\n";
            }
            return 0;
        }

        std::cout << str8ts::io::format_grid(*solved);
        std::cout << "----------\n";

        if (g_check && !str8ts::is_valid_solution(puzzle, *solved)) {
            std::cerr << "Error: solution violates the puzzle rules\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
