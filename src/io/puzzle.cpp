#include "str8ts/io/puzzle.hpp"
#include "puzzle_parser.hpp"
#include "parser.hpp"
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace str8ts {
namespace io {

namespace {

Grid finish(int result, ParserContext& ctx) {
    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }
    return ctx.grid;
}

} // namespace

Grid parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    yyscan_t scanner;
    if (yylex_init(&scanner) != 0) {
        fclose(file);
        throw std::runtime_error("Cannot initialize scanner");
    }
    yyset_in(file, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    fclose(file);

    return finish(result, ctx);
}

Grid parse_string(const std::string& input) {
    yyscan_t scanner;
    if (yylex_init(&scanner) != 0) {
        throw std::runtime_error("Cannot initialize scanner");
    }

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    return finish(result, ctx);
}

std::string format_grid(const Grid& grid) {
    std::ostringstream oss;
    for (size_t row = 0; row < Grid::N; ++row) {
        for (size_t col = 0; col < Grid::N; ++col) {
            const Cell& cell = grid.cell(row, col);
            if (col > 0) oss << ' ';
            if (cell.is_black()) {
                oss << '#';
                if (!cell.is_empty()) oss << to_char(cell.value);
            } else {
                oss << (cell.is_empty() ? '.' : to_char(cell.value));
            }
        }
        oss << '\n';
    }
    return oss.str();
}

} // namespace io
} // namespace str8ts
