#include "frac_parser.hpp"
#include "parser.hpp"
#include <cstdio>

namespace fractran {
namespace frac {

Source parse_file(const std::string& filename) {
    FILE* file = std::fopen(filename.c_str(), "r");
    if (!file) {
        throw ConfigurationError("Cannot open file: " + filename);
    }

    yyscan_t scanner;
    if (yylex_init(&scanner) != 0) {
        std::fclose(file);
        throw ConfigurationError("Cannot initialize scanner");
    }
    yyset_in(file, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    std::fclose(file);

    if (result != 0 || ctx.has_error) {
        throw ConfigurationError(filename + ": parse error: " + ctx.error_message);
    }

    return std::move(ctx.source);
}

Source parse_string(const std::string& input) {
    yyscan_t scanner;
    if (yylex_init(&scanner) != 0) {
        throw ConfigurationError("Cannot initialize scanner");
    }

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    if (result != 0 || ctx.has_error) {
        throw ConfigurationError("parse error: " + ctx.error_message);
    }

    return std::move(ctx.source);
}

} // namespace frac
} // namespace fractran
