#include "text_parser.hpp"
#include "parser.hpp"
#include <stdexcept>

namespace crossfill {
namespace io {

TextLines parse_text_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    yyscan_t scanner;
    yylex_init(&scanner);
    yyset_in(file, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    fclose(file);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error in " + filename + ": " + ctx.error_message);
    }

    return std::move(ctx.lines);
}

TextLines parse_text_string(const std::string& input) {
    yyscan_t scanner;
    yylex_init(&scanner);

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }

    return std::move(ctx.lines);
}

} // namespace io
} // namespace crossfill
