/**
 * @file text_parser.hpp
 * @brief 行形式テキストパーサーのインターフェース
 */
#ifndef CROSSFILL_IO_TEXT_PARSER_HPP
#define CROSSFILL_IO_TEXT_PARSER_HPP

#include <cstdio>
#include <string>
#include <vector>

// Forward declarations for flex/bison
typedef void* yyscan_t;
struct ParserContext;

// Flex functions
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

// Bison function
int yyparse(yyscan_t scanner, ParserContext* ctx);

namespace crossfill {
namespace io {

/**
 * @brief 行の内容（lines[i] は i+1 行目、改行と行末の '\r' は含まない）
 */
using TextLines = std::vector<std::string>;

/**
 * @throws std::runtime_error ファイルを開けない、またはパースエラー
 */
TextLines parse_text_file(const std::string& filename);

/**
 * @throws std::runtime_error パースエラー
 */
TextLines parse_text_string(const std::string& input);

} // namespace io
} // namespace crossfill

#endif // CROSSFILL_IO_TEXT_PARSER_HPP
