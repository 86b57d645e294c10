/**
 * @file loader.hpp
 * @brief 構造ファイル・単語リストの読み込み
 */
#ifndef CROSSFILL_IO_LOADER_HPP
#define CROSSFILL_IO_LOADER_HPP

#include "crossfill/grid.hpp"
#include <string>
#include <vector>

namespace crossfill {
namespace io {

/**
 * @brief 構造テキストをセル開閉行列に変換
 *
 * 空行以外の各行がグリッドの1行で、1文字が1セル。
 * '_' を文字セル、空白を含むそれ以外の文字を黒マスとする。
 * 行長の不揃いはここでは検査しない（Topology 構築時に検出）。
 *
 * @throws std::runtime_error パースエラー
 */
Structure parse_structure(const std::string& text);

/**
 * @brief 構造ファイルを読み込む
 * @throws std::runtime_error ファイルを開けない、またはパースエラー
 */
Structure load_structure(const std::string& filename);

/**
 * @brief 単語リストテキストを大文字に正規化した単語列に変換
 *
 * 空白区切りの各トークンが1単語。
 *
 * @throws std::runtime_error 英字以外を含む単語（行番号付き）、またはパースエラー
 */
std::vector<std::string> parse_word_list(const std::string& text);

/**
 * @brief 単語リストファイルを読み込む
 * @throws std::runtime_error ファイルを開けない、不正な単語、またはパースエラー
 */
std::vector<std::string> load_word_list(const std::string& filename);

} // namespace io
} // namespace crossfill

#endif // CROSSFILL_IO_LOADER_HPP
