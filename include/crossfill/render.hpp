/**
 * @file render.hpp
 * @brief 割当済みグリッドの出力（テキスト、SVG）
 */
#ifndef CROSSFILL_RENDER_HPP
#define CROSSFILL_RENDER_HPP

#include "crossfill/assignment.hpp"
#include "crossfill/grid.hpp"
#include <ostream>
#include <string>

namespace crossfill {

/**
 * @brief SVG 出力の寸法
 */
struct SvgStyle {
    int cell_size = 100;
    int cell_border = 2;
    int letter_size = 60;
    int number_size = 22;
};

/**
 * @brief グリッドをテキストで出力
 *
 * 1行につきグリッドの1行。黒マスは '#'、未割当の文字セルは空白。
 */
void render_text(std::ostream& os, const Topology& topology, const Assignment& assignment);

/**
 * @brief グリッドを SVG で出力
 *
 * 黒マスは黒、文字セルは白で塗り、スロットの開始セルには番号を、
 * 割当済みのセルには文字を描く。
 */
void render_svg(std::ostream& os, const Topology& topology, const Assignment& assignment,
                const SvgStyle& style = {});

/**
 * @brief SVG ファイルとして保存
 * @throws std::runtime_error ファイルを開けない、または書き込みに失敗した
 */
void save_svg(const std::string& filename, const Topology& topology,
              const Assignment& assignment, const SvgStyle& style = {});

} // namespace crossfill

#endif // CROSSFILL_RENDER_HPP
