#include "crossfill/render.hpp"
#include <fstream>
#include <stdexcept>
#include <vector>

namespace crossfill {

void render_text(std::ostream& os, const Topology& topology, const Assignment& assignment) {
    for (const auto& row : assignment.letter_grid(topology)) {
        os << row << '\n';
    }
}

void render_svg(std::ostream& os, const Topology& topology, const Assignment& assignment,
                const SvgStyle& style) {
    const int cell = style.cell_size;
    const int border = style.cell_border;
    const int interior = cell - 2 * border;
    const auto width = static_cast<int>(topology.cols()) * cell;
    const auto height = static_cast<int>(topology.rows()) * cell;

    const auto letters = assignment.letter_grid(topology);

    // 開始セルごとの番号（Across/Down で共有）
    std::vector<size_t> cell_numbers(topology.rows() * topology.cols(), 0);
    const auto numbers = topology.slot_numbers();
    for (const auto& slot : topology.slots()) {
        cell_numbers[slot.start.row * topology.cols() + slot.start.col] = numbers[slot.id];
    }

    os << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width
       << "\" height=\"" << height << "\" viewBox=\"0 0 " << width << ' ' << height << "\">\n";
    os << "  <rect x=\"0\" y=\"0\" width=\"" << width << "\" height=\"" << height
       << "\" fill=\"black\"/>\n";

    for (size_t r = 0; r < topology.rows(); ++r) {
        for (size_t c = 0; c < topology.cols(); ++c) {
            if (!topology.is_open(r, c)) continue;

            const int x = static_cast<int>(c) * cell + border;
            const int y = static_cast<int>(r) * cell + border;
            os << "  <rect x=\"" << x << "\" y=\"" << y << "\" width=\"" << interior
               << "\" height=\"" << interior << "\" fill=\"white\"/>\n";

            const size_t number = cell_numbers[r * topology.cols() + c];
            if (number > 0) {
                os << "  <text x=\"" << x + border * 2 << "\" y=\"" << y + style.number_size
                   << "\" font-family=\"sans-serif\" font-size=\"" << style.number_size
                   << "\" fill=\"black\">" << number << "</text>\n";
            }

            const char ch = letters[r][c];
            if (ch != ' ') {
                os << "  <text x=\"" << x + interior / 2 << "\" y=\"" << y + interior / 2
                   << "\" font-family=\"sans-serif\" font-size=\"" << style.letter_size
                   << "\" text-anchor=\"middle\" dominant-baseline=\"central\" fill=\"black\">"
                   << ch << "</text>\n";
            }
        }
    }

    os << "</svg>\n";
}

void save_svg(const std::string& filename, const Topology& topology,
              const Assignment& assignment, const SvgStyle& style) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }
    render_svg(out, topology, assignment, style);
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + filename);
    }
}

} // namespace crossfill
