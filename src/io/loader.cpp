#include "crossfill/io/loader.hpp"
#include "crossfill/word_pool.hpp"
#include "text_parser.hpp"
#include <sstream>
#include <stdexcept>

namespace crossfill {
namespace io {

namespace {

constexpr char OPEN_CELL = '_';

Structure to_structure(const TextLines& lines) {
    Structure structure;
    for (const auto& line : lines) {
        if (line.empty()) continue;  // 空行

        // 空白を含め '_' 以外は全て黒マス
        std::vector<bool> row;
        row.reserve(line.size());
        for (char ch : line) {
            row.push_back(ch == OPEN_CELL);
        }
        structure.push_back(std::move(row));
    }
    return structure;
}

std::vector<std::string> to_words(const TextLines& lines, const std::string& source) {
    std::vector<std::string> words;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::istringstream tokens(lines[i]);
        std::string token;
        while (tokens >> token) {
            try {
                words.push_back(WordPool::normalize(token));
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(source + "line " + std::to_string(i + 1) + ": " + e.what());
            }
        }
    }
    return words;
}

}  // namespace

Structure parse_structure(const std::string& text) {
    return to_structure(parse_text_string(text));
}

Structure load_structure(const std::string& filename) {
    return to_structure(parse_text_file(filename));
}

std::vector<std::string> parse_word_list(const std::string& text) {
    return to_words(parse_text_string(text), "");
}

std::vector<std::string> load_word_list(const std::string& filename) {
    return to_words(parse_text_file(filename), filename + ": ");
}

} // namespace io
} // namespace crossfill
