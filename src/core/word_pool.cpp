#include "crossfill/word_pool.hpp"
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace crossfill {

WordPool::WordPool(const std::vector<std::string>& words) {
    for (const auto& word : words) {
        add(word);
    }
}

std::string WordPool::normalize(const std::string& word) {
    if (word.empty()) {
        throw std::invalid_argument("empty word");
    }
    std::string result;
    result.reserve(word.size());
    for (char ch : word) {
        auto c = static_cast<unsigned char>(ch);
        if (!std::isalpha(c)) {
            throw std::invalid_argument("word contains a non-letter character: " + word);
        }
        result.push_back(static_cast<char>(std::toupper(c)));
    }
    return result;
}

size_t WordPool::add(const std::string& word) {
    std::string normalized = normalize(word);

    auto it = index_.find(normalized);
    if (it != index_.end()) {
        return it->second;  // 重複は同じ単語
    }

    size_t id = words_.size();
    by_length_[normalized.size()].push_back(id);
    index_.emplace(normalized, id);
    words_.push_back(std::move(normalized));
    return id;
}

size_t WordPool::find(const std::string& word) const {
    std::string key;
    try {
        key = normalize(word);
    } catch (const std::invalid_argument&) {
        return SIZE_MAX;  // 英字のみでない文字列はプールに存在し得ない
    }
    auto it = index_.find(key);
    return it == index_.end() ? SIZE_MAX : it->second;
}

const std::vector<size_t>& WordPool::words_of_length(size_t length) const {
    static const std::vector<size_t> empty_list;
    auto it = by_length_.find(length);
    return it == by_length_.end() ? empty_list : it->second;
}

} // namespace crossfill
