/**
 * @file assignment.hpp
 * @brief スロットへの単語割当と検証
 */
#ifndef CROSSFILL_ASSIGNMENT_HPP
#define CROSSFILL_ASSIGNMENT_HPP

#include "crossfill/grid.hpp"
#include "crossfill/word_pool.hpp"
#include <string>
#include <vector>

namespace crossfill {

/**
 * @brief スロット ID → 単語 の割当
 *
 * 未割当のスロットは空文字列で表す。
 */
class Assignment {
public:
    Assignment() = default;

    /**
     * @brief num_slots 個の未割当スロットを持つ割当を作成
     */
    explicit Assignment(size_t num_slots) : words_(num_slots) {}

    size_t num_slots() const { return words_.size(); }

    void assign(size_t slot_id, std::string word) { words_[slot_id] = std::move(word); }

    bool is_assigned(size_t slot_id) const { return !words_[slot_id].empty(); }

    /**
     * @brief 割り当てられた単語（未割当なら空文字列）
     */
    const std::string& word(size_t slot_id) const { return words_[slot_id]; }

    /**
     * @brief 割当済みスロット数
     */
    size_t num_assigned() const;

    /**
     * @brief 全スロットが割当済みか
     */
    bool is_complete() const { return num_assigned() == words_.size(); }

    /**
     * @brief 割当をグリッドの文字配置に展開
     *
     * 黒マスは '#'、未割当の文字セルは ' '。
     * 交差で文字が食い違う場合は後から書いたスロットの文字になる。
     */
    std::vector<std::string> letter_grid(const Topology& topology) const;

    bool operator==(const Assignment& other) const { return words_ == other.words_; }
    bool operator!=(const Assignment& other) const { return !(*this == other); }

private:
    std::vector<std::string> words_;
};

/**
 * @brief 割当が完全かつ整合しているかを探索実装とは独立に検証
 *
 * - 全スロットにプール内の、スロット長と等しい長さの単語が1つずつ
 * - 同じ単語を複数スロットに使っていない
 * - 全交差で両スロットの文字が一致（大文字小文字を区別しない）
 *
 * @param reason 不整合の場合に理由を格納（nullptr 可）
 * @return 整合していればtrue
 */
bool verify_assignment(const Topology& topology, const WordPool& pool,
                       const Assignment& assignment, std::string* reason = nullptr);

} // namespace crossfill

#endif // CROSSFILL_ASSIGNMENT_HPP
