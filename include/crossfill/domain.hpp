/**
 * @file domain.hpp
 * @brief スロットの候補定義域（Sparse Set ベース）
 */
#ifndef CROSSFILL_DOMAIN_HPP
#define CROSSFILL_DOMAIN_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace crossfill {

/**
 * @brief スロットの候補単語を表す定義域
 *
 * 値は同じ長さの単語一覧（WordPool::words_of_length）内の位置 0..count-1。
 * Sparse Set を使用し、O(1) での値の存在確認と削除を実現する。
 * バックトラック時の復元は size (n_) のリセットのみで O(1)。
 */
class Domain {
public:
    using value_type = size_t;

    /**
     * @brief 空の定義域を作成
     */
    Domain();

    /**
     * @brief 0..count-1 の全値を含む定義域を作成
     */
    explicit Domain(size_t count);

    /**
     * @brief 定義域が空かどうか
     */
    bool empty() const { return n_ == 0; }

    /**
     * @brief 定義域のサイズを取得
     */
    size_t size() const { return n_; }

    /**
     * @brief 値が定義域に含まれるか
     */
    bool contains(value_type value) const {
        return value < sparse_.size() && sparse_[value] < n_;
    }

    /**
     * @brief 条件を満たす値を一括削除
     * @return ドメインが空にならなければ true（空になっても削除は行われる）
     */
    template <typename Pred>
    bool remove_if(Pred pred) {
        size_t i = 0;
        while (i < n_) {
            if (pred(values_[i])) {
                swap_at(i, n_ - 1);
                --n_;
                // swap先を再チェックするので i は進めない
            } else {
                ++i;
            }
        }
        return n_ > 0;
    }

    /**
     * @brief 全ての有効な値を昇順で取得
     */
    std::vector<value_type> values() const;

    /**
     * @brief Dense 配列の有効範囲の先頭ポインタ（順序は不定）
     */
    const value_type* begin() const { return values_.data(); }

    /**
     * @brief Dense 配列の有効範囲の末尾ポインタ
     */
    const value_type* end() const { return values_.data() + n_; }

    /**
     * @brief 有効サイズを設定（バックトラック用）
     * @pre n は現在以上、かつ初期サイズ以下
     */
    void set_n(size_t n);

private:
    void swap_at(size_t i, size_t j);

    std::vector<value_type> values_;  // Dense 配列
    std::vector<size_t> sparse_;      // sparse_[value] = values_ 内の位置
    size_t n_;                        // 有効な値の数
};

} // namespace crossfill

#endif // CROSSFILL_DOMAIN_HPP
