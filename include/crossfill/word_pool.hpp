/**
 * @file word_pool.hpp
 * @brief 候補単語プール（正規化・重複除去・長さ別索引）
 */
#ifndef CROSSFILL_WORD_POOL_HPP
#define CROSSFILL_WORD_POOL_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace crossfill {

/**
 * @brief 候補単語プール
 *
 * 単語は大文字に正規化して保持する。大文字小文字違いを含む重複は
 * 1語として扱う。単語 ID は追加順の連番で、値選択の既定順序になる。
 */
class WordPool {
public:
    WordPool() = default;

    /**
     * @brief 単語リストからプールを作成
     * @throws std::invalid_argument 英字以外を含む単語、または空文字列
     */
    explicit WordPool(const std::vector<std::string>& words);

    /**
     * @brief 単語を追加
     * @return 単語 ID（既存の単語なら既存の ID）
     * @throws std::invalid_argument 英字以外を含む単語、または空文字列
     */
    size_t add(const std::string& word);

    /**
     * @brief 登録済みの単語数（重複除去後）
     */
    size_t size() const { return words_.size(); }

    bool empty() const { return words_.empty(); }

    /**
     * @brief 単語 ID から単語を取得
     */
    const std::string& word(size_t id) const { return words_[id]; }

    /**
     * @brief 単語を検索（大文字小文字を区別しない）
     * @return 単語 ID、なければ SIZE_MAX
     */
    size_t find(const std::string& word) const;

    bool contains(const std::string& word) const { return find(word) != SIZE_MAX; }

    /**
     * @brief 指定長の単語 ID 一覧（昇順）
     */
    const std::vector<size_t>& words_of_length(size_t length) const;

    /**
     * @brief 単語を大文字に正規化
     * @throws std::invalid_argument 英字以外を含む単語、または空文字列
     */
    static std::string normalize(const std::string& word);

private:
    std::vector<std::string> words_;
    std::unordered_map<std::string, size_t> index_;
    std::map<size_t, std::vector<size_t>> by_length_;
};

} // namespace crossfill

#endif // CROSSFILL_WORD_POOL_HPP
