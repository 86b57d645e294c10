/**
 * @file solver.hpp
 * @brief クロスワード充填ソルバー（MRV 変数選択、前方チェック、AC-3 presolve）
 */
#ifndef CROSSFILL_SOLVER_HPP
#define CROSSFILL_SOLVER_HPP

#include "crossfill/assignment.hpp"
#include "crossfill/domain.hpp"
#include "crossfill/grid.hpp"
#include "crossfill/word_pool.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace crossfill {

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった
    UNSAT,    // 解が存在しない
    UNKNOWN   // 不明（ステップ上限、停止要求）
};

/**
 * @brief 値（単語）の試行順序
 */
enum class ValueOrder {
    Insertion,          // プールへの追加順
    LeastConstraining   // 未割当の隣接スロットから除外する候補が少ない順
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t nodes = 0;             // 確定した割当の数
    size_t backtracks = 0;        // 候補を使い切ったフレームの数
    size_t max_depth = 0;
    size_t prune_count = 0;       // 前方チェックで棄却した候補の数
    size_t presolve_removed = 0;  // AC-3 で除去した候補の数
};

/**
 * @brief クロスワード充填ソルバー
 *
 * スロットを変数、同じ長さの未使用単語を値とする制約充足問題を
 * 明示的なスタックによる深さ優先探索で解く。
 * - 変数選択: 現在の候補数が最小（MRV）→ 割当済み隣接数が最大 → ID が最小
 * - 前方チェック: 割当時に隣接スロットと同じ長さのスロットの定義域を縮小し、
 *   Trail でバックトラック時に復元する
 * - presolve: 交差を弧とする AC-3
 *
 * 前方チェックの有無で見つかる解は変わらない（候補数は常に
 * 現在の割当と整合する単語の数として定義されるため）。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 最初の解を探索
     * @param topology グリッドトポロジ
     * @param pool 単語プール
     * @return 解が見つかればその割当、なければstd::nullopt（result() で理由を判別）
     */
    std::optional<Assignment> solve(const Topology& topology, const WordPool& pool);

    /**
     * @brief 最初の解を探索（失敗時は例外）
     * @throws InsufficientPoolError 探索前に単語不足が判明した
     * @throws UnsatisfiableError 解が存在しない
     * @throws SearchBudgetExceededError ステップ上限または停止要求
     */
    Assignment fill(const Topology& topology, const WordPool& pool);

    /**
     * @brief 直前の solve() の結果
     */
    SearchResult result() const { return result_; }

    /**
     * @brief 直前の失敗の説明（成功時は空）
     */
    const std::string& failure_reason() const { return failure_reason_; }

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief 前方チェックを有効/無効にする
     */
    void set_forward_checking(bool enabled) { forward_checking_ = enabled; }

    /**
     * @brief AC-3 presolve を有効/無効にする
     */
    void set_arc_consistency(bool enabled) { arc_consistency_ = enabled; }

    /**
     * @brief 値の試行順序を設定
     */
    void set_value_order(ValueOrder order) { value_order_ = order; }

    /**
     * @brief 確定割当数の上限を設定（0 = 無制限）
     */
    void set_step_limit(size_t limit) { step_limit_ = limit; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    static constexpr size_t NO_WORD = static_cast<size_t>(-1);

    /**
     * @brief 交差相手（自スロット内位置と相手スロット内位置）
     */
    struct Neighbor {
        size_t slot;
        size_t offset;        // 自スロット内の位置
        size_t other_offset;  // 相手スロット内の位置
    };

    /**
     * @brief 探索スタックのフレーム
     */
    struct Frame {
        size_t slot;
        std::vector<Domain::value_type> candidates;  // 試行順に並んだ候補
        size_t next = 0;
        size_t trail_mark = 0;
        bool committed = false;
    };

    /**
     * @brief 定義域 Trail エントリ
     */
    struct TrailEntry {
        size_t slot;
        size_t old_n;
    };

    // ===== 初期化 =====

    void init(const Topology& topology, const WordPool& pool);

    /**
     * @brief 長さごとの単語数不足を検出
     * @return 不足していれば説明、なければ空文字列
     */
    std::string check_pool() const;

    /**
     * @brief AC-3 による presolve
     * @return 全定義域が空でなければtrue
     */
    bool presolve();

    /**
     * @brief 弧 x→y を整合させる
     * @return x の定義域が変化したらtrue
     */
    bool revise(size_t x, const Neighbor& y);

    // ===== 探索 =====

    SearchResult run_search();

    /**
     * @brief 次に割り当てるスロットを選択
     */
    size_t select_slot() const;

    /**
     * @brief 現在の割当と整合する候補（昇順）
     */
    std::vector<Domain::value_type> current_candidates(size_t slot) const;

    /**
     * @brief 現在の割当と整合する候補の数
     */
    size_t candidate_count(size_t slot) const;

    /**
     * @brief 候補を試行順に並べ替え
     */
    void order_values(size_t slot, std::vector<Domain::value_type>& values) const;

    /**
     * @brief 単語が未使用で、割当済みの隣接スロットと文字が一致するか
     */
    bool consistent(size_t slot, size_t word_id) const;

    /**
     * @brief 割当を確定し前方チェックを行う
     * @return 前方チェックで定義域が空になったらfalse（呼び出し側で undo する）
     */
    bool commit(size_t slot, Domain::value_type pos);

    /**
     * @brief 割当を取り消し、Trail を trail_mark まで巻き戻す
     */
    void undo(size_t slot, size_t trail_mark);

    /**
     * @brief 定義域サイズを Trail に保存
     */
    void save_domain(size_t slot) { trail_.push_back({slot, domains_[slot].size()}); }

    size_t word_id(size_t slot, Domain::value_type pos) const { return (*buckets_[slot])[pos]; }
    char letter(size_t word_id, size_t offset) const { return pool_->word(word_id)[offset]; }

    /**
     * @brief 現在の割当を構築
     */
    Assignment build_assignment() const;

    // ===== メンバ変数 =====

    // 設定
    bool forward_checking_ = true;
    bool arc_consistency_ = true;
    ValueOrder value_order_ = ValueOrder::Insertion;
    size_t step_limit_ = 0;
    bool verbose_ = false;
    std::atomic<bool> stopped_{false};

    // 入力
    const Topology* topology_ = nullptr;
    const WordPool* pool_ = nullptr;
    std::vector<const std::vector<size_t>*> buckets_;  // スロット長の単語 ID 一覧
    std::vector<std::vector<Neighbor>> neighbors_;
    std::vector<std::vector<size_t>> same_length_;     // 同じ長さの他スロット

    // 状態
    std::vector<Domain> domains_;
    std::vector<TrailEntry> trail_;
    std::vector<size_t> assigned_;  // スロット → 単語 ID
    std::vector<bool> used_;        // 単語 ID → 使用中

    // 結果
    SearchResult result_ = SearchResult::UNKNOWN;
    std::string failure_reason_;
    bool insufficient_pool_ = false;
    SolverStats stats_;
};

} // namespace crossfill

#endif // CROSSFILL_SOLVER_HPP
