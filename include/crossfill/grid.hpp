/**
 * @file grid.hpp
 * @brief グリッドトポロジ（セル・スロット・交差）
 */
#ifndef CROSSFILL_GRID_HPP
#define CROSSFILL_GRID_HPP

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace crossfill {

/**
 * @brief セル開閉フラグの行列（true = 文字セル、false = 黒マス）
 */
using Structure = std::vector<std::vector<bool>>;

/**
 * @brief グリッド上の位置 (row, col)
 */
struct Cell {
    size_t row;
    size_t col;

    bool operator==(const Cell& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

/**
 * @brief スロットの方向
 */
enum class Direction {
    Across,
    Down
};

/**
 * @brief スロット（1単語が入る連続した文字セル列）
 */
struct Slot {
    size_t id;                 // 走査順のインデックス
    Cell start;
    Direction direction;
    std::vector<Cell> cells;   // 先頭から順に並んだセル

    size_t length() const { return cells.size(); }
};

/**
 * @brief 交差（異なる方向の2スロットが共有する1セル）
 */
struct Intersection {
    Cell cell;
    size_t across;         // Across スロットの ID
    size_t across_offset;  // Across スロット内での位置
    size_t down;           // Down スロットの ID
    size_t down_offset;    // Down スロット内での位置
};

/**
 * @brief 明示的なスロット定義（from_slots 用）
 */
struct SlotSpec {
    Cell start;
    Direction direction;
    size_t length;
};

/**
 * @brief どのスロットにも属さない文字セルの扱い
 */
enum class SingleCellPolicy {
    Ignore,  // スロットを持たない埋め草セルとして無視
    Reject   // MalformedGridError
};

/**
 * @brief トポロジ構築オプション
 */
struct TopologyOptions {
    SingleCellPolicy single_cells = SingleCellPolicy::Ignore;
};

/**
 * @brief グリッドトポロジ
 *
 * 構築後は読み取り専用。スロット ID は行優先走査順で、同じセルから
 * 始まる場合は Across が Down より先になる。
 */
class Topology {
public:
    /**
     * @brief セル開閉行列からトポロジを構築
     * @param structure 矩形の開閉行列
     * @param options 構築オプション
     * @throws MalformedGridError 行列が矩形でない場合、または
     *         SingleCellPolicy::Reject で孤立した文字セルがある場合
     */
    static Topology from_structure(const Structure& structure,
                                   const TopologyOptions& options = {});

    /**
     * @brief スロット定義の列からトポロジを構築
     *
     * 文字セルは各スロットのセルの和集合になる。
     *
     * @throws MalformedGridError 長さ 2 未満のスロット、盤面外にはみ出すスロット、
     *         同一セル列を占める重複スロット、同方向スロットのセル共有
     */
    static Topology from_slots(size_t rows, size_t cols, const std::vector<SlotSpec>& specs);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }

    /**
     * @brief 文字セルかどうか
     */
    bool is_open(size_t row, size_t col) const { return open_[row * cols_ + col]; }

    const std::vector<Slot>& slots() const { return slots_; }
    const Slot& slot(size_t id) const { return slots_[id]; }

    const std::vector<Intersection>& intersections() const { return intersections_; }

    /**
     * @brief スロットに関わる交差のインデックス一覧
     */
    const std::vector<size_t>& intersections_of(size_t slot_id) const {
        return slot_intersections_[slot_id];
    }

    /**
     * @brief 2スロットの交差位置
     * @return 交差していれば (a 内の位置, b 内の位置)、なければ std::nullopt
     */
    std::optional<std::pair<size_t, size_t>> overlap(size_t a, size_t b) const;

    /**
     * @brief 交差相手のスロット ID 一覧（スロットごとに重複なし）
     */
    std::vector<size_t> neighbors(size_t slot_id) const;

    /**
     * @brief 表示用の番号付け
     *
     * スロットの開始セルに行優先で 1 から番号を振る。
     * 同じセルから始まる Across/Down は同じ番号を共有する。
     *
     * @return 番号（slot_numbers()[slot_id]）
     */
    std::vector<size_t> slot_numbers() const;

private:
    Topology(size_t rows, size_t cols);

    void add_slot(Cell start, Direction direction, size_t length);
    void build_intersections();

    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<bool> open_;
    std::vector<Slot> slots_;
    std::vector<Intersection> intersections_;
    std::vector<std::vector<size_t>> slot_intersections_;
};

} // namespace crossfill

#endif // CROSSFILL_GRID_HPP
