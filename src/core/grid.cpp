#include "crossfill/grid.hpp"
#include "crossfill/errors.hpp"
#include <algorithm>
#include <string>
#include <tuple>

namespace crossfill {

namespace {

constexpr size_t NO_SLOT = static_cast<size_t>(-1);

std::string cell_str(const Cell& cell) {
    return "(" + std::to_string(cell.row) + ", " + std::to_string(cell.col) + ")";
}

const char* direction_str(Direction direction) {
    return direction == Direction::Across ? "across" : "down";
}

}  // namespace

Topology::Topology(size_t rows, size_t cols)
    : rows_(rows)
    , cols_(cols)
    , open_(rows * cols, false) {}

Topology Topology::from_structure(const Structure& structure, const TopologyOptions& options) {
    const size_t rows = structure.size();
    const size_t cols = rows > 0 ? structure[0].size() : 0;

    for (size_t r = 1; r < rows; ++r) {
        if (structure[r].size() != cols) {
            throw MalformedGridError("row " + std::to_string(r) + " has " +
                                     std::to_string(structure[r].size()) +
                                     " cells, expected " + std::to_string(cols));
        }
    }

    Topology topology(rows, cols);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            topology.open_[r * cols + c] = structure[r][c];
        }
    }

    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            if (!topology.is_open(r, c)) continue;

            // 左が黒マスか盤外なら Across の開始候補
            if (c == 0 || !topology.is_open(r, c - 1)) {
                size_t len = 0;
                while (c + len < cols && topology.is_open(r, c + len)) ++len;
                if (len >= 2) {
                    topology.add_slot({r, c}, Direction::Across, len);
                }
            }

            // 上が黒マスか盤外なら Down の開始候補
            if (r == 0 || !topology.is_open(r - 1, c)) {
                size_t len = 0;
                while (r + len < rows && topology.is_open(r + len, c)) ++len;
                if (len >= 2) {
                    topology.add_slot({r, c}, Direction::Down, len);
                }
            }
        }
    }

    topology.build_intersections();

    if (options.single_cells == SingleCellPolicy::Reject) {
        std::vector<bool> covered(rows * cols, false);
        for (const auto& slot : topology.slots_) {
            for (const auto& cell : slot.cells) {
                covered[cell.row * cols + cell.col] = true;
            }
        }
        for (size_t r = 0; r < rows; ++r) {
            for (size_t c = 0; c < cols; ++c) {
                if (topology.is_open(r, c) && !covered[r * cols + c]) {
                    throw MalformedGridError("open cell " + cell_str({r, c}) +
                                             " does not belong to any slot");
                }
            }
        }
    }

    return topology;
}

Topology Topology::from_slots(size_t rows, size_t cols, const std::vector<SlotSpec>& specs) {
    // 行優先・Across 優先の走査順に並べて ID を安定させる
    std::vector<SlotSpec> sorted = specs;
    std::stable_sort(sorted.begin(), sorted.end(), [](const SlotSpec& a, const SlotSpec& b) {
        return std::make_tuple(a.start.row, a.start.col, static_cast<int>(a.direction)) <
               std::make_tuple(b.start.row, b.start.col, static_cast<int>(b.direction));
    });

    Topology topology(rows, cols);
    std::vector<size_t> across_owner(rows * cols, NO_SLOT);
    std::vector<size_t> down_owner(rows * cols, NO_SLOT);

    for (size_t i = 0; i < sorted.size(); ++i) {
        const auto& spec = sorted[i];
        if (spec.length < 2) {
            throw MalformedGridError(std::string(direction_str(spec.direction)) + " slot at " +
                                     cell_str(spec.start) + " has length " +
                                     std::to_string(spec.length));
        }

        const bool across = spec.direction == Direction::Across;
        const size_t end_row = spec.start.row + (across ? 0 : spec.length - 1);
        const size_t end_col = spec.start.col + (across ? spec.length - 1 : 0);
        if (end_row >= rows || end_col >= cols) {
            throw MalformedGridError(std::string(direction_str(spec.direction)) + " slot at " +
                                     cell_str(spec.start) + " leaves the grid");
        }

        if (i > 0) {
            const auto& prev = sorted[i - 1];
            if (prev.start == spec.start && prev.direction == spec.direction &&
                prev.length == spec.length) {
                throw MalformedGridError("duplicate " + std::string(direction_str(spec.direction)) +
                                         " slot at " + cell_str(spec.start));
            }
        }

        auto& owner = across ? across_owner : down_owner;
        for (size_t k = 0; k < spec.length; ++k) {
            const size_t r = spec.start.row + (across ? 0 : k);
            const size_t c = spec.start.col + (across ? k : 0);
            if (owner[r * cols + c] != NO_SLOT) {
                throw MalformedGridError(std::string(direction_str(spec.direction)) +
                                         " slots overlap at " + cell_str({r, c}));
            }
            owner[r * cols + c] = i;
            topology.open_[r * cols + c] = true;
        }

        topology.add_slot(spec.start, spec.direction, spec.length);
    }

    topology.build_intersections();
    return topology;
}

void Topology::add_slot(Cell start, Direction direction, size_t length) {
    Slot slot;
    slot.id = slots_.size();
    slot.start = start;
    slot.direction = direction;
    slot.cells.reserve(length);
    for (size_t k = 0; k < length; ++k) {
        if (direction == Direction::Across) {
            slot.cells.push_back({start.row, start.col + k});
        } else {
            slot.cells.push_back({start.row + k, start.col});
        }
    }
    slots_.push_back(std::move(slot));
}

void Topology::build_intersections() {
    // セルごとに (スロット ID, スロット内位置) を方向別に記録
    std::vector<std::pair<size_t, size_t>> across_at(rows_ * cols_, {NO_SLOT, 0});
    std::vector<std::pair<size_t, size_t>> down_at(rows_ * cols_, {NO_SLOT, 0});

    for (const auto& slot : slots_) {
        auto& at = slot.direction == Direction::Across ? across_at : down_at;
        for (size_t k = 0; k < slot.cells.size(); ++k) {
            const auto& cell = slot.cells[k];
            at[cell.row * cols_ + cell.col] = {slot.id, k};
        }
    }

    intersections_.clear();
    slot_intersections_.assign(slots_.size(), {});
    for (size_t r = 0; r < rows_; ++r) {
        for (size_t c = 0; c < cols_; ++c) {
            const auto& a = across_at[r * cols_ + c];
            const auto& d = down_at[r * cols_ + c];
            if (a.first == NO_SLOT || d.first == NO_SLOT) continue;

            const size_t idx = intersections_.size();
            intersections_.push_back({{r, c}, a.first, a.second, d.first, d.second});
            slot_intersections_[a.first].push_back(idx);
            slot_intersections_[d.first].push_back(idx);
        }
    }
}

std::optional<std::pair<size_t, size_t>> Topology::overlap(size_t a, size_t b) const {
    for (size_t idx : slot_intersections_[a]) {
        const auto& x = intersections_[idx];
        if (x.across == a && x.down == b) {
            return std::make_pair(x.across_offset, x.down_offset);
        }
        if (x.down == a && x.across == b) {
            return std::make_pair(x.down_offset, x.across_offset);
        }
    }
    return std::nullopt;
}

std::vector<size_t> Topology::neighbors(size_t slot_id) const {
    std::vector<size_t> result;
    for (size_t idx : slot_intersections_[slot_id]) {
        const auto& x = intersections_[idx];
        size_t other = x.across == slot_id ? x.down : x.across;
        if (std::find(result.begin(), result.end(), other) == result.end()) {
            result.push_back(other);
        }
    }
    return result;
}

std::vector<size_t> Topology::slot_numbers() const {
    std::vector<size_t> numbers(slots_.size(), 0);
    size_t next = 0;
    Cell last{NO_SLOT, NO_SLOT};
    // slots_ は開始セルの行優先順に並んでいる
    for (const auto& slot : slots_) {
        if (slot.start != last) {
            ++next;
            last = slot.start;
        }
        numbers[slot.id] = next;
    }
    return numbers;
}

} // namespace crossfill
