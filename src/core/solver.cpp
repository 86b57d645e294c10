#include "crossfill/solver.hpp"
#include "crossfill/errors.hpp"
#include <algorithm>
#include <array>
#include <deque>
#include <iostream>
#include <map>
#include <stdexcept>

namespace crossfill {

std::optional<Assignment> Solver::solve(const Topology& topology, const WordPool& pool) {
    init(topology, pool);

    const size_t num_slots = topology.slots().size();
    if (verbose_) {
        std::cerr << "[verbose] solve start: " << num_slots << " slots, "
                  << topology.intersections().size() << " intersections, "
                  << pool.size() << " words\n";
    }

    failure_reason_ = check_pool();
    if (!failure_reason_.empty()) {
        insufficient_pool_ = true;
        result_ = SearchResult::UNSAT;
        if (verbose_) std::cerr << "[verbose] " << failure_reason_ << "\n";
        return std::nullopt;
    }

    if (arc_consistency_ && !presolve()) {
        result_ = SearchResult::UNSAT;
        failure_reason_ = "arc consistency leaves a slot without candidates";
        if (verbose_) std::cerr << "[verbose] presolve failed\n";
        return std::nullopt;
    }
    if (verbose_ && arc_consistency_) {
        std::cerr << "[verbose] presolve done: removed " << stats_.presolve_removed
                  << " candidates\n";
    }

    result_ = run_search();

    if (verbose_) {
        std::cerr << "[verbose] search done: nodes=" << stats_.nodes
                  << " backtracks=" << stats_.backtracks
                  << " max_depth=" << stats_.max_depth
                  << " prunes=" << stats_.prune_count << "\n";
    }

    if (result_ == SearchResult::UNSAT) {
        failure_reason_ = "no assignment satisfies every slot";
        return std::nullopt;
    }
    if (result_ == SearchResult::UNKNOWN) {
        failure_reason_ = stopped_ ? "search stopped"
                                   : "step limit of " + std::to_string(step_limit_) + " reached";
        return std::nullopt;
    }

    Assignment assignment = build_assignment();
    std::string reason;
    if (!verify_assignment(topology, pool, assignment, &reason)) {
        throw std::logic_error("solver produced an inconsistent assignment: " + reason);
    }
    return assignment;
}

Assignment Solver::fill(const Topology& topology, const WordPool& pool) {
    auto assignment = solve(topology, pool);
    if (assignment) {
        return std::move(*assignment);
    }
    if (result_ == SearchResult::UNKNOWN) {
        throw SearchBudgetExceededError(failure_reason_);
    }
    if (insufficient_pool_) {
        throw InsufficientPoolError(failure_reason_);
    }
    throw UnsatisfiableError(failure_reason_);
}

void Solver::init(const Topology& topology, const WordPool& pool) {
    topology_ = &topology;
    pool_ = &pool;
    result_ = SearchResult::UNKNOWN;
    failure_reason_.clear();
    insufficient_pool_ = false;
    stats_ = SolverStats{};

    const auto& slots = topology.slots();
    const size_t num_slots = slots.size();

    buckets_.clear();
    domains_.clear();
    for (const auto& slot : slots) {
        const auto& bucket = pool.words_of_length(slot.length());
        buckets_.push_back(&bucket);
        domains_.emplace_back(bucket.size());
    }

    neighbors_.assign(num_slots, {});
    for (const auto& x : topology.intersections()) {
        neighbors_[x.across].push_back({x.down, x.across_offset, x.down_offset});
        neighbors_[x.down].push_back({x.across, x.down_offset, x.across_offset});
    }

    same_length_.assign(num_slots, {});
    for (size_t i = 0; i < num_slots; ++i) {
        for (size_t j = 0; j < num_slots; ++j) {
            if (i != j && slots[i].length() == slots[j].length()) {
                same_length_[i].push_back(j);
            }
        }
    }

    trail_.clear();
    assigned_.assign(num_slots, NO_WORD);
    used_.assign(pool.size(), false);
}

std::string Solver::check_pool() const {
    std::map<size_t, size_t> slots_per_length;
    for (const auto& slot : topology_->slots()) {
        slots_per_length[slot.length()]++;
    }

    for (const auto& [length, count] : slots_per_length) {
        size_t available = pool_->words_of_length(length).size();
        if (available == 0) {
            return "no words of length " + std::to_string(length);
        }
        if (available < count) {
            return "only " + std::to_string(available) + " words of length " +
                   std::to_string(length) + " for " + std::to_string(count) + " slots";
        }
    }
    return {};
}

bool Solver::presolve() {
    // 全ての弧 (x, y) をキューに入れる
    std::deque<std::pair<size_t, size_t>> arcs;
    for (size_t x = 0; x < neighbors_.size(); ++x) {
        for (size_t k = 0; k < neighbors_[x].size(); ++k) {
            arcs.emplace_back(x, k);
        }
    }

    while (!arcs.empty()) {
        auto [x, k] = arcs.front();
        arcs.pop_front();

        const Neighbor& y = neighbors_[x][k];
        if (!revise(x, y)) continue;
        if (domains_[x].empty()) {
            return false;
        }

        // x が縮小したので z→x を再検査
        for (const auto& z : neighbors_[x]) {
            if (z.slot == y.slot) continue;
            const auto& back = neighbors_[z.slot];
            for (size_t j = 0; j < back.size(); ++j) {
                if (back[j].slot == x) {
                    arcs.emplace_back(z.slot, j);
                }
            }
        }
    }
    return true;
}

bool Solver::revise(size_t x, const Neighbor& y) {
    std::array<bool, 256> supported{};
    for (auto pos : domains_[y.slot]) {
        supported[static_cast<unsigned char>(letter(word_id(y.slot, pos), y.other_offset))] = true;
    }

    size_t before = domains_[x].size();
    domains_[x].remove_if([&](Domain::value_type pos) {
        return !supported[static_cast<unsigned char>(letter(word_id(x, pos), y.offset))];
    });
    size_t removed = before - domains_[x].size();
    stats_.presolve_removed += removed;
    return removed > 0;
}

SearchResult Solver::run_search() {
    const size_t num_slots = topology_->slots().size();
    std::vector<Frame> stack;
    stack.reserve(num_slots);
    size_t num_assigned = 0;

    while (true) {
        if (num_assigned == num_slots) {
            return SearchResult::SAT;
        }

        // 次のスロットのフレームを積む
        Frame frame;
        frame.slot = select_slot();
        frame.candidates = current_candidates(frame.slot);
        order_values(frame.slot, frame.candidates);
        frame.trail_mark = trail_.size();
        stack.push_back(std::move(frame));
        stats_.max_depth = std::max(stats_.max_depth, stack.size());

        // 整合する候補が見つかるまで進め、尽きたらバックトラック
        bool advanced = false;
        while (!stack.empty()) {
            Frame& top = stack.back();
            if (top.committed) {
                undo(top.slot, top.trail_mark);
                top.committed = false;
                --num_assigned;
            }

            while (top.next < top.candidates.size()) {
                if (stopped_) {
                    return SearchResult::UNKNOWN;
                }
                if (step_limit_ > 0 && stats_.nodes >= step_limit_) {
                    return SearchResult::UNKNOWN;
                }

                auto pos = top.candidates[top.next++];
                if (!consistent(top.slot, word_id(top.slot, pos))) {
                    continue;
                }

                stats_.nodes++;
                if (commit(top.slot, pos)) {
                    top.committed = true;
                    break;
                }
                stats_.prune_count++;
                undo(top.slot, top.trail_mark);
            }

            if (top.committed) {
                ++num_assigned;
                advanced = true;
                break;
            }

            stats_.backtracks++;
            stack.pop_back();
        }

        if (!advanced) {
            return SearchResult::UNSAT;
        }
    }
}

size_t Solver::select_slot() const {
    size_t best = NO_WORD;
    size_t best_count = 0;
    size_t best_degree = 0;

    for (size_t s = 0; s < assigned_.size(); ++s) {
        if (assigned_[s] != NO_WORD) continue;

        size_t count = candidate_count(s);
        size_t degree = 0;
        for (const auto& n : neighbors_[s]) {
            if (assigned_[n.slot] != NO_WORD) ++degree;
        }

        // MRV → 割当済み隣接数 → ID（昇順走査なので先着優先）
        if (best == NO_WORD || count < best_count ||
            (count == best_count && degree > best_degree)) {
            best = s;
            best_count = count;
            best_degree = degree;
        }
    }
    return best;
}

std::vector<Domain::value_type> Solver::current_candidates(size_t slot) const {
    auto values = domains_[slot].values();
    if (forward_checking_) {
        // 定義域は常に現在の割当と整合している
        return values;
    }
    values.erase(std::remove_if(values.begin(), values.end(),
                                [&](Domain::value_type pos) {
                                    return !consistent(slot, word_id(slot, pos));
                                }),
                 values.end());
    return values;
}

size_t Solver::candidate_count(size_t slot) const {
    if (forward_checking_) {
        return domains_[slot].size();
    }
    size_t count = 0;
    for (auto pos : domains_[slot]) {
        if (consistent(slot, word_id(slot, pos))) ++count;
    }
    return count;
}

void Solver::order_values(size_t slot, std::vector<Domain::value_type>& values) const {
    if (value_order_ == ValueOrder::Insertion) {
        return;  // current_candidates は昇順 = 追加順
    }

    // 未割当の隣接スロットごとに、交差位置の文字の出現数を数えておく
    struct LetterCounts {
        const Neighbor* neighbor;
        size_t total;
        std::array<size_t, 256> counts;
    };
    std::vector<LetterCounts> histograms;
    for (const auto& n : neighbors_[slot]) {
        if (assigned_[n.slot] != NO_WORD) continue;
        LetterCounts h{&n, 0, {}};
        for (auto other : current_candidates(n.slot)) {
            h.counts[static_cast<unsigned char>(letter(word_id(n.slot, other), n.other_offset))]++;
            h.total++;
        }
        histograms.push_back(h);
    }

    // 除外される候補数の少ない順（同数なら追加順）
    std::vector<std::pair<size_t, Domain::value_type>> scored;
    scored.reserve(values.size());
    for (auto pos : values) {
        const size_t wid = word_id(slot, pos);
        size_t eliminated = 0;
        for (const auto& h : histograms) {
            const char ch = letter(wid, h.neighbor->offset);
            eliminated += h.total - h.counts[static_cast<unsigned char>(ch)];
        }
        scored.emplace_back(eliminated, pos);
    }
    std::sort(scored.begin(), scored.end());

    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = scored[i].second;
    }
}

bool Solver::consistent(size_t slot, size_t word_id) const {
    if (used_[word_id]) {
        return false;
    }
    for (const auto& n : neighbors_[slot]) {
        size_t other = assigned_[n.slot];
        if (other == NO_WORD) continue;
        if (letter(word_id, n.offset) != letter(other, n.other_offset)) {
            return false;
        }
    }
    return true;
}

bool Solver::commit(size_t slot, Domain::value_type pos) {
    const size_t wid = word_id(slot, pos);
    assigned_[slot] = wid;
    used_[wid] = true;

    if (!forward_checking_) {
        return true;
    }

    // 隣接スロット: 交差セルの文字が合わない候補を除去
    for (const auto& n : neighbors_[slot]) {
        if (assigned_[n.slot] != NO_WORD) continue;
        const char ch = letter(wid, n.offset);
        save_domain(n.slot);
        bool ok = domains_[n.slot].remove_if([&](Domain::value_type other) {
            return letter(word_id(n.slot, other), n.other_offset) != ch;
        });
        if (!ok) return false;
    }

    // 同じ長さのスロット: 使用した単語を除去（単語一覧が同じなので位置も同じ）
    for (size_t other : same_length_[slot]) {
        if (assigned_[other] != NO_WORD || !domains_[other].contains(pos)) continue;
        save_domain(other);
        bool ok = domains_[other].remove_if([pos](Domain::value_type v) { return v == pos; });
        if (!ok) return false;
    }

    return true;
}

void Solver::undo(size_t slot, size_t trail_mark) {
    while (trail_.size() > trail_mark) {
        const auto& entry = trail_.back();
        domains_[entry.slot].set_n(entry.old_n);
        trail_.pop_back();
    }
    used_[assigned_[slot]] = false;
    assigned_[slot] = NO_WORD;
}

Assignment Solver::build_assignment() const {
    Assignment assignment(assigned_.size());
    for (size_t s = 0; s < assigned_.size(); ++s) {
        if (assigned_[s] != NO_WORD) {
            assignment.assign(s, pool_->word(assigned_[s]));
        }
    }
    return assignment;
}

} // namespace crossfill
