#include "crossfill/assignment.hpp"
#include <cctype>
#include <set>

namespace crossfill {

namespace {

bool fail(std::string* reason, std::string message) {
    if (reason) {
        *reason = std::move(message);
    }
    return false;
}

char upper(char ch) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
}

}  // namespace

size_t Assignment::num_assigned() const {
    size_t count = 0;
    for (const auto& word : words_) {
        if (!word.empty()) ++count;
    }
    return count;
}

std::vector<std::string> Assignment::letter_grid(const Topology& topology) const {
    std::vector<std::string> grid(topology.rows(), std::string(topology.cols(), '#'));
    for (size_t r = 0; r < topology.rows(); ++r) {
        for (size_t c = 0; c < topology.cols(); ++c) {
            if (topology.is_open(r, c)) grid[r][c] = ' ';
        }
    }

    for (const auto& slot : topology.slots()) {
        if (slot.id >= words_.size()) break;
        const auto& word = words_[slot.id];
        for (size_t k = 0; k < word.size() && k < slot.cells.size(); ++k) {
            grid[slot.cells[k].row][slot.cells[k].col] = upper(word[k]);
        }
    }
    return grid;
}

bool verify_assignment(const Topology& topology, const WordPool& pool,
                       const Assignment& assignment, std::string* reason) {
    const auto& slots = topology.slots();
    if (assignment.num_slots() != slots.size()) {
        return fail(reason, "assignment has " + std::to_string(assignment.num_slots()) +
                            " slots, topology has " + std::to_string(slots.size()));
    }

    std::set<std::string> used;
    for (const auto& slot : slots) {
        if (!assignment.is_assigned(slot.id)) {
            return fail(reason, "slot " + std::to_string(slot.id) + " is unassigned");
        }
        const auto& word = assignment.word(slot.id);
        if (word.size() != slot.length()) {
            return fail(reason, "slot " + std::to_string(slot.id) + " has length " +
                                std::to_string(slot.length()) + " but word " + word +
                                " has length " + std::to_string(word.size()));
        }
        size_t id = pool.find(word);
        if (id == SIZE_MAX) {
            return fail(reason, "word " + word + " is not in the pool");
        }
        if (!used.insert(pool.word(id)).second) {
            return fail(reason, "word " + pool.word(id) + " is used more than once");
        }
    }

    for (const auto& x : topology.intersections()) {
        char a = upper(assignment.word(x.across)[x.across_offset]);
        char d = upper(assignment.word(x.down)[x.down_offset]);
        if (a != d) {
            return fail(reason, "letters disagree at (" + std::to_string(x.cell.row) + ", " +
                                std::to_string(x.cell.col) + "): " + a + " vs " + d);
        }
    }

    return true;
}

} // namespace crossfill
