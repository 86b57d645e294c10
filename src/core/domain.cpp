#include "crossfill/domain.hpp"
#include <algorithm>
#include <cassert>

namespace crossfill {

Domain::Domain()
    : n_(0) {}

Domain::Domain(size_t count)
    : values_(count)
    , sparse_(count)
    , n_(count) {
    for (size_t v = 0; v < count; ++v) {
        values_[v] = v;
        sparse_[v] = v;
    }
}

std::vector<Domain::value_type> Domain::values() const {
    std::vector<value_type> result(begin(), end());
    std::sort(result.begin(), result.end());
    return result;
}

void Domain::set_n(size_t n) {
    assert(n <= values_.size() && "set_n: size exceeds initial domain");
    n_ = n;
}

void Domain::swap_at(size_t i, size_t j) {
    assert(i < values_.size() && "swap_at: index i out of bounds");
    assert(j < values_.size() && "swap_at: index j out of bounds");
    if (i == j) return;
    value_type vi = values_[i];
    value_type vj = values_[j];
    values_[i] = vj;
    values_[j] = vi;
    sparse_[vi] = j;
    sparse_[vj] = i;
}

} // namespace crossfill
