#include "wraplife/metrics.hpp"
#include <cmath>

namespace wraplife {

std::size_t population(const std::vector<Cell>& cells) {
    std::size_t alive = 0;
    for (Cell c : cells) {
        if (is_alive(c)) ++alive;
    }
    return alive;
}

double density(const std::vector<Cell>& cells) {
    if (cells.empty()) return 0.0;
    return static_cast<double>(population(cells)) / static_cast<double>(cells.size());
}

double entropy(const std::vector<Cell>& cells) {
    const double p = density(cells);
    double h = 0.0;
    for (double q : {p, 1.0 - p}) {
        if (q > 0.0) h -= q * std::log2(q);
    }
    return h;
}

}
