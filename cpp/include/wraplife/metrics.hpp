#pragma once
#include <vector>
#include <cstddef>
#include "wraplife/cell.hpp"

namespace wraplife {
std::size_t population(const std::vector<Cell>& cells);
double density(const std::vector<Cell>& cells);
// Shannon entropy in bits of the alive/dead split.
double entropy(const std::vector<Cell>& cells);
}
