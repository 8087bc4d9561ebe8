#pragma once
#include <vector>
#include <cstddef>
#include "wraplife/cell.hpp"

namespace wraplife {
// Live cells among the 8 toroidal neighbours of (row, column). Offsets that
// wrap back onto the cell itself are not counted.
unsigned count_live_neighbours(const std::vector<Cell>& state, std::size_t width, std::size_t height,
                               std::size_t row, std::size_t column);

Cell next_cell_state(Cell cell, unsigned live_neighbours);

std::vector<Cell> life_step(const std::vector<Cell>& state, std::size_t width, std::size_t height);
}
