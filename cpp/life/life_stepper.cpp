#include "wraplife/life_stepper.hpp"
#include "wraplife/error.hpp"
#include <limits>
#include <vector>
#include <fmt/core.h>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace wraplife {

static void check_grid(const std::vector<Cell>& state, std::size_t width, std::size_t height) {
    if (width == 0 || height == 0) {
        throw Error(fmt::format("grid dimensions must be non-zero, got {}x{}", width, height));
    }
    if (width > std::numeric_limits<std::size_t>::max() / height) {
        throw Error(fmt::format("grid of {}x{} cells is too large", width, height));
    }
    if (state.size() != width * height) {
        throw Error(fmt::format("cell buffer holds {} cells, expected {}x{}", state.size(), width, height));
    }
}

static unsigned neighbours_unchecked(const std::vector<Cell>& state, std::size_t width, std::size_t height,
                                     std::size_t row, std::size_t column) {
    unsigned count = 0;
    const std::size_t row_deltas[3] = {height - 1, 0, 1};
    const std::size_t col_deltas[3] = {width - 1, 0, 1};
    for (std::size_t delta_row : row_deltas) {
        for (std::size_t delta_col : col_deltas) {
            if (delta_row == 0 && delta_col == 0) continue;
            const std::size_t nr = (row + delta_row) % height;
            const std::size_t nc = (column + delta_col) % width;
            if (nr == row && nc == column) continue;
            count += is_alive(state[nr * width + nc]) ? 1u : 0u;
        }
    }
    return count;
}

unsigned count_live_neighbours(const std::vector<Cell>& state, std::size_t width, std::size_t height,
                               std::size_t row, std::size_t column) {
    check_grid(state, width, height);
    if (row >= height || column >= width) {
        throw Error(fmt::format("cell ({}, {}) is outside a {}x{} grid", row, column, width, height));
    }
    return neighbours_unchecked(state, width, height, row, column);
}

Cell next_cell_state(Cell cell, unsigned live_neighbours) {
    if (cell == Cell::Alive) {
        return (live_neighbours == 2 || live_neighbours == 3) ? Cell::Alive : Cell::Dead;
    }
    return live_neighbours == 3 ? Cell::Alive : Cell::Dead;
}

std::vector<Cell> life_step(const std::vector<Cell>& state, std::size_t width, std::size_t height) {
    check_grid(state, width, height);
    std::vector<Cell> out(state.size(), Cell::Dead);

    #pragma omp parallel for collapse(2) if(width * height > 4096)
    for (std::size_t y = 0; y < height; ++y) {
        for (std::size_t x = 0; x < width; ++x) {
            const std::size_t idx = y * width + x;
            out[idx] = next_cell_state(state[idx], neighbours_unchecked(state, width, height, y, x));
        }
    }
    return out;
}

}
