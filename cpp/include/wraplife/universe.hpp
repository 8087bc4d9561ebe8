#pragma once
#include <vector>
#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include "wraplife/cell.hpp"

namespace wraplife {
enum class SeedPattern {
    Demo,   // alive where the linear index is a multiple of 2 or 7
    Empty,
};

struct UniverseParams {
    std::size_t width = 64;
    std::size_t height = 64;
    SeedPattern seed = SeedPattern::Demo;
};

// Parses a non-negative decimal count from a command-line argument; `what`
// names the argument in the error message.
std::size_t parse_count(const std::string& text, const char* what);

// A toroidal Game of Life grid. Cells are stored row-major; every resize
// clears the whole grid.
class Universe {
public:
    Universe();
    explicit Universe(const UniverseParams& params);

    std::size_t width() const;
    std::size_t height() const;

    void set_width(std::size_t width);
    void set_height(std::size_t height);

    std::size_t get_index(std::size_t row, std::size_t column) const;
    unsigned live_neighbour_count(std::size_t row, std::size_t column) const;

    // Advances one generation. The old generation stays readable until the
    // new one is complete.
    void tick();

    // Marks every (row, column) pair alive. Throws before writing anything if
    // any pair lies outside the grid.
    void set_cells(const std::vector<std::pair<std::size_t, std::size_t>>& cells);

    const std::vector<Cell>& get_cells() const;
    const Cell* cells() const;

    std::size_t population() const;

    std::string render() const;

private:
    std::size_t width_;
    std::size_t height_;
    std::vector<Cell> cells_;
};

std::ostream& operator<<(std::ostream& os, const Universe& universe);
}
