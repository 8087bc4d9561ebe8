#include "wraplife/universe.hpp"
#include "wraplife/error.hpp"
#include "wraplife/life_stepper.hpp"
#include "wraplife/metrics.hpp"
#include <fmt/core.h>
#include <limits>
#include <stdexcept>

namespace wraplife {

static const char* const kAliveGlyph = "◼";
static const char* const kDeadGlyph = "◻";

static std::vector<Cell> seed_cells(std::size_t width, std::size_t height, SeedPattern seed) {
    std::vector<Cell> cells(width * height, Cell::Dead);
    if (seed == SeedPattern::Demo) {
        for (std::size_t i = 0; i < cells.size(); ++i) {
            if (i % 2 == 0 || i % 7 == 0) cells[i] = Cell::Alive;
        }
    }
    return cells;
}

// Rejects zero dimensions and any width * height that does not fit in size_t.
static void require_dimensions(std::size_t width, std::size_t height) {
    if (width == 0 || height == 0) {
        throw Error(fmt::format("universe dimensions must be at least 1, got {}x{}", width, height));
    }
    if (width > std::numeric_limits<std::size_t>::max() / height) {
        throw Error(fmt::format("universe of {}x{} cells is too large", width, height));
    }
}

std::size_t parse_count(const std::string& text, const char* what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw Error(fmt::format("{} '{}' is not a non-negative number", what, text));
    }
    try {
        return static_cast<std::size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw Error(fmt::format("{} '{}' is out of range", what, text));
    }
}

Universe::Universe() : Universe(UniverseParams{}) {}

Universe::Universe(const UniverseParams& params)
    : width_(params.width), height_(params.height) {
    require_dimensions(width_, height_);
    cells_ = seed_cells(width_, height_, params.seed);
}

std::size_t Universe::width() const {
    return width_;
}

std::size_t Universe::height() const {
    return height_;
}

void Universe::set_width(std::size_t width) {
    require_dimensions(width, height_);
    cells_.assign(width * height_, Cell::Dead);
    width_ = width;
}

void Universe::set_height(std::size_t height) {
    require_dimensions(width_, height);
    cells_.assign(width_ * height, Cell::Dead);
    height_ = height;
}

std::size_t Universe::get_index(std::size_t row, std::size_t column) const {
    if (row >= height_ || column >= width_) {
        throw Error(fmt::format("cell ({}, {}) is outside a {}x{} universe", row, column, width_, height_));
    }
    return row * width_ + column;
}

unsigned Universe::live_neighbour_count(std::size_t row, std::size_t column) const {
    return count_live_neighbours(cells_, width_, height_, row, column);
}

void Universe::tick() {
    std::vector<Cell> next = life_step(cells_, width_, height_);
    cells_.swap(next);
}

void Universe::set_cells(const std::vector<std::pair<std::size_t, std::size_t>>& cells) {
    std::vector<std::size_t> indices;
    indices.reserve(cells.size());
    for (const auto& rc : cells) {
        indices.push_back(get_index(rc.first, rc.second));
    }
    for (std::size_t idx : indices) {
        cells_[idx] = Cell::Alive;
    }
}

const std::vector<Cell>& Universe::get_cells() const {
    return cells_;
}

const Cell* Universe::cells() const {
    return cells_.data();
}

std::size_t Universe::population() const {
    return wraplife::population(cells_);
}

std::string Universe::render() const {
    std::string out;
    out.reserve(cells_.size() * 3 + height_);
    for (std::size_t row = 0; row < height_; ++row) {
        for (std::size_t col = 0; col < width_; ++col) {
            out += is_alive(cells_[row * width_ + col]) ? kAliveGlyph : kDeadGlyph;
        }
        out += '\n';
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Universe& universe) {
    return os << universe.render();
}

}
