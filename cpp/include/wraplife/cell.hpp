#pragma once
#include <cstdint>
#include <vector>

namespace wraplife {
enum class Cell : std::uint8_t {
    Dead = 0,
    Alive = 1,
};

inline bool is_alive(Cell cell) {
    return cell == Cell::Alive;
}

// Owning 0/1 byte copy of a cell buffer for hosts that take raw bytes.
inline std::vector<std::uint8_t> cell_bytes(const std::vector<Cell>& cells) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(cells.size());
    for (Cell c : cells) {
        bytes.push_back(is_alive(c) ? 1 : 0);
    }
    return bytes;
}
}
