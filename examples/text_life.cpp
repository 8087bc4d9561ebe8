#include "wraplife/error.hpp"
#include "wraplife/universe.hpp"

#include <fmt/core.h>

#include <cstdlib>
#include <exception>

using namespace wraplife;

int main(int argc, char** argv) {
    try {
        UniverseParams params;
        params.seed = SeedPattern::Empty;
        std::size_t generations = 8;
        if (argc == 4) {
            params.width = parse_count(argv[1], "width");
            params.height = parse_count(argv[2], "height");
            generations = parse_count(argv[3], "generations");
        } else if (argc != 1) {
            fmt::print(stderr, "usage: {} [width height generations]\n", argv[0]);
            return EXIT_FAILURE;
        }

        Universe universe(params);
        universe.set_cells({{0, 1}, {1, 2}, {2, 0}, {2, 1}, {2, 2}});

        for (std::size_t gen = 0; gen <= generations; ++gen) {
            fmt::print("generation {} population {}\n{}\n", gen, universe.population(), universe.render());
            universe.tick();
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "text_life: {}\n", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
