#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstdint>
#include "wraplife/error.hpp"
#include "wraplife/metrics.hpp"
#include "wraplife/universe.hpp"

namespace py = pybind11;
using namespace wraplife;

static std::vector<Cell> cells_from_array(py::array_t<std::uint8_t, py::array::c_style | py::array::forcecast> state) {
    auto buf = state.request();
    const auto* ptr = static_cast<const std::uint8_t*>(buf.ptr);
    std::vector<Cell> cells;
    cells.reserve(static_cast<std::size_t>(buf.size));
    for (py::ssize_t i = 0; i < buf.size; ++i) {
        cells.push_back(ptr[i] != 0 ? Cell::Alive : Cell::Dead);
    }
    return cells;
}

// (height, width) copy of the current generation. The array owns its data, so
// later ticks or resizes do not touch it.
static py::array_t<std::uint8_t> py_cells(const Universe& u) {
    const std::vector<std::uint8_t> bytes = cell_bytes(u.get_cells());
    return py::array_t<std::uint8_t>({static_cast<long>(u.height()), static_cast<long>(u.width())}, bytes.data());
}

PYBIND11_MODULE(wraplife_native, m) {
    py::register_exception<Error>(m, "LifeError", PyExc_ValueError);

    py::class_<Universe>(m, "Universe")
        .def(py::init([](std::size_t width, std::size_t height, bool seeded) {
                 UniverseParams params;
                 params.width = width;
                 params.height = height;
                 params.seed = seeded ? SeedPattern::Demo : SeedPattern::Empty;
                 return Universe(params);
             }),
             py::arg("width") = 64, py::arg("height") = 64, py::arg("seeded") = true)
        .def_property("width", &Universe::width, &Universe::set_width)
        .def_property("height", &Universe::height, &Universe::set_height)
        .def("set_width", &Universe::set_width, "Resize columns; clears every cell")
        .def("set_height", &Universe::set_height, "Resize rows; clears every cell")
        .def("get_index", &Universe::get_index)
        .def("live_neighbour_count", &Universe::live_neighbour_count)
        .def("tick", &Universe::tick, "Advance one generation")
        .def("set_cells", &Universe::set_cells, "Mark (row, column) pairs alive")
        .def("cells", &py_cells, "uint8 copy of the current generation")
        .def("population", &Universe::population)
        .def("render", &Universe::render)
        .def("__str__", &Universe::render);

    m.def("population", [](py::array_t<std::uint8_t> state) { return population(cells_from_array(state)); });
    m.def("density", [](py::array_t<std::uint8_t> state) { return density(cells_from_array(state)); });
    m.def("entropy", [](py::array_t<std::uint8_t> state) { return entropy(cells_from_array(state)); },
          "Alive/dead entropy in bits");
}
