#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include "qtopo/core/compile/compile.h"
#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/noise/noise_model.h"
#include "qtopo/core/scale/linear_function.h"

namespace py = pybind11;

namespace {

using PositionTuple = std::tuple<std::int64_t, std::int64_t, std::int64_t>;

qtopo::BlockPosition3D to_position(const PositionTuple& position) {
  return {std::get<0>(position), std::get<1>(position), std::get<2>(position)};
}

std::string noise_repr(const qtopo::NoiseStrengths& strengths) {
  std::ostringstream out;
  out << "NoiseStrengths(after_single_qubit_gate=" << strengths.after_single_qubit_gate
      << ", after_two_qubit_gate=" << strengths.after_two_qubit_gate
      << ", after_reset_flip=" << strengths.after_reset_flip
      << ", before_measure_flip=" << strengths.before_measure_flip << ")";
  return out.str();
}

struct MemoryResult {
  std::string circuit;
  std::size_t num_detectors = 0;
  std::size_t num_observables = 0;
  std::optional<std::size_t> distance;
};

MemoryResult compile_memory(const qtopo::BlockGraph& graph, std::int64_t k, std::optional<double> p,
                            bool compute_distance, const std::string& convention) {
  qtopo::CompiledGraph compiled = qtopo::compile_block_graph(graph, qtopo::convention_by_name(convention));
  std::optional<qtopo::NoiseModel> noise_model;
  if (p) {
    noise_model.emplace(qtopo::NoiseModel::uniform_depolarizing(*p));
  }
  const stim::Circuit circuit = compiled.generate_stim_circuit(k, noise_model);
  MemoryResult result;
  result.circuit = circuit.str();
  result.num_detectors = circuit.count_detectors();
  result.num_observables = circuit.count_observables();
  if (compute_distance) {
    result.distance = qtopo::compute_graphlike_distance(circuit);
  }
  return result;
}

}  // namespace

PYBIND11_MODULE(qtopo_py, m) {
  m.doc() = "Python bindings for the qtopo topological compilation library";

  py::class_<qtopo::LinearFunction>(m, "LinearFunction")
      .def(py::init([](std::int64_t slope, std::int64_t offset) { return qtopo::LinearFunction(slope, offset); }),
           py::arg("slope") = 0, py::arg("offset") = 0)
      .def("__call__", [](const qtopo::LinearFunction& f, std::int64_t k) { return f(k).to_double(); },
           py::arg("k"))
      .def("integer_eval", &qtopo::LinearFunction::integer_eval, py::arg("k"))
      .def("is_constant", &qtopo::LinearFunction::is_constant)
      .def("exact_integer_div", &qtopo::LinearFunction::exact_integer_div, py::arg("div"))
      .def("__add__", [](const qtopo::LinearFunction& a, const qtopo::LinearFunction& b) { return a + b; })
      .def("__sub__", [](const qtopo::LinearFunction& a, const qtopo::LinearFunction& b) { return a - b; })
      .def("__eq__", [](const qtopo::LinearFunction& a, const qtopo::LinearFunction& b) { return a == b; })
      .def("__repr__", &qtopo::LinearFunction::str);

  py::class_<qtopo::BlockGraph>(m, "BlockGraph")
      .def(py::init<std::string>(), py::arg("name") = "")
      .def_static("from_text",
                  [](const std::string& text, const std::string& name) {
                    std::istringstream input(text);
                    return qtopo::BlockGraph::from_text(input, name);
                  },
                  py::arg("text"), py::arg("name") = "")
      .def("add_cube",
           [](qtopo::BlockGraph& graph, const PositionTuple& position, const std::string& kind,
              const std::string& label) {
             graph.add_cube(to_position(position), qtopo::ZXCube::from_string(kind), label);
           },
           py::arg("position"), py::arg("kind"), py::arg("label") = "")
      .def("add_pipe",
           [](qtopo::BlockGraph& graph, const PositionTuple& u, const PositionTuple& v,
              std::optional<std::string> kind) {
             std::optional<qtopo::PipeKind> pipe_kind;
             if (kind) {
               pipe_kind = qtopo::PipeKind::from_string(*kind);
             }
             graph.add_pipe(to_position(u), to_position(v), pipe_kind);
           },
           py::arg("u"), py::arg("v"), py::arg("kind") = py::none())
      .def_property_readonly("name", &qtopo::BlockGraph::name)
      .def_property_readonly("num_cubes", &qtopo::BlockGraph::num_cubes)
      .def_property_readonly("num_pipes", &qtopo::BlockGraph::num_pipes);

  py::class_<qtopo::NoiseStrengths>(m, "NoiseStrengths")
      .def(py::init<>())
      .def_readwrite("after_single_qubit_gate", &qtopo::NoiseStrengths::after_single_qubit_gate)
      .def_readwrite("after_two_qubit_gate", &qtopo::NoiseStrengths::after_two_qubit_gate)
      .def_readwrite("after_reset_flip", &qtopo::NoiseStrengths::after_reset_flip)
      .def_readwrite("before_measure_flip", &qtopo::NoiseStrengths::before_measure_flip)
      .def("__repr__", &noise_repr);

  py::class_<qtopo::NoiseModel>(m, "NoiseModel")
      .def(py::init<qtopo::NoiseStrengths>(), py::arg("strengths"))
      .def_static("uniform_depolarizing", &qtopo::NoiseModel::uniform_depolarizing, py::arg("p"))
      .def_property_readonly("strengths", &qtopo::NoiseModel::strengths);

  py::class_<MemoryResult>(m, "MemoryResult")
      .def_readonly("circuit", &MemoryResult::circuit)
      .def_readonly("num_detectors", &MemoryResult::num_detectors)
      .def_readonly("num_observables", &MemoryResult::num_observables)
      .def_readonly("distance", &MemoryResult::distance);

  m.def("compile_memory", &compile_memory, py::arg("graph"), py::arg("k"), py::arg("p") = py::none(),
        py::arg("compute_distance") = false, py::arg("convention") = "css",
        "Compiles a block graph with the named convention (\"css\" or \"fixed_boundary\") and returns the stim "
        "circuit text.");
}
