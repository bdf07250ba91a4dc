#include "qtopo/core/compile/compile.h"
#include "qtopo/core/computation/block_graph.h"
#include "qtopo/core/noise/noise_model.h"
#include "stim/circuit/circuit.h"

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CliOptions {
  std::string graph_path;
  std::vector<std::int64_t> ks = {1};
  std::optional<double> p;
  bool distance = false;
  std::string out_path;
  std::string convention = "css";
};

void print_usage() {
  std::cerr << "Usage: qtopo_compile --graph <file> [--k 1,2,3] [--p <prob>] [--distance] [--out <file>]\n"
               "                     [--convention css|fixed_boundary]\n";
}

std::vector<std::int64_t> parse_ks(const std::string& text) {
  std::vector<std::int64_t> ks;
  std::stringstream stream(text);
  std::string item;
  while (std::getline(stream, item, ',')) {
    ks.push_back(std::stoll(item));
  }
  if (ks.empty()) {
    throw std::invalid_argument("--k needs at least one value");
  }
  return ks;
}

CliOptions parse_arguments(int argc, char* argv[]) {
  CliOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    const auto next = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value after " + arg);
      }
      return argv[++i];
    };
    if (arg == "--graph") {
      options.graph_path = next();
    } else if (arg == "--k") {
      options.ks = parse_ks(next());
    } else if (arg == "--p") {
      options.p = std::stod(next());
    } else if (arg == "--distance") {
      options.distance = true;
    } else if (arg == "--out") {
      options.out_path = next();
    } else if (arg == "--convention") {
      options.convention = next();
    } else {
      throw std::invalid_argument("Unknown argument: " + arg);
    }
  }
  if (options.graph_path.empty()) {
    throw std::invalid_argument("--graph is required");
  }
  return options;
}

// "circuit.stim" -> "circuit_k2.stim" when several k are compiled.
std::string output_path_for(const std::string& path, std::int64_t k, bool several) {
  if (!several) {
    return path;
  }
  const std::size_t dot = path.rfind('.');
  const std::string suffix = "_k" + std::to_string(k);
  if (dot == std::string::npos) {
    return path + suffix;
  }
  return path.substr(0, dot) + suffix + path.substr(dot);
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    const CliOptions options = parse_arguments(argc, argv);
    std::ifstream input(options.graph_path);
    if (!input) {
      throw std::runtime_error("Cannot open " + options.graph_path);
    }
    const qtopo::BlockGraph graph = qtopo::BlockGraph::from_text(input, options.graph_path);
    qtopo::CompiledGraph compiled = qtopo::compile_block_graph(graph, qtopo::convention_by_name(options.convention));

    std::optional<qtopo::NoiseModel> noise_model;
    if (options.p) {
      noise_model.emplace(qtopo::NoiseModel::uniform_depolarizing(*options.p));
    } else if (options.distance) {
      noise_model.emplace(qtopo::NoiseModel::uniform_depolarizing(1e-3));
    }

    for (std::int64_t k : options.ks) {
      const stim::Circuit circuit = compiled.generate_stim_circuit(k, noise_model);
      std::cout << "k=" << k << " qubits=" << circuit.count_qubits() << " detectors=" << circuit.count_detectors()
                << " observables=" << circuit.count_observables();
      if (options.distance) {
        std::cout << " distance=" << qtopo::compute_graphlike_distance(circuit);
      }
      std::cout << "\n";
      if (!options.out_path.empty()) {
        const std::string path = output_path_for(options.out_path, k, options.ks.size() > 1);
        std::ofstream out(path);
        if (!out) {
          throw std::runtime_error("Cannot write " + path);
        }
        out << circuit << "\n";
      }
    }
  } catch (const std::invalid_argument& error) {
    std::cerr << "Error: " << error.what() << "\n";
    print_usage();
    return 2;
  } catch (const std::exception& error) {
    std::cerr << "Error: " << error.what() << "\n";
    return 1;
  }
  return 0;
}
