#include "qtopo/core/computation/block_graph.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "qtopo/core/utils/errors.h"

namespace qtopo {

namespace {

std::optional<Basis> optional_basis_from_char(char c) {
  if (c == 'O') {
    return std::nullopt;
  }
  return basis_from_char(c);
}

char optional_basis_char(const std::optional<Basis>& basis) { return basis ? to_upper_char(*basis) : 'O'; }

std::string upper(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return result;
}

}  // namespace

// ---------------------------------------------------------------- ZXCube

ZXCube::ZXCube(Basis x, Basis y, Basis z) : x_(x), y_(y), z_(z) {
  if (x == Basis::kY || y == Basis::kY || z == Basis::kY) {
    throw std::invalid_argument("ZX cubes only have X and Z boundaries");
  }
  if (x == y && y == z) {
    throw std::invalid_argument("A ZX cube cannot have the same basis on every boundary");
  }
}

ZXCube ZXCube::from_string(std::string_view kind) {
  const std::string name = upper(kind);
  if (name.size() != 3 || name.find_first_not_of("XZ") != std::string::npos) {
    throw std::invalid_argument("Unknown ZX cube kind: '" + std::string(kind) + "'");
  }
  return ZXCube(basis_from_char(name[0]), basis_from_char(name[1]), basis_from_char(name[2]));
}

Basis ZXCube::get_basis_along(Direction3D direction) const noexcept {
  switch (direction) {
    case Direction3D::kX:
      return x_;
    case Direction3D::kY:
      return y_;
    case Direction3D::kZ:
      break;
  }
  return z_;
}

std::string ZXCube::str() const { return {to_upper_char(x_), to_upper_char(y_), to_upper_char(z_)}; }

// ---------------------------------------------------------------- PipeKind

PipeKind::PipeKind(std::optional<Basis> x, std::optional<Basis> y, std::optional<Basis> z, bool has_hadamard)
    : x_(x), y_(y), z_(z), has_hadamard_(has_hadamard) {
  const int open = static_cast<int>(!x_) + static_cast<int>(!y_) + static_cast<int>(!z_);
  if (open != 1) {
    throw std::invalid_argument("Exactly one basis must be open for a pipe, got " + str());
  }
  std::vector<Basis> walls;
  for (const auto& basis : {x_, y_, z_}) {
    if (basis) {
      if (*basis == Basis::kY) {
        throw std::invalid_argument("Pipe walls are X or Z, got " + str());
      }
      walls.push_back(*basis);
    }
  }
  if (walls[0] == walls[1]) {
    throw std::invalid_argument("Pipe walls must have different bases, got " + str());
  }
}

PipeKind PipeKind::from_string(std::string_view kind) {
  const std::string name = upper(kind);
  const bool has_hadamard = name.size() == 4 && name[3] == 'H';
  if (name.size() != 3 && !has_hadamard) {
    throw std::invalid_argument("Unknown pipe kind: '" + std::string(kind) + "'");
  }
  return PipeKind(optional_basis_from_char(name[0]), optional_basis_from_char(name[1]),
                  optional_basis_from_char(name[2]), has_hadamard);
}

PipeKind PipeKind::from_cube_kind(const ZXCube& kind, Direction3D direction, bool cube_at_head, bool has_hadamard) {
  std::optional<Basis> bases[3] = {kind.x(), kind.y(), kind.z()};
  if (!cube_at_head && has_hadamard) {
    for (auto& basis : bases) {
      basis = flipped(*basis);
    }
  }
  bases[static_cast<int>(direction)] = std::nullopt;
  return PipeKind(bases[0], bases[1], bases[2], has_hadamard);
}

Direction3D PipeKind::direction() const noexcept {
  if (!x_) {
    return Direction3D::kX;
  }
  if (!y_) {
    return Direction3D::kY;
  }
  return Direction3D::kZ;
}

std::optional<Basis> PipeKind::get_basis_along(Direction3D direction, bool at_head) const {
  const std::optional<Basis>& head = direction == Direction3D::kX ? x_ : direction == Direction3D::kY ? y_ : z_;
  if (!head) {
    return std::nullopt;
  }
  if (!at_head && has_hadamard_) {
    return flipped(*head);
  }
  return head;
}

std::string PipeKind::str() const {
  std::string result{optional_basis_char(x_), optional_basis_char(y_), optional_basis_char(z_)};
  if (has_hadamard_) {
    result += 'H';
  }
  return result;
}

// ---------------------------------------------------------------- Cube / Pipe

std::string Cube::str() const { return kind.str() + position.str(); }

Pipe::Pipe(Cube u, Cube v, PipeKind kind) : u_(std::move(u)), v_(std::move(v)), kind_(std::move(kind)) {
  if (v_.position < u_.position) {
    std::swap(u_, v_);
  }
  if (u_.position.shifted_in(kind_.direction(), 1) != v_.position) {
    throw CompilationError("Pipe " + kind_.str() + " must join neighbours along " +
                           std::string(1, to_char(kind_.direction())) + ", got " + u_.position.str() + " and " +
                           v_.position.str());
  }
  for (Direction3D direction : {Direction3D::kX, Direction3D::kY, Direction3D::kZ}) {
    if (direction == kind_.direction()) {
      continue;
    }
    if (u_.kind.get_basis_along(direction) != *kind_.get_basis_along(direction, true) ||
        v_.kind.get_basis_along(direction) != *kind_.get_basis_along(direction, false)) {
      throw CompilationError("Pipe " + kind_.str() + " does not match the boundaries of " + u_.str() + " and " +
                             v_.str());
    }
  }
}

Pipe Pipe::from_cubes(const Cube& u, const Cube& v) {
  const Cube& head = u.position < v.position ? u : v;
  const Cube& tail = u.position < v.position ? v : u;
  if (!head.position.is_neighbour(tail.position)) {
    throw CompilationError("Cannot join " + head.str() + " and " + tail.str() + ": they are not neighbours");
  }
  const Direction3D direction = direction_between(head.position, tail.position);
  std::set<bool> hadamard;
  for (Direction3D other : {Direction3D::kX, Direction3D::kY, Direction3D::kZ}) {
    if (other != direction) {
      hadamard.insert(head.kind.get_basis_along(other) != tail.kind.get_basis_along(other));
    }
  }
  if (hadamard.size() != 1) {
    throw CompilationError("Cannot infer a pipe kind between " + head.str() + " and " + tail.str());
  }
  return Pipe(head, tail, PipeKind::from_cube_kind(head.kind, direction, true, *hadamard.begin()));
}

bool Pipe::at_head(const BlockPosition3D& position) const {
  if (position == u_.position) {
    return true;
  }
  if (position == v_.position) {
    return false;
  }
  throw std::invalid_argument(position.str() + " is not an end of pipe " + str());
}

std::string Pipe::str() const { return u_.str() + " -" + kind_.str() + "- " + v_.str(); }

// ---------------------------------------------------------------- BlockGraph

void BlockGraph::add_cube(const BlockPosition3D& position, const ZXCube& kind, std::string label) {
  if (has_cube(position)) {
    throw CompilationError("A cube already exists at " + position.str());
  }
  cubes_.emplace(position, Cube{position, kind, std::move(label)});
}

void BlockGraph::add_pipe(const BlockPosition3D& u, const BlockPosition3D& v, std::optional<PipeKind> kind) {
  if (!has_cube(u) || !has_cube(v)) {
    throw CompilationError("Both ends of a pipe must be cubes, got " + u.str() + " and " + v.str());
  }
  if (!u.is_neighbour(v)) {
    throw CompilationError("Pipe ends " + u.str() + " and " + v.str() + " are not neighbours");
  }
  if (has_pipe(u, v)) {
    throw CompilationError("A pipe already joins " + u.str() + " and " + v.str());
  }
  Pipe pipe = kind ? Pipe(get_cube(u), get_cube(v), *kind) : Pipe::from_cubes(get_cube(u), get_cube(v));
  auto key = std::make_pair(pipe.u().position, pipe.v().position);
  pipes_.emplace(std::move(key), std::move(pipe));
}

const Cube& BlockGraph::get_cube(const BlockPosition3D& position) const {
  const auto it = cubes_.find(position);
  if (it == cubes_.end()) {
    throw LookupError("No cube at " + position.str());
  }
  return it->second;
}

bool BlockGraph::has_pipe(const BlockPosition3D& u, const BlockPosition3D& v) const {
  return pipes_.count(u < v ? std::make_pair(u, v) : std::make_pair(v, u)) != 0;
}

std::vector<Cube> BlockGraph::cubes() const {
  std::vector<Cube> result;
  result.reserve(cubes_.size());
  for (const auto& entry : cubes_) {
    result.push_back(entry.second);
  }
  return result;
}

std::vector<Pipe> BlockGraph::pipes() const {
  std::vector<Pipe> result;
  result.reserve(pipes_.size());
  for (const auto& entry : pipes_) {
    result.push_back(entry.second);
  }
  return result;
}

std::vector<Pipe> BlockGraph::pipes_at(const BlockPosition3D& position) const {
  std::vector<Pipe> result;
  for (const auto& entry : pipes_) {
    if (entry.first.first == position || entry.first.second == position) {
      result.push_back(entry.second);
    }
  }
  return result;
}

std::vector<BlockGraph> BlockGraph::connected_components() const {
  std::vector<BlockGraph> components;
  std::set<BlockPosition3D> visited;
  for (const auto& entry : cubes_) {
    const BlockPosition3D& start = entry.first;
    if (visited.count(start) != 0) {
      continue;
    }
    BlockGraph component(name_);
    std::vector<BlockPosition3D> frontier = {start};
    visited.insert(start);
    std::set<std::pair<BlockPosition3D, BlockPosition3D>> component_pipes;
    while (!frontier.empty()) {
      const BlockPosition3D position = frontier.back();
      frontier.pop_back();
      component.cubes_.emplace(position, cubes_.at(position));
      for (const Pipe& pipe : pipes_at(position)) {
        component_pipes.emplace(pipe.u().position, pipe.v().position);
        const BlockPosition3D& other = pipe.at_head(position) ? pipe.v().position : pipe.u().position;
        if (visited.insert(other).second) {
          frontier.push_back(other);
        }
      }
    }
    for (const auto& key : component_pipes) {
      component.pipes_.emplace(key, pipes_.at(key));
    }
    components.push_back(std::move(component));
  }
  return components;
}

BlockGraph BlockGraph::shifted_by(Coordinate dx, Coordinate dy, Coordinate dz) const {
  BlockGraph shifted(name_);
  for (const auto& [position, cube] : cubes_) {
    shifted.add_cube(position.shifted(dx, dy, dz), cube.kind, cube.label);
  }
  for (const auto& [key, pipe] : pipes_) {
    shifted.add_pipe(key.first.shifted(dx, dy, dz), key.second.shifted(dx, dy, dz), pipe.kind());
  }
  return shifted;
}

Coordinate BlockGraph::min_z() const {
  if (cubes_.empty()) {
    throw CompilationError("An empty block graph has no depth");
  }
  Coordinate result = cubes_.begin()->first.z;
  for (const auto& entry : cubes_) {
    result = std::min(result, entry.first.z);
  }
  return result;
}

Coordinate BlockGraph::max_z() const {
  if (cubes_.empty()) {
    throw CompilationError("An empty block graph has no depth");
  }
  Coordinate result = cubes_.begin()->first.z;
  for (const auto& entry : cubes_) {
    result = std::max(result, entry.first.z);
  }
  return result;
}

BlockGraph BlockGraph::from_text(std::istream& input, std::string name) {
  BlockGraph graph(std::move(name));
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    std::istringstream tokens(line);
    std::string statement;
    if (!(tokens >> statement)) {
      continue;
    }
    const std::string where = "line " + std::to_string(line_number) + ": ";
    if (statement == "cube") {
      BlockPosition3D position;
      std::string kind;
      if (!(tokens >> position.x >> position.y >> position.z >> kind)) {
        throw std::invalid_argument(where + "expected 'cube x y z KIND [label]'");
      }
      std::string label;
      tokens >> label;
      graph.add_cube(position, ZXCube::from_string(kind), label);
    } else if (statement == "pipe") {
      BlockPosition3D u;
      BlockPosition3D v;
      if (!(tokens >> u.x >> u.y >> u.z >> v.x >> v.y >> v.z)) {
        throw std::invalid_argument(where + "expected 'pipe x1 y1 z1 x2 y2 z2 [KIND]'");
      }
      std::string kind;
      if (tokens >> kind) {
        graph.add_pipe(u, v, PipeKind::from_string(kind));
      } else {
        graph.add_pipe(u, v);
      }
    } else {
      throw std::invalid_argument(where + "unknown statement '" + statement + "'");
    }
  }
  return graph;
}

}  // namespace qtopo
