#pragma once

#include <cstddef>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "qtopo/core/geometry/position.h"
#include "qtopo/core/utils/enums.h"

namespace qtopo {

// Boundary bases of a cube along x, y and z, e.g. "ZXZ".
class ZXCube {
 public:
  // Throws std::invalid_argument for Y bases or for three identical bases.
  ZXCube(Basis x, Basis y, Basis z);

  // Throws std::invalid_argument on anything but three characters among 'X' and 'Z'.
  static ZXCube from_string(std::string_view kind);

  Basis x() const noexcept { return x_; }
  Basis y() const noexcept { return y_; }
  Basis z() const noexcept { return z_; }
  Basis get_basis_along(Direction3D direction) const noexcept;

  // All spatial boundaries share one basis ("XXZ" or "ZZX").
  bool is_spatial() const noexcept { return x_ == y_; }

  std::string str() const;

  bool operator==(const ZXCube& other) const noexcept { return x_ == other.x_ && y_ == other.y_ && z_ == other.z_; }
  bool operator!=(const ZXCube& other) const noexcept { return !(*this == other); }

 private:
  Basis x_;
  Basis y_;
  Basis z_;
};

// Wall bases of a pipe at its head; the open direction has no basis ("OXZ").
class PipeKind {
 public:
  // Throws std::invalid_argument unless exactly one basis is missing and the two
  // walls differ.
  PipeKind(std::optional<Basis> x, std::optional<Basis> y, std::optional<Basis> z, bool has_hadamard = false);

  // "OXZ", "ZOX", "XZO", optionally followed by 'H'.
  static PipeKind from_string(std::string_view kind);
  // Walls of a pipe leaving a cube of the given kind along `direction`.
  static PipeKind from_cube_kind(const ZXCube& kind, Direction3D direction, bool cube_at_head,
                                 bool has_hadamard = false);

  const std::optional<Basis>& x() const noexcept { return x_; }
  const std::optional<Basis>& y() const noexcept { return y_; }
  const std::optional<Basis>& z() const noexcept { return z_; }
  bool has_hadamard() const noexcept { return has_hadamard_; }

  Direction3D direction() const noexcept;
  // std::nullopt along the pipe direction. The tail side of a Hadamard pipe is flipped.
  std::optional<Basis> get_basis_along(Direction3D direction, bool at_head = true) const;

  bool is_temporal() const noexcept { return !z_.has_value(); }
  bool is_spatial() const noexcept { return !is_temporal(); }

  std::string str() const;

  bool operator==(const PipeKind& other) const noexcept {
    return x_ == other.x_ && y_ == other.y_ && z_ == other.z_ && has_hadamard_ == other.has_hadamard_;
  }
  bool operator!=(const PipeKind& other) const noexcept { return !(*this == other); }

 private:
  std::optional<Basis> x_;
  std::optional<Basis> y_;
  std::optional<Basis> z_;
  bool has_hadamard_;
};

struct Cube {
  BlockPosition3D position;
  ZXCube kind;
  std::string label;

  bool operator==(const Cube& other) const noexcept { return position == other.position && kind == other.kind; }
  bool operator!=(const Cube& other) const noexcept { return !(*this == other); }
  std::string str() const;
};

// Junction between two neighbouring cubes; u always has the smaller position.
class Pipe {
 public:
  // Throws CompilationError if the cubes are not neighbours along the pipe direction or
  // if the pipe walls do not match the cube boundaries.
  Pipe(Cube u, Cube v, PipeKind kind);

  // Infers the kind from the cubes. Throws CompilationError if none fits.
  static Pipe from_cubes(const Cube& u, const Cube& v);

  const Cube& u() const noexcept { return u_; }
  const Cube& v() const noexcept { return v_; }
  const PipeKind& kind() const noexcept { return kind_; }
  Direction3D direction() const noexcept { return kind_.direction(); }

  // Throws std::invalid_argument if `position` is not an end of the pipe.
  bool at_head(const BlockPosition3D& position) const;

  bool operator==(const Pipe& other) const noexcept {
    return u_ == other.u_ && v_ == other.v_ && kind_ == other.kind_;
  }
  bool operator!=(const Pipe& other) const noexcept { return !(*this == other); }
  std::string str() const;

 private:
  Cube u_;
  Cube v_;
  PipeKind kind_;
};

// Cubes on integer positions joined by pipes.
class BlockGraph {
 public:
  explicit BlockGraph(std::string name = "") : name_(std::move(name)) {}

  // Throws CompilationError if a cube already sits at `position`.
  void add_cube(const BlockPosition3D& position, const ZXCube& kind, std::string label = "");
  // Throws CompilationError for missing cubes, non-neighbouring positions, duplicate
  // pipes and kinds that do not fit the cubes. The kind is inferred when absent.
  void add_pipe(const BlockPosition3D& u, const BlockPosition3D& v, std::optional<PipeKind> kind = std::nullopt);

  const std::string& name() const noexcept { return name_; }
  bool has_cube(const BlockPosition3D& position) const { return cubes_.count(position) != 0; }
  // Throws LookupError when absent.
  const Cube& get_cube(const BlockPosition3D& position) const;
  bool has_pipe(const BlockPosition3D& u, const BlockPosition3D& v) const;

  std::vector<Cube> cubes() const;
  std::vector<Pipe> pipes() const;
  std::vector<Pipe> pipes_at(const BlockPosition3D& position) const;
  std::size_t num_cubes() const noexcept { return cubes_.size(); }
  std::size_t num_pipes() const noexcept { return pipes_.size(); }
  bool empty() const noexcept { return cubes_.empty(); }

  // Components in the order of their smallest cube position.
  std::vector<BlockGraph> connected_components() const;
  BlockGraph shifted_by(Coordinate dx, Coordinate dy, Coordinate dz) const;
  // Throws CompilationError on an empty graph.
  Coordinate min_z() const;
  Coordinate max_z() const;

  // One statement per line: "cube x y z KIND [label]" or "pipe x1 y1 z1 x2 y2 z2 [KIND]".
  // '#' starts a comment. Throws std::invalid_argument on malformed lines.
  static BlockGraph from_text(std::istream& input, std::string name = "");

 private:
  std::string name_;
  std::map<BlockPosition3D, Cube> cubes_;
  std::map<std::pair<BlockPosition3D, BlockPosition3D>, Pipe> pipes_;
};

}  // namespace qtopo
