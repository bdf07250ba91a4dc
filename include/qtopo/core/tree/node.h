#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/circuit/qubit_map.h"
#include "qtopo/core/scale/linear_function.h"
#include "qtopo/core/tree/annotations.h"

namespace stim {
struct Circuit;
}

namespace qtopo {

class LayerNode;

// Visitor over a layer tree; every hook defaults to a no-op.
class NodeWalker {
 public:
  virtual ~NodeWalker() = default;

  virtual void enter_node(LayerNode& /*node*/) {}
  virtual void visit_node(LayerNode& /*node*/) {}
  virtual void exit_node(LayerNode& /*node*/) {}
};

// Node of a layer tree: a LayoutLayer leaf, a sequence or a repetition.
class LayerNode {
 public:
  // Throws CompilationError if `layer` or one of its descendants is a PlaquetteLayer or
  // a RawCircuitLayer: those must be merged into LayoutLayers first.
  explicit LayerNode(const Layer& layer);

  const Layer& layer() const noexcept { return layer_; }
  bool is_leaf() const noexcept { return layer_.is<LayoutLayer>(); }
  bool is_repeated() const noexcept { return layer_.is<RepeatedLayer>(); }
  bool is_sequenced() const noexcept { return layer_.is<SequencedLayers>(); }

  std::vector<LayerNode>& children() noexcept { return children_; }
  const std::vector<LayerNode>& children() const noexcept { return children_; }

  const LayoutLayer& layout_layer() const { return layer_.as<LayoutLayer>(); }
  const LinearFunction& repetitions() const { return layer_.as<RepeatedLayer>().repetitions(); }

  // Creates the annotations for k on first access.
  LayerNodeAnnotations& annotations(std::int64_t k) { return annotations_[k]; }
  // Throws LookupError when nothing was annotated for k.
  const LayerNodeAnnotations& get_annotations(std::int64_t k) const;

  // enter_node, visit_node, children in order, exit_node.
  void walk(NodeWalker& walker);

  // Leaves in execution order; repeated bodies appear once.
  std::vector<LayerNode*> leaves();
  std::vector<const LayerNode*> leaves() const;

  // Circuit of the subtree on the qubits of `global_map`. Throws LookupError when a leaf
  // has no circuit annotation for k.
  stim::Circuit generate_circuit(std::int64_t k, const QubitMap& global_map) const;

 private:
  Layer layer_;
  std::vector<LayerNode> children_;
  std::map<std::int64_t, LayerNodeAnnotations> annotations_;
};

}  // namespace qtopo
