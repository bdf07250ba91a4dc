#include "qtopo/core/tree/node.h"

#include <string>

#include "stim/circuit/circuit.h"
#include "stim/circuit/gate_target.h"

#include "qtopo/core/utils/errors.h"

namespace qtopo {

namespace {

std::vector<uint32_t> record_targets(const std::vector<std::int64_t>& offsets) {
  std::vector<uint32_t> targets;
  targets.reserve(offsets.size());
  for (std::int64_t offset : offsets) {
    targets.push_back(static_cast<uint32_t>(-offset) | stim::TARGET_RECORD_BIT);
  }
  return targets;
}

}  // namespace

LayerNode::LayerNode(const Layer& layer) : layer_(layer) {
  if (layer_.is<PlaquetteLayer>() || layer_.is<RawCircuitLayer>()) {
    throw CompilationError("Layer tree leaves must be layout layers");
  }
  if (layer_.is<SequencedLayers>()) {
    for (const Layer& child : layer_.as<SequencedLayers>().layer_sequence()) {
      children_.emplace_back(child);
    }
  } else if (layer_.is<RepeatedLayer>()) {
    children_.emplace_back(layer_.as<RepeatedLayer>().internal_layer());
  }
}

const LayerNodeAnnotations& LayerNode::get_annotations(std::int64_t k) const {
  const auto it = annotations_.find(k);
  if (it == annotations_.end()) {
    throw LookupError("No annotation for k = " + std::to_string(k));
  }
  return it->second;
}

void LayerNode::walk(NodeWalker& walker) {
  walker.enter_node(*this);
  walker.visit_node(*this);
  for (LayerNode& child : children_) {
    child.walk(walker);
  }
  walker.exit_node(*this);
}

std::vector<LayerNode*> LayerNode::leaves() {
  if (is_leaf()) {
    return {this};
  }
  std::vector<LayerNode*> result;
  for (LayerNode& child : children_) {
    const std::vector<LayerNode*> child_leaves = child.leaves();
    result.insert(result.end(), child_leaves.begin(), child_leaves.end());
  }
  return result;
}

std::vector<const LayerNode*> LayerNode::leaves() const {
  if (is_leaf()) {
    return {this};
  }
  std::vector<const LayerNode*> result;
  for (const LayerNode& child : children_) {
    const std::vector<const LayerNode*> child_leaves = child.leaves();
    result.insert(result.end(), child_leaves.begin(), child_leaves.end());
  }
  return result;
}

stim::Circuit LayerNode::generate_circuit(std::int64_t k, const QubitMap& global_map) const {
  stim::Circuit circuit;
  if (is_leaf()) {
    const LayerNodeAnnotations& annotations = get_annotations(k);
    if (!annotations.circuit) {
      throw LookupError("Leaf has no circuit annotation for k = " + std::to_string(k));
    }
    circuit = annotations.circuit->get_circuit(global_map, false);
    circuit.safe_append_u("SHIFT_COORDS", {}, {0.0, 0.0, 1.0});
    for (const DetectorAnnotation& detector : annotations.detectors) {
      circuit.safe_append_u("DETECTOR", record_targets(detector.measurement_offsets),
                            {detector.x, detector.y, detector.t});
    }
    for (const ObservableAnnotation& observable : annotations.observables) {
      circuit.safe_append_ua("OBSERVABLE_INCLUDE", record_targets(observable.measurement_offsets),
                             static_cast<double>(observable.observable_index));
    }
    return circuit;
  }
  if (is_repeated()) {
    stim::Circuit body;
    body.safe_append_u("TICK", {});
    body += children_.front().generate_circuit(k, global_map);
    const std::int64_t repetitions = this->repetitions().integer_eval(k);
    if (repetitions < 0) {
      throw CompilationError("Negative repetition count " + std::to_string(repetitions));
    }
    return body * static_cast<uint64_t>(repetitions);
  }
  for (std::size_t i = 0; i < children_.size(); ++i) {
    circuit += children_[i].generate_circuit(k, global_map);
    if (i + 1 < children_.size() && !children_[i + 1].is_repeated()) {
      circuit.safe_append_u("TICK", {});
    }
  }
  return circuit;
}

}  // namespace qtopo
