#include "qtopo/core/blocks/merge.h"

#include <numeric>
#include <set>
#include <utility>

#include "qtopo/core/utils/errors.h"

namespace qtopo {

namespace {

Layer merge_repeated_layers(const std::map<LayoutPosition2D, Layer>& layers, const Scalable2D& element_shape) {
  const RepeatedLayer& first = layers.begin()->second.as<RepeatedLayer>();
  bool same_structure = true;
  for (const auto& entry : layers) {
    const RepeatedLayer& repeated = entry.second.as<RepeatedLayer>();
    if (repeated.repetitions() != first.repetitions() ||
        repeated.internal_layer().scalable_timesteps() != first.internal_layer().scalable_timesteps()) {
      same_structure = false;
    }
  }
  if (same_structure) {
    std::map<LayoutPosition2D, Layer> bodies;
    for (const auto& [position, layer] : layers) {
      bodies.emplace(position, layer.as<RepeatedLayer>().internal_layer());
    }
    return RepeatedLayer(merge_parallel_layers(bodies, element_shape), first.repetitions());
  }

  // Unroll every body up to the least common multiple of the body durations.
  std::int64_t common = 1;
  for (const auto& entry : layers) {
    const LinearFunction body = entry.second.as<RepeatedLayer>().internal_layer().scalable_timesteps();
    if (!body.is_constant() || !body.offset().is_integer()) {
      throw NotImplementedError("Cannot merge repeated layers with scalable bodies of different durations");
    }
    common = std::lcm(common, body.offset().to_integer());
  }
  const LinearFunction repetitions = first.scalable_timesteps().exact_integer_div(common);
  std::map<LayoutPosition2D, Layer> bodies;
  for (const auto& [position, layer] : layers) {
    const Layer& body = layer.as<RepeatedLayer>().internal_layer();
    const std::int64_t copies = common / body.scalable_timesteps().offset().to_integer();
    const std::vector<Layer> unrolled = body.all_layers(1);
    std::vector<Layer> sequence;
    for (std::int64_t i = 0; i < copies; ++i) {
      sequence.insert(sequence.end(), unrolled.begin(), unrolled.end());
    }
    bodies.emplace(position, SequencedLayers(std::move(sequence)));
  }
  return RepeatedLayer(merge_parallel_layers(bodies, element_shape), repetitions);
}

Layer merge_sequenced_layers(const std::map<LayoutPosition2D, Layer>& layers, const Scalable2D& element_shape) {
  const std::vector<LinearFunction> schedule = layers.begin()->second.as<SequencedLayers>().schedule();
  for (const auto& entry : layers) {
    if (entry.second.as<SequencedLayers>().schedule() != schedule) {
      throw NotImplementedError("Cannot merge sequences of layers following different schedules");
    }
  }
  std::vector<Layer> merged;
  for (std::size_t i = 0; i < schedule.size(); ++i) {
    std::map<LayoutPosition2D, Layer> step;
    for (const auto& [position, layer] : layers) {
      step.emplace(position, layer.as<SequencedLayers>().layer_sequence()[i]);
    }
    merged.push_back(merge_parallel_layers(step, element_shape));
  }
  return SequencedLayers(std::move(merged));
}

}  // namespace

Layer merge_parallel_layers(const std::map<LayoutPosition2D, Layer>& layers, const Scalable2D& element_shape) {
  if (layers.empty()) {
    throw CompilationError("Cannot merge an empty set of layers");
  }
  const LinearFunction timesteps = layers.begin()->second.scalable_timesteps();
  bool all_atomic = true;
  bool all_repeated = true;
  bool all_sequenced = true;
  for (const auto& [position, layer] : layers) {
    if (layer.scalable_timesteps() != timesteps) {
      throw CompilationError("Layer at " + position.str() + " lasts " + layer.scalable_timesteps().str() +
                             " timesteps instead of " + timesteps.str());
    }
    all_atomic = all_atomic && (layer.is<PlaquetteLayer>() || layer.is<RawCircuitLayer>());
    all_repeated = all_repeated && layer.is<RepeatedLayer>();
    all_sequenced = all_sequenced && layer.is<SequencedLayers>();
  }
  if (all_atomic) {
    std::map<LayoutPosition2D, AtomicLayer> atomic;
    for (const auto& [position, layer] : layers) {
      atomic.emplace(position, layer.to_atomic_layer());
    }
    return LayoutLayer(std::move(atomic), element_shape);
  }
  if (all_repeated) {
    return merge_repeated_layers(layers, element_shape);
  }
  if (all_sequenced) {
    return merge_sequenced_layers(layers, element_shape);
  }
  // Mixed repeated and sequenced layers: align everything on the sequenced schedule.
  std::set<std::vector<LinearFunction>> schedules;
  bool any_repeated = false;
  for (const auto& [position, layer] : layers) {
    if (layer.is_atomic()) {
      throw CompilationError("Layer at " + position.str() + " is atomic while other parallel layers are composed");
    }
    if (layer.is<SequencedLayers>()) {
      schedules.insert(layer.as<SequencedLayers>().schedule());
    } else {
      any_repeated = true;
    }
  }
  if (schedules.empty() || !any_repeated) {
    throw CompilationError("Mixed layer merge needs both repeated and sequenced layers");
  }
  if (schedules.size() > 1) {
    throw NotImplementedError("Cannot merge sequenced layers following different schedules");
  }
  std::map<LayoutPosition2D, Layer> rescheduled;
  for (const auto& [position, layer] : layers) {
    rescheduled.emplace(position, layer.is<SequencedLayers>()
                                      ? layer
                                      : layer.to_sequenced_layer_with_schedule(*schedules.begin()));
  }
  return merge_sequenced_layers(rescheduled, element_shape);
}

std::vector<Layer> merge_parallel_block_layers(const std::map<LayoutPosition2D, Block>& blocks,
                                               const Scalable2D& element_shape) {
  if (blocks.empty()) {
    return {};
  }
  const Block& first = blocks.begin()->second;
  const std::vector<LinearFunction> schedule = first.as_sequenced_layers().schedule();
  for (const auto& [position, block] : blocks) {
    if (block.scalable_timesteps() != first.scalable_timesteps()) {
      throw CompilationError("Block at " + position.str() + " lasts " + block.scalable_timesteps().str() +
                             " timesteps instead of " + first.scalable_timesteps().str());
    }
    if (block.as_sequenced_layers().schedule() != schedule) {
      throw NotImplementedError("Blocks at the same depth must follow the same schedule");
    }
  }
  std::vector<Layer> merged;
  for (std::size_t i = 0; i < schedule.size(); ++i) {
    std::map<LayoutPosition2D, Layer> step;
    for (const auto& [position, block] : blocks) {
      step.emplace(position, block.layers()[i]);
    }
    merged.push_back(merge_parallel_layers(step, element_shape));
  }
  return merged;
}

}  // namespace qtopo
