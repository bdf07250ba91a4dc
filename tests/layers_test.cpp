#include "qtopo/core/blocks/block.h"
#include "qtopo/core/blocks/layers.h"
#include "qtopo/core/blocks/merge.h"
#include "qtopo/core/geometry/layout_position.h"
#include "qtopo/core/plaquette/rpng_translator.h"
#include "qtopo/core/templates/qubit_templates.h"
#include "qtopo/core/utils/errors.h"

#include <map>
#include <optional>
#include <set>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace qtopo;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// Qubit-template layer whose bulk plaquettes are tagged by their reset basis so that
// distinct layers compare unequal.
PlaquetteLayer qubit_layer(const char* bulk) {
  const DefaultRpngTranslator translator;
  std::map<std::size_t, Plaquette> collection;
  collection.emplace(9, translator.translate(RpngDescription::from_string(bulk)));
  return PlaquetteLayer(std::make_shared<const QubitTemplate>(), Plaquettes(std::move(collection)));
}

const Scalable2D kElementShape{LinearFunction(4, 5), LinearFunction(4, 5)};

std::vector<Layer> repeat_body(const std::vector<PlaquetteLayer>& layers) {
  return std::vector<Layer>(layers.begin(), layers.end());
}

// Qubit-template layer with every one of the 14 template plaquettes set.
PlaquetteLayer full_qubit_layer() {
  const DefaultRpngTranslator translator;
  std::map<std::size_t, Plaquette> collection;
  for (std::size_t index = 1; index <= QubitTemplate().expected_plaquettes_number(); ++index) {
    collection.emplace(index, translator.translate(RpngDescription::from_string("-z1- -z2- -z3- -z4-")));
  }
  return PlaquetteLayer(std::make_shared<const QubitTemplate>(), Plaquettes(std::move(collection)));
}

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

}  // namespace

int main() {
  const PlaquetteLayer a = qubit_layer("-z1- -z2- -z3- -z5-");
  const PlaquetteLayer b = qubit_layer("zz1- zz2- zz3- zz5-");
  const PlaquetteLayer c = qubit_layer("-z1z -z2z -z3z -z5z");
  const PlaquetteLayer d = qubit_layer("xz1- xz2- xz3- xz5-");

  expect(a.scalable_shape() == kElementShape, "Qubit layer spans 4k + 5 qubits");
  expect(a.scalable_num_moments() == LinearFunction(0, 7), "Translated plaquettes last seven moments");

  const PlaquetteLayer trimmed = a.with_spatial_borders_trimmed({SpatialBlockBorder::kXPositive});
  expect(trimmed.scalable_shape().x == LinearFunction(4, 3), "Trimming one X border removes two qubit columns");
  expect(trimmed.scalable_shape().y == LinearFunction(4, 5), "Trimming an X border keeps the height");
  for (std::size_t index : QubitTemplate().get_border_indices(TemplateBorder::kRight).indices()) {
    expect(!trimmed.plaquettes().contains(index), "Trimmed border plaquettes must be removed");
  }
  expect(trimmed.plaquettes().contains(9), "Bulk plaquettes are kept");

  const std::set<SpatialBlockBorder> all_borders{SpatialBlockBorder::kXNegative, SpatialBlockBorder::kXPositive,
                                                 SpatialBlockBorder::kYNegative, SpatialBlockBorder::kYPositive};
  const PlaquetteLayer core = full_qubit_layer().with_spatial_borders_trimmed(all_borders);
  expect(core.scalable_shape() == Scalable2D{LinearFunction(4, 1), LinearFunction(4, 1)},
         "Trimming every border leaves a 4k + 1 square");
  expect(core.scalable_shape().to_shape_2d(1).x > 0, "Trimmed layer keeps qubits at k = 1");
  expect(core.plaquettes().collection().size() == 2, "Only the two bulk plaquettes survive");
  for (const TemplateBorder border :
       {TemplateBorder::kTop, TemplateBorder::kBottom, TemplateBorder::kLeft, TemplateBorder::kRight}) {
    for (std::size_t index : QubitTemplate().get_border_indices(border).indices()) {
      expect(!core.plaquettes().contains(index), "No border plaquette is kept after trimming every border");
    }
  }

  // Temporal borders of a three layer block.
  const Block block({a, RepeatedLayer(b, LinearFunction(2, -1)), c});
  expect(block.is_cube(), "Memory block scales along every dimension");
  expect(block.scalable_timesteps() == LinearFunction(2, 1), "Memory block lasts 2k + 1 timesteps");
  expect(block.get_temporal_border(TemporalBlockBorder::kZNegative) == Layer(a), "Bottom layer is the first one");
  expect(block.get_temporal_border(TemporalBlockBorder::kZPositive) == Layer(c), "Top layer is the last one");

  const std::optional<Block> top_replaced =
      block.with_temporal_borders_replaced({{TemporalBlockBorder::kZPositive, Layer(d)}});
  expect(top_replaced.has_value() && top_replaced->layers().size() == 3, "Replacement keeps three layers");
  expect(top_replaced->layers()[2] == Layer(d), "Top layer is replaced");
  expect(top_replaced->layers()[0] == Layer(a), "Bottom layer is untouched");

  const std::optional<Block> bottom_removed =
      block.with_temporal_borders_replaced({{TemporalBlockBorder::kZNegative, std::nullopt}});
  expect(bottom_removed.has_value() && bottom_removed->layers().size() == 2, "Removal drops the bottom layer");
  expect(bottom_removed->layers()[0].is<RepeatedLayer>(), "Repeated layer becomes the bottom layer");

  const std::optional<Block> middle_only = block.with_temporal_borders_replaced(
      {{TemporalBlockBorder::kZNegative, std::nullopt}, {TemporalBlockBorder::kZPositive, std::nullopt}});
  expect(middle_only.has_value() && middle_only->layers().size() == 1, "Removing both borders keeps one layer");
  expect(middle_only->layers()[0] == Layer(RepeatedLayer(b, LinearFunction(2, -1))),
         "The middle layer is all that remains");
  expect(middle_only->scalable_timesteps() == LinearFunction(2, -1), "Removing both borders drops two timesteps");

  const Layer single(a);
  expect(!single.with_temporal_borders_replaced({{TemporalBlockBorder::kZNegative, std::nullopt}}).has_value(),
         "Removing the only layer leaves nothing");

  // Peeling a constant repetition.
  const Layer repeated = RepeatedLayer(b, LinearFunction(0, 3));
  const std::optional<Layer> peeled =
      repeated.with_temporal_borders_replaced({{TemporalBlockBorder::kZNegative, Layer(d)}});
  expect(peeled.has_value() && peeled->scalable_timesteps() == LinearFunction(0, 3), "Peeling keeps the duration");
  expect(peeled->get_temporal_layer_on_border(TemporalBlockBorder::kZNegative) == Layer(d),
         "Peeled border holds the replacement");

  // Peeling a repetition of a two-step body only swaps the outermost layer.
  const SequencedLayers two_steps(repeat_body({a, b}));
  const Layer repeated_pair = RepeatedLayer(two_steps, LinearFunction(0, 3));
  const std::optional<Layer> pair_bottom =
      repeated_pair.with_temporal_borders_replaced({{TemporalBlockBorder::kZNegative, Layer(d)}});
  expect(pair_bottom.has_value() && pair_bottom->scalable_timesteps() == LinearFunction(0, 6),
         "Replacing the bottom of a repeated pair keeps six timesteps");
  expect(pair_bottom->get_temporal_layer_on_border(TemporalBlockBorder::kZNegative) == Layer(d),
         "Bottom of the peeled pair is the replacement");
  expect(pair_bottom->all_layers(1).size() == 6 && pair_bottom->all_layers(1)[1] == Layer(b),
         "Second step of the peeled repetition is kept");

  const std::optional<Layer> pair_removed =
      repeated_pair.with_temporal_borders_replaced({{TemporalBlockBorder::kZNegative, std::nullopt}});
  expect(pair_removed.has_value() && pair_removed->scalable_timesteps() == LinearFunction(0, 5),
         "Removing the bottom drops a single timestep");
  expect(pair_removed->get_temporal_layer_on_border(TemporalBlockBorder::kZNegative) == Layer(b),
         "Bottom after removal is the rest of the first repetition");

  const std::optional<Layer> pair_both = repeated_pair.with_temporal_borders_replaced(
      {{TemporalBlockBorder::kZNegative, Layer(d)}, {TemporalBlockBorder::kZPositive, Layer(c)}});
  expect(pair_both.has_value() && pair_both->is<SequencedLayers>(), "Both borders give a sequence");
  const std::vector<Layer>& pair_parts = pair_both->as<SequencedLayers>().layer_sequence();
  expect(pair_parts.size() == 3 && pair_parts[1] == Layer(two_steps),
         "A single remaining repetition is the bare body");
  expect(pair_both->scalable_timesteps() == LinearFunction(0, 6), "Replacing both borders keeps the duration");
  expect(pair_both->get_temporal_layer_on_border(TemporalBlockBorder::kZPositive) == Layer(c),
         "Top of the peeled pair is the replacement");

  bool rejected = false;
  try {
    RepeatedLayer(RepeatedLayer(b, LinearFunction(1, 0)), LinearFunction(2, 0));
  } catch (const CompilationError&) {
    rejected = true;
  }
  expect(rejected, "Scalable body repeated a scalable number of times must be rejected");

  // Repeated layers with bodies of 2 and 3 layers merge on the lcm of both.
  const LayoutPosition2D left = LayoutPosition2D::from_block_position({0, 0});
  const LayoutPosition2D right = LayoutPosition2D::from_block_position({1, 0});
  const Layer two = RepeatedLayer(SequencedLayers(repeat_body({a, b})), LinearFunction(3, 0));
  const Layer three = RepeatedLayer(SequencedLayers(repeat_body({a, b, c})), LinearFunction(2, 0));
  const Layer merged = merge_parallel_layers({{left, two}, {right, three}}, kElementShape);
  expect(merged.is<RepeatedLayer>(), "Merged repeated layers stay repeated");
  expect(merged.as<RepeatedLayer>().repetitions() == LinearFunction(1, 0), "lcm body runs k times");
  expect(merged.as<RepeatedLayer>().internal_layer().scalable_timesteps() == LinearFunction(0, 6),
         "lcm body lasts six timesteps");
  expect(merged.scalable_timesteps() == LinearFunction(6, 0), "Merged layer keeps the duration");
  for (const Layer& layer : merged.all_layers(1)) {
    expect(layer.is<LayoutLayer>(), "Merged atomic layers are layout layers");
  }

  std::map<LayoutPosition2D, Layer> reversed;
  reversed.emplace(right, three);
  reversed.emplace(left, two);
  expect(merge_parallel_layers(reversed, kElementShape) == merged, "Merge must not depend on insertion order");

  bool mismatch = false;
  try {
    merge_parallel_layers({{left, Layer(a)}, {right, two}}, kElementShape);
  } catch (const CompilationError&) {
    mismatch = true;
  }
  expect(mismatch, "Layers of different durations cannot be merged");

  // Bodies lasting one timestep merge directly and keep their repetitions.
  const Layer merged_unit =
      merge_parallel_layers({{left, RepeatedLayer(a, LinearFunction(1, 0))}, {right, RepeatedLayer(b, LinearFunction(1, 0))}},
                            kElementShape);
  expect(merged_unit.is<RepeatedLayer>() && merged_unit.as<RepeatedLayer>().repetitions() == LinearFunction(1, 0),
         "Unit bodies keep k repetitions");
  expect(merged_unit.as<RepeatedLayer>().internal_layer().is<LayoutLayer>(), "Unit bodies merge into a layout layer");

  // A repeated layer aligns on the schedule of a parallel sequence.
  const Layer sequence = SequencedLayers({Layer(a), RepeatedLayer(b, LinearFunction(2, -1)), Layer(c)});
  const Layer mixed = merge_parallel_layers({{left, RepeatedLayer(b, LinearFunction(2, 1))}, {right, sequence}},
                                            kElementShape);
  expect(mixed.is<SequencedLayers>(), "Mixed merge gives a sequence");
  expect(mixed.as<SequencedLayers>().schedule() ==
             std::vector<LinearFunction>{LinearFunction(0, 1), LinearFunction(2, -1), LinearFunction(0, 1)},
         "Mixed merge follows the sequenced schedule");
  expect(mixed.as<SequencedLayers>().layer_sequence()[0].is<LayoutLayer>() &&
             mixed.as<SequencedLayers>().layer_sequence()[1].is<RepeatedLayer>(),
         "Rescheduled repetitions merge step by step");

  expect(throws<NotImplementedError>([&] {
           merge_parallel_layers({{left, SequencedLayers({Layer(a), RepeatedLayer(b, LinearFunction(0, 2))})},
                                  {right, SequencedLayers({RepeatedLayer(b, LinearFunction(0, 2)), Layer(a)})}},
                                 kElementShape);
         }),
         "Sequences with different schedules are not merged");
  expect(throws<NotImplementedError>([&] {
           merge_parallel_layers({{left, RepeatedLayer(RepeatedLayer(a, LinearFunction(1, 0)), LinearFunction(0, 2))},
                                  {right, RepeatedLayer(b, LinearFunction(2, 0))}},
                                 kElementShape);
         }),
         "Bodies scaling with k are not unrolled");

  // Blocks at one depth.
  std::map<LayoutPosition2D, Block> blocks;
  blocks.emplace(left, block);
  blocks.emplace(right, block);
  const std::vector<Layer> layers = merge_parallel_block_layers(blocks, kElementShape);
  expect(layers.size() == 3, "Merged blocks keep the block schedule");
  expect(layers[0].is<LayoutLayer>() && layers[1].is<RepeatedLayer>() && layers[2].is<LayoutLayer>(),
         "Atomic layers become layout layers and repetitions stay");
  expect(layers[0].as<LayoutLayer>().scalable_shape().x == LinearFunction(8, 9),
         "Two cubes side by side share one column of qubits");
  expect(merge_parallel_block_layers({}, kElementShape).empty(), "No block gives no layer");
  return 0;
}
