#include "qtopo/core/circuit/scheduled_circuit.h"

#include <algorithm>
#include <array>
#include <map>
#include <tuple>
#include <utility>

#include "stim/circuit/gate_target.h"
#include "qtopo/core/utils/errors.h"

namespace qtopo {
namespace {

std::string gate_name(const stim::CircuitInstruction& op) {
  return std::string(stim::GATE_DATA[op.gate_type].name);
}

// Fixed emission order for deduplicated instructions inside a merged moment.
int merge_rank(const std::string& name) {
  static const std::array<const char*, 7> kOrder = {"RX", "RY", "R", "H", "MX", "MY", "M"};
  for (std::size_t i = 0; i < kOrder.size(); ++i) {
    if (name == kOrder[i]) {
      return static_cast<int>(i);
    }
  }
  return static_cast<int>(kOrder.size());
}

void check_moment(const stim::Circuit& moment) {
  for (const stim::CircuitInstruction& op : moment.operations) {
    if (op.gate_type == stim::GateType::TICK || op.gate_type == stim::GateType::REPEAT) {
      throw CompilationError("A moment cannot contain TICK or REPEAT instructions");
    }
  }
}

}  // namespace

ScheduledCircuit::ScheduledCircuit(std::vector<stim::Circuit> moments, std::vector<int> schedule,
                                   QubitMap qubit_map)
    : moments_(std::move(moments)), schedule_(std::move(schedule)), qubit_map_(std::move(qubit_map)) {
  if (moments_.size() != schedule_.size()) {
    throw CompilationError("Got " + std::to_string(moments_.size()) + " moments but a schedule of " +
                           std::to_string(schedule_.size()) + " entries");
  }
  for (std::size_t i = 1; i < schedule_.size(); ++i) {
    if (schedule_[i] <= schedule_[i - 1]) {
      throw CompilationError("Schedules must be strictly increasing");
    }
  }
  if (!schedule_.empty() && schedule_.front() < 0) {
    throw CompilationError("Schedules must be non-negative");
  }
  for (const stim::Circuit& moment : moments_) {
    check_moment(moment);
  }
}

ScheduledCircuit ScheduledCircuit::from_circuit(const stim::Circuit& circuit, QubitMap qubit_map) {
  std::vector<stim::Circuit> moments(1);
  for (const stim::CircuitInstruction& op : circuit.operations) {
    if (op.gate_type == stim::GateType::TICK) {
      moments.emplace_back();
      continue;
    }
    if (op.gate_type == stim::GateType::REPEAT) {
      throw NotImplementedError("Cannot schedule a circuit containing REPEAT blocks");
    }
    std::vector<uint32_t> targets;
    for (const stim::GateTarget& t : op.targets) {
      targets.push_back(t.data);
    }
    moments.back().safe_append_u(gate_name(op), targets, std::vector<double>(op.args.begin(), op.args.end()));
  }
  std::vector<int> schedule(moments.size());
  for (std::size_t i = 0; i < schedule.size(); ++i) {
    schedule[i] = static_cast<int>(i);
  }
  return ScheduledCircuit(std::move(moments), std::move(schedule), std::move(qubit_map));
}

ScheduledCircuit ScheduledCircuit::shifted(const Shift2D& shift) const {
  return ScheduledCircuit(moments_, schedule_,
                          qubit_map_.with_mapped_qubits([&shift](const GridQubit& q) { return q + shift; }));
}

stim::Circuit ScheduledCircuit::get_circuit(const QubitMap& target_map, bool include_qubit_coords) const {
  stim::Circuit out;
  if (include_qubit_coords) {
    target_map.append_qubit_coords(&out);
  }
  const auto to_target = [this, &target_map](uint32_t local) {
    return static_cast<uint32_t>(target_map.index_of(qubit_map_.qubit_at(local)));
  };
  for (std::size_t i = 0; i < moments_.size(); ++i) {
    if (i > 0) {
      out.safe_append_u("TICK", {});
    }
    out += remap_qubit_targets(moments_[i], to_target);
  }
  return out;
}

stim::Circuit ScheduledCircuit::get_circuit(bool include_qubit_coords) const {
  return get_circuit(qubit_map_, include_qubit_coords);
}

stim::Circuit remap_qubit_targets(const stim::Circuit& circuit,
                                  const std::function<uint32_t(uint32_t)>& mapping) {
  stim::Circuit out;
  for (const stim::CircuitInstruction& op : circuit.operations) {
    if (op.gate_type == stim::GateType::REPEAT) {
      out += remap_qubit_targets(op.repeat_block_body(circuit), mapping) * op.repeat_block_rep_count();
      continue;
    }
    std::vector<uint32_t> targets;
    targets.reserve(op.targets.size());
    for (const stim::GateTarget& t : op.targets) {
      if (t.is_qubit_target() || t.is_x_target() || t.is_y_target() || t.is_z_target()) {
        const uint32_t flags = t.data & ~stim::TARGET_VALUE_MASK;
        targets.push_back(flags | mapping(t.qubit_value()));
      } else {
        targets.push_back(t.data);
      }
    }
    out.safe_append_u(gate_name(op), targets, std::vector<double>(op.args.begin(), op.args.end()));
  }
  return out;
}

ScheduledCircuit merge_scheduled_circuits(const std::vector<ScheduledCircuit>& circuits,
                                          const std::set<std::string>& mergeable_instructions) {
  std::vector<GridQubit> all_qubits;
  std::set<int> all_times;
  for (const ScheduledCircuit& circuit : circuits) {
    const std::vector<GridQubit> qubits = circuit.qubit_map().qubits();
    all_qubits.insert(all_qubits.end(), qubits.begin(), qubits.end());
    all_times.insert(circuit.schedule().begin(), circuit.schedule().end());
  }
  QubitMap global_map = QubitMap::from_qubits(std::move(all_qubits));

  using GroupKey = std::tuple<int, std::string, std::vector<double>>;
  std::vector<stim::Circuit> moments;
  std::vector<int> schedule;
  for (int time : all_times) {
    std::map<GroupKey, std::set<uint32_t>> merged;
    stim::Circuit rest;
    for (const ScheduledCircuit& circuit : circuits) {
      const auto& times = circuit.schedule();
      const auto it = std::lower_bound(times.begin(), times.end(), time);
      if (it == times.end() || *it != time) {
        continue;
      }
      const stim::Circuit& moment = circuit.moments()[static_cast<std::size_t>(it - times.begin())];
      const stim::Circuit global_moment = remap_qubit_targets(moment, [&](uint32_t local) {
        return static_cast<uint32_t>(global_map.index_of(circuit.qubit_map().qubit_at(local)));
      });
      for (const stim::CircuitInstruction& op : global_moment.operations) {
        const std::string name = gate_name(op);
        std::vector<double> args(op.args.begin(), op.args.end());
        std::vector<uint32_t> targets;
        for (const stim::GateTarget& t : op.targets) {
          targets.push_back(t.data);
        }
        if (mergeable_instructions.count(name) != 0) {
          merged[GroupKey{merge_rank(name), name, args}].insert(targets.begin(), targets.end());
        } else {
          rest.safe_append_u(name, targets, args);
        }
      }
    }
    stim::Circuit moment;
    for (const auto& [key, targets] : merged) {
      moment.safe_append_u(std::get<1>(key), std::vector<uint32_t>(targets.begin(), targets.end()),
                           std::get<2>(key));
    }
    moment += rest;
    moments.push_back(std::move(moment));
    schedule.push_back(time);
  }
  return ScheduledCircuit(std::move(moments), std::move(schedule), std::move(global_map));
}

}  // namespace qtopo
