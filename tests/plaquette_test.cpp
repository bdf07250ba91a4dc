#include "qtopo/core/plaquette/plaquette.h"
#include "qtopo/core/plaquette/rpng.h"
#include "qtopo/core/plaquette/rpng_translator.h"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool rejects(const char* text) {
  try {
    qtopo::Rpng::from_string(text);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

}  // namespace

int main() {
  using namespace qtopo;

  const Rpng rpng = Rpng::from_string("zx3-");
  expect(rpng.reset == ExtendedBasis::kZ, "Reset basis must be parsed");
  expect(rpng.pauli == Basis::kX, "Pauli must be parsed");
  expect(rpng.schedule == 3, "Schedule must be parsed");
  expect(!rpng.measurement.has_value(), "'-' means no measurement");
  expect(rpng.str() == "zx3-", "RPNG must print back to its source");
  expect(Rpng::from_string("----").is_unused(), "'----' is an unused corner");
  expect(rejects("zx3"), "Three characters must be rejected");
  expect(rejects("zq3-"), "Unknown Pauli must be rejected");
  expect(rejects("zx/-"), "Non-digit schedule must be rejected");

  const RpngDescription bulk = RpngDescription::from_string("-z1- -z2- -z3- -z5-");
  expect(bulk.ancilla() == RgCode::from_string("xx"), "Default ancilla code is xx");
  const RpngDescription extended = RpngDescription::from_string("zz -z1- -z2- -z3- -z5-");
  expect(extended.ancilla().reset == ExtendedBasis::kZ, "Extended form sets the ancilla reset");
  expect(RpngDescription::empty().is_empty(), "Empty description is empty");

  const DefaultRpngTranslator translator;
  const Plaquette plaquette = translator.translate(bulk);
  expect(plaquette.name() == bulk.str(), "Plaquette name is the description");
  expect(plaquette.qubits().data.size() == 4, "Bulk plaquette uses four data qubits");
  expect(plaquette.qubits().syndrome.size() == 1, "Plaquette has one syndrome qubit");
  const std::vector<int> expected_schedule = {0, 1, 2, 3, 5, kMeasurementSchedule};
  expect(plaquette.circuit().schedule() == expected_schedule, "Moments follow the corner schedules");

  const stim::Circuit flat = plaquette.circuit().get_circuit(false);
  expect(flat.count_measurements() == 1, "Only the ancilla is measured");
  expect(flat.count_qubits() == 5, "Four data qubits plus the ancilla");

  const Plaquette two_body = translator.translate(RpngDescription::from_string("---- ---- zz3z zz5z"));
  expect(two_body.qubits().data.size() == 2, "Unused corners are dropped");
  expect(two_body.circuit().get_circuit(false).count_measurements() == 3,
         "Ancilla and both data qubits are measured");

  expect(translator.translate(RpngDescription::empty()).is_empty(), "Empty description gives the empty plaquette");

  const Plaquettes plaquettes(std::map<std::size_t, Plaquette>{{1, plaquette}});
  expect(plaquettes[1] == plaquette, "Stored plaquette is returned");
  expect(plaquettes[7].is_empty(), "Missing indices fall back to the empty plaquette");
  expect(!plaquettes.without_plaquettes({1}).contains(1), "Removed index is gone");
  return 0;
}
