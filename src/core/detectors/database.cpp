#include "qtopo/core/detectors/database.h"

#include <utility>

namespace qtopo {

const std::vector<RelativeDetector>* DetectorDatabase::find(const std::string& signature) const {
  const auto it = entries_.find(signature);
  if (it == entries_.end()) {
    return nullptr;
  }
  ++hits_;
  return &it->second;
}

void DetectorDatabase::add(const std::string& signature, std::vector<RelativeDetector> detectors) {
  entries_.insert_or_assign(signature, std::move(detectors));
}

void DetectorDatabase::clear() {
  entries_.clear();
  hits_ = 0;
}

}  // namespace qtopo
