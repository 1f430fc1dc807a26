/**
 * @file
 * @brief DependencyAnalyzer ownership classification.
 */
#include "analysis/DependencyAnalyzer.h"

namespace pullup::analysis {

const char* to_string(const Ownership o) {
  switch (o) {
    case Ownership::OriginOwned: return "origin-owned";
    case Ownership::IntermediateOwned: return "intermediate-owned";
    case Ownership::Irrelevant: return "irrelevant";
  }
  return "unknown";
}

Ownership DependencyAnalyzer::classify(const model::ClassId owner, const model::ClassId origin,
                                       const model::ClassId destination) const {
  if (owner == origin) { return Ownership::OriginOwned; }
  for (const auto mid : nav_.pathBetween(origin, destination)) {
    if (mid == owner) { return Ownership::IntermediateOwned; }
  }
  return Ownership::Irrelevant;
}

} // namespace pullup::analysis
