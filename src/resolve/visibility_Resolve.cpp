/**
 * @file
 * @brief VisibilityResolver lattice rules: resolve, widenForMove, isCrossModule.
 */
#include "resolve/VisibilityResolver.h"

namespace pullup::resolve {

model::Visibility VisibilityResolver::resolve(const std::vector<model::Visibility>& levels, const bool crossModule) {
  if (crossModule) { return model::Visibility::Public; }
  return model::join(model::join(levels), model::Visibility::Protected);
}

model::Visibility VisibilityResolver::widenForMove(const model::Visibility level, const bool crossModule) {
  if (crossModule) { return model::Visibility::Public; }
  return model::join(level, model::Visibility::Protected);
}

bool VisibilityResolver::isCrossModule(const model::ClassId a, const model::ClassId b) const {
  const auto& ma = model_.cls(a).module;
  const auto& mb = model_.cls(b).module;
  return !ma.empty() && !mb.empty() && ma != mb;
}

} // namespace pullup::resolve
