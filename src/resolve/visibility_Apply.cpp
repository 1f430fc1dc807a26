/**
 * @file
 * @brief VisibilityResolver::counterparts and ::apply.
 */
#include "resolve/VisibilityResolver.h"
#include "model/Signature.h"
#include <algorithm>

namespace pullup::resolve {

std::vector<model::MethodId> VisibilityResolver::counterparts(const model::MethodId decl,
                                                              const model::ClassId destination,
                                                              const std::optional<model::MethodId> exclude) const {
  const auto& d = model_.method(decl);
  std::vector<model::MethodId> out;
  for (const auto sub : nav_.descendantsOf(destination)) {
    for (const auto id : model_.methodsNamed(sub, d.name)) {
      if (id == decl || (exclude && *exclude == id)) { continue; }
      const auto& m = model_.method(id);
      if (m.isStatic || !model::sameSignature(model_, d, m)) { continue; }
      out.push_back(id);
    }
  }
  return out;
}

VisibilityDecision VisibilityResolver::apply(const model::MethodId decl, const model::ClassId destination,
                                             const bool crossModule, const std::optional<model::MethodId> exclude) {
  const auto peers = counterparts(decl, destination, exclude);
  std::vector<model::Visibility> levels{model_.method(decl).visibility};
  for (const auto id : peers) { levels.push_back(model_.method(id).visibility); }

  VisibilityDecision out;
  out.level = resolve(levels, crossModule);
  auto markChanged = [&out](const model::ClassId c) {
    ++out.adjustments;
    if (std::find(out.changed.begin(), out.changed.end(), c) == out.changed.end()) { out.changed.push_back(c); }
  };

  auto& d = model_.method(decl);
  if (d.visibility != out.level) {
    d.visibility = out.level;
    markChanged(d.owner);
  }
  for (const auto id : peers) {
    auto& m = model_.method(id);
    if (m.visibility == out.level && m.overrideMarker) { continue; }
    m.visibility = out.level;
    m.overrideMarker = true;
    markChanged(m.owner);
  }
  return out;
}

} // namespace pullup::resolve
