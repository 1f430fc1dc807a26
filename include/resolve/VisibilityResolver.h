#pragma once

#include <optional>
#include <vector>
#include "hierarchy/Navigator.h"
#include "model/Model.h"

namespace pullup::resolve {

struct VisibilityDecision {
  model::Visibility level{model::Visibility::Protected};
  std::vector<model::ClassId> changed; // classes whose declarations were edited, first-edit order
  std::size_t adjustments{0};
};

/***
 * Name: pullup::resolve::VisibilityResolver
 * Purpose: Pick one visibility for a logical method across a hierarchy and apply it.
 * Inputs:
 *   - A declaration (usually the one placed on the destination)
 *   - The destination class and whether the move crosses a packaging unit
 * Outputs:
 *   - VisibilityDecision describing the level and the edited classes
 * Theory of Operation:
 *   Counterparts are same-signature declarations in every descendant of
 *   the destination. The level is the lattice join of all observed levels,
 *   floored at protected (public for a cross-module move). The level is
 *   written to the declaration and to each counterpart, and counterparts
 *   get the override marker. A declaration already at the level with the
 *   marker set is not touched, so a second apply changes nothing.
 */
class VisibilityResolver {
 public:
  VisibilityResolver(model::Model& model, const hierarchy::Navigator& nav) : model_(model), nav_(nav) {}

  static model::Visibility resolve(const std::vector<model::Visibility>& levels, bool crossModule);
  // Private/package levels cannot survive a move across a class boundary.
  static model::Visibility widenForMove(model::Visibility level, bool crossModule);

  std::vector<model::MethodId> counterparts(model::MethodId decl, model::ClassId destination,
                                            std::optional<model::MethodId> exclude = std::nullopt) const;
  VisibilityDecision apply(model::MethodId decl, model::ClassId destination, bool crossModule,
                           std::optional<model::MethodId> exclude = std::nullopt);

  bool isCrossModule(model::ClassId a, model::ClassId b) const;

 private:
  model::Model& model_;
  const hierarchy::Navigator& nav_;
};

} // namespace pullup::resolve
