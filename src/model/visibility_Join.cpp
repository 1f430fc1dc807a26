/**
 * @file
 * @brief join: least upper bound on the visibility lattice.
 */
#include "model/Visibility.h"

namespace pullup::model {

Visibility join(const Visibility a, const Visibility b) {
  return narrowerThan(a, b) ? b : a;
}

Visibility join(const std::vector<Visibility>& levels) {
  Visibility out = Visibility::Private;
  for (const auto v : levels) { out = join(out, v); }
  return out;
}

} // namespace pullup::model
