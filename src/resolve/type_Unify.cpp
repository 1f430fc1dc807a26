/**
 * @file
 * @brief TypeUnifier::unify pairwise and folded forms.
 */
#include "resolve/TypeUnifier.h"

namespace pullup::resolve {

std::string TypeUnifier::unify(const std::string& a, const std::string& b) const {
  if (model_.sameType(a, b)) { return a; }
  const auto& types = model_.types();
  if (types.isTop(a) || types.isTop(b)) { return types.topType; }
  if (model_.isSubtype(b, a)) { return a; }
  if (model_.isSubtype(a, b)) { return b; }
  if (const auto ca = model_.classForType(a)) {
    for (const auto anc : nav_.ancestorsOf(*ca)) {
      const auto& name = model_.cls(anc).qualifiedName;
      if (model_.isSubtype(b, name)) { return name; }
    }
  }
  return types.topType;
}

std::string TypeUnifier::unify(const std::string& seed, const std::vector<std::string>& observed) const {
  std::string current = seed;
  for (const auto& t : observed) { current = unify(current, t); }
  return current;
}

} // namespace pullup::resolve
