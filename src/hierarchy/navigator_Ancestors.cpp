/**
 * @file
 * @brief Navigator upward queries: superclassOf, ancestorsOf, isAncestor, pathBetween.
 */
#include "hierarchy/Navigator.h"

namespace pullup::hierarchy {

std::optional<model::ClassId> Navigator::superclassOf(const model::ClassId cls) const {
  const auto sup = model_.cls(cls).superclass;
  if (!sup) { return std::nullopt; }
  if (model_.types().isTop(model_.cls(*sup).qualifiedName)) { return std::nullopt; }
  return sup;
}

std::vector<model::ClassId> Navigator::ancestorsOf(const model::ClassId cls) const {
  std::vector<model::ClassId> out;
  auto cur = superclassOf(cls);
  while (cur && out.size() < model_.classCount()) {
    if (*cur == cls) { break; }
    out.push_back(*cur);
    cur = superclassOf(*cur);
  }
  return out;
}

bool Navigator::isAncestor(const model::ClassId ancestor, const model::ClassId descendant) const {
  for (const auto a : ancestorsOf(descendant)) {
    if (a == ancestor) { return true; }
  }
  return false;
}

std::vector<model::ClassId> Navigator::pathBetween(const model::ClassId descendant,
                                                   const model::ClassId ancestor) const {
  std::vector<model::ClassId> out;
  for (const auto a : ancestorsOf(descendant)) {
    if (a == ancestor) { return out; }
    out.push_back(a);
  }
  return {};
}

} // namespace pullup::hierarchy
