/**
 * @file
 * @brief Navigator downward queries: directSubclasses, descendantsOf.
 */
#include "hierarchy/Navigator.h"
#include <deque>
#include <unordered_set>

namespace pullup::hierarchy {

std::vector<model::ClassId> Navigator::directSubclasses(const model::ClassId cls) const {
  std::vector<model::ClassId> out;
  for (const auto id : model_.classIds()) {
    if (id == cls) { continue; }
    const auto sup = model_.cls(id).superclass;
    if (sup && *sup == cls) { out.push_back(id); }
  }
  return out;
}

std::vector<model::ClassId> Navigator::descendantsOf(const model::ClassId cls) const {
  std::vector<model::ClassId> out;
  std::unordered_set<model::ClassId> seen{cls};
  std::deque<model::ClassId> work{cls};
  while (!work.empty()) {
    const auto cur = work.front();
    work.pop_front();
    for (const auto sub : directSubclasses(cur)) {
      if (!seen.insert(sub).second) { continue; }
      out.push_back(sub);
      work.push_back(sub);
    }
  }
  return out;
}

} // namespace pullup::hierarchy
