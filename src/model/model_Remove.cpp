/**
 * @file
 * @brief Model removal: tombstone a member and unlink it from its owner.
 */
#include "model/Model.h"
#include <algorithm>

namespace pullup::model {

void Model::removeMethod(const MethodId id) {
  auto& m = method(id);
  if (!m.alive) { return; }
  m.alive = false;
  auto& list = cls(m.owner).methods;
  list.erase(std::remove(list.begin(), list.end(), id), list.end());
}

void Model::removeField(const FieldId id) {
  auto& f = field(id);
  if (!f.alive) { return; }
  f.alive = false;
  auto& list = cls(f.owner).fields;
  list.erase(std::remove(list.begin(), list.end(), id), list.end());
}

} // namespace pullup::model
