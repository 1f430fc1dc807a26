/***
 * Name: pullup::model::Model subtype queries (impl)
 * Purpose: Decide type identity, subtyping and resolvability over type strings.
 * Theory of Operation:
 *   Built-in names are handled by the TypeUniverse. Anything else is mapped
 *   to a class node and compared by walking the superclass chain. Every
 *   non-primitive type is a subtype of the universal top type. Array
 *   dimensions are compared textually before the base name is resolved.
 */
#include "model/Model.h"
#include <algorithm>

namespace pullup::model {

static std::size_t arrayDims(std::string_view t) {
  return static_cast<std::size_t>(std::count(t.begin(), t.end(), '['));
}

bool Model::isSubclass(const ClassId sub, const ClassId super) const {
  std::optional<ClassId> cur = sub;
  std::size_t guard = 0;
  while (cur && guard++ <= classes_.size()) {
    if (*cur == super) { return true; }
    cur = cls(*cur).superclass;
  }
  return false;
}

bool Model::sameType(std::string_view a, std::string_view b) const {
  if (a == b) { return true; }
  if (arrayDims(a) != arrayDims(b)) { return false; }
  if (types_.isTop(a) && types_.isTop(b)) { return true; }
  const auto ca = classForType(a);
  const auto cb = classForType(b);
  if (ca && cb) { return *ca == *cb; }
  return TypeUniverse::baseName(a) == TypeUniverse::baseName(b);
}

bool Model::isSubtype(std::string_view sub, std::string_view super) const {
  if (sameType(sub, super)) { return true; }
  if (types_.isPrimitive(sub) || types_.isVoid(sub) || types_.isVoid(super)) { return false; }
  if (types_.isTop(super)) { return true; }
  if (arrayDims(sub) != arrayDims(super)) { return false; }
  const auto cs = classForType(sub);
  const auto cp = classForType(super);
  if (!cs || !cp) { return false; }
  return isSubclass(*cs, *cp);
}

bool Model::isResolvable(std::string_view type) const {
  if (types_.isBuiltin(TypeUniverse::baseName(type))) { return true; }
  return classForType(type).has_value();
}

} // namespace pullup::model
