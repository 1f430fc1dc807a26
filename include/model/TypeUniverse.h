/***
 * Name: pullup::model::TypeUniverse
 * Purpose: Name the built-in types the engine reasons about without a class node.
 * Inputs:
 *   - Universal top type name (default "Object")
 *   - Void-equivalent name (default "void")
 *   - Primitive type names
 * Outputs:
 *   - Classification predicates over type strings
 * Theory of Operation:
 *   Types are carried as source strings. Array suffixes and generic
 *   arguments are stripped by baseName() before any lookup, so
 *   "List<String>" and "List" share a class node.
 */
#pragma once

#include <set>
#include <string>
#include <string_view>

namespace pullup::model {

struct TypeUniverse {
  std::string topType{"Object"};
  std::string voidType{"void"};
  std::set<std::string, std::less<>> primitives{"boolean", "byte", "char", "short", "int", "long", "float", "double"};

  bool isTop(std::string_view t) const;
  bool isVoid(std::string_view t) const { return t == voidType; }
  bool isPrimitive(std::string_view t) const { return primitives.contains(t); }
  bool isBuiltin(std::string_view t) const { return isTop(t) || isVoid(t) || isPrimitive(t); }

  static std::string baseName(std::string_view t);
  static std::string simpleName(std::string_view qualified);
};

} // namespace pullup::model
