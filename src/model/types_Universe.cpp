/***
 * Name: pullup::model::TypeUniverse (impl)
 * Purpose: Normalize type strings and recognise the universal top type.
 */
#include "model/TypeUniverse.h"

namespace pullup::model {

bool TypeUniverse::isTop(std::string_view t) const {
  if (t == topType) { return true; }
  // "java.lang.Object" style spellings of a simple top name.
  return simpleName(t) == topType && simpleName(topType) == topType;
}

std::string TypeUniverse::baseName(std::string_view t) {
  std::string out;
  out.reserve(t.size());
  int depth = 0;
  for (const char c : t) {
    if (c == '<') { ++depth; continue; }
    if (c == '>') { --depth; continue; }
    if (depth > 0) { continue; }
    if (c == '[' || c == ']' || c == ' ') { continue; }
    out.push_back(c);
  }
  return out;
}

std::string TypeUniverse::simpleName(std::string_view qualified) {
  const auto base = baseName(qualified);
  const auto dot = base.rfind('.');
  return dot == std::string::npos ? base : base.substr(dot + 1);
}

} // namespace pullup::model
