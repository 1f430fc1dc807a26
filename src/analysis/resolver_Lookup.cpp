/**
 * @file
 * @brief MemberResolver upward lookups by name (fields) and name plus arguments (methods).
 */
#include "analysis/MemberResolver.h"

namespace pullup::analysis {

bool MemberResolver::accepts(const model::MethodNode& m, const std::vector<std::string>& argTypes) const {
  if (m.params.size() != argTypes.size()) { return false; }
  for (std::size_t i = 0; i < argTypes.size(); ++i) {
    if (argTypes[i].empty()) { continue; }
    if (!model_.isSubtype(argTypes[i], m.params[i].type)) { return false; }
  }
  return true;
}

std::optional<model::MethodId> MemberResolver::lookupMethod(const model::ClassId start, std::string_view name,
                                                            const std::vector<std::string>& argTypes) const {
  std::optional<model::MethodId> fallback;
  std::optional<model::ClassId> cur = start;
  std::size_t guard = 0;
  while (cur && guard++ <= model_.classCount()) {
    for (const auto id : model_.methodsNamed(*cur, name)) {
      const auto& m = model_.method(id);
      if (m.params.size() != argTypes.size()) { continue; }
      if (accepts(m, argTypes)) { return id; }
      if (!fallback) { fallback = id; }
    }
    cur = model_.cls(*cur).superclass;
  }
  return fallback;
}

std::optional<model::FieldId> MemberResolver::lookupField(const model::ClassId start, std::string_view name) const {
  std::optional<model::ClassId> cur = start;
  std::size_t guard = 0;
  while (cur && guard++ <= model_.classCount()) {
    if (const auto f = model_.fieldNamed(*cur, name)) { return f; }
    cur = model_.cls(*cur).superclass;
  }
  return std::nullopt;
}

} // namespace pullup::analysis
