/**
 * @file
 * @brief Model lookups by class name, type string and member name.
 */
#include "model/Model.h"
#include "model/Signature.h"

namespace pullup::model {

std::vector<ClassId> Model::classIds() const {
  std::vector<ClassId> out;
  out.reserve(classes_.size());
  for (std::uint32_t i = 0; i < classes_.size(); ++i) { out.push_back(ClassId{i}); }
  return out;
}

std::vector<ClassId> Model::findClasses(std::string_view name) const {
  std::vector<ClassId> exact;
  std::vector<ClassId> simple;
  for (std::uint32_t i = 0; i < classes_.size(); ++i) {
    const auto& c = classes_[i];
    if (c.qualifiedName == name) { exact.push_back(ClassId{i}); }
    else if (c.simpleName() == name) { simple.push_back(ClassId{i}); }
  }
  return exact.empty() ? simple : exact;
}

std::optional<ClassId> Model::findClass(std::string_view name) const {
  const auto hits = findClasses(name);
  if (hits.size() != 1) { return std::nullopt; }
  return hits.front();
}

std::optional<ClassId> Model::classForType(std::string_view type) const {
  const auto base = TypeUniverse::baseName(type);
  if (base.empty()) { return std::nullopt; }
  return findClass(base);
}

std::vector<MethodId> Model::methodsNamed(const ClassId owner, std::string_view name) const {
  std::vector<MethodId> out;
  for (const auto id : cls(owner).methods) {
    if (method(id).name == name) { out.push_back(id); }
  }
  return out;
}

std::optional<MethodId> Model::findMethod(const ClassId owner, std::string_view name,
                                          const std::vector<std::string>& paramTypes) const {
  for (const auto id : methodsNamed(owner, name)) {
    if (sameParamTypes(*this, method(id).paramTypes(), paramTypes)) { return id; }
  }
  return std::nullopt;
}

std::optional<FieldId> Model::fieldNamed(const ClassId owner, std::string_view name) const {
  for (const auto id : cls(owner).fields) {
    if (field(id).name == name) { return id; }
  }
  return std::nullopt;
}

} // namespace pullup::model
