/**
 * @file
 * @brief Model registration: classes, external classes, methods, fields.
 */
#include "model/Model.h"
#include "pullup/exceptions/migration_error.h"
#include <utility>

namespace pullup::model {

ClassId Model::addClass(std::string qualifiedName, std::optional<ClassId> superclass,
                        std::string module, std::string sourceFile) {
  if (superclass && superclass->index >= classes_.size()) {
    throw exceptions::MigrationError("superclass of '" + qualifiedName + "' is not registered");
  }
  ClassNode c;
  c.qualifiedName = std::move(qualifiedName);
  c.superclass = superclass;
  c.module = std::move(module);
  c.sourceFile = std::move(sourceFile);
  classes_.push_back(std::move(c));
  return ClassId{static_cast<std::uint32_t>(classes_.size() - 1)};
}

ClassId Model::addExternalClass(std::string qualifiedName, std::optional<ClassId> superclass) {
  const auto id = addClass(std::move(qualifiedName), superclass);
  classes_[id.index].external = true;
  return id;
}

MethodId Model::addMethod(const ClassId owner, MethodNode m) {
  auto& c = cls(owner);
  m.owner = owner;
  m.alive = true;
  methods_.push_back(std::move(m));
  const MethodId id{static_cast<std::uint32_t>(methods_.size() - 1)};
  c.methods.push_back(id);
  return id;
}

FieldId Model::addField(const ClassId owner, FieldNode f) {
  auto& c = cls(owner);
  f.owner = owner;
  f.alive = true;
  fields_.push_back(std::move(f));
  const FieldId id{static_cast<std::uint32_t>(fields_.size() - 1)};
  c.fields.push_back(id);
  return id;
}

} // namespace pullup::model
