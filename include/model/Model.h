/***
 * Name: pullup::model::Model
 * Purpose: Arena owning every class, method and field of one source set.
 * Inputs:
 *   - Nodes registered by the source-model builder (or tests)
 * Outputs:
 *   - Stable ids, lookups by name and type, subtype queries
 * Theory of Operation:
 *   Three vectors hold the nodes; relationships are ids, never owning
 *   pointers, so the class graph carries no ownership cycles. A superclass
 *   must already exist when a class is added, which keeps the chain
 *   acyclic. Removal tombstones the node and unlinks it from its owner's
 *   ordered member list. Accessors throw std::out_of_range on a bad id.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/ClassNode.h"
#include "model/FieldNode.h"
#include "model/Ids.h"
#include "model/MethodNode.h"
#include "model/TypeUniverse.h"

namespace pullup::model {

class Model {
 public:
  Model() = default;
  explicit Model(TypeUniverse types) : types_(std::move(types)) {}

  ClassId addClass(std::string qualifiedName, std::optional<ClassId> superclass = std::nullopt,
                   std::string module = {}, std::string sourceFile = {});
  ClassId addExternalClass(std::string qualifiedName, std::optional<ClassId> superclass = std::nullopt);
  MethodId addMethod(ClassId owner, MethodNode m);
  FieldId addField(ClassId owner, FieldNode f);
  void removeMethod(MethodId id);
  void removeField(FieldId id);

  ClassNode& cls(ClassId id) { return classes_.at(id.index); }
  const ClassNode& cls(ClassId id) const { return classes_.at(id.index); }
  MethodNode& method(MethodId id) { return methods_.at(id.index); }
  const MethodNode& method(MethodId id) const { return methods_.at(id.index); }
  FieldNode& field(FieldId id) { return fields_.at(id.index); }
  const FieldNode& field(FieldId id) const { return fields_.at(id.index); }

  std::vector<ClassId> classIds() const;
  std::size_t classCount() const { return classes_.size(); }

  // Qualified name, or a simple name that identifies exactly one class.
  std::optional<ClassId> findClass(std::string_view name) const;
  std::vector<ClassId> findClasses(std::string_view name) const;
  std::optional<ClassId> classForType(std::string_view type) const;

  std::vector<MethodId> methodsNamed(ClassId owner, std::string_view name) const;
  std::optional<MethodId> findMethod(ClassId owner, std::string_view name,
                                     const std::vector<std::string>& paramTypes) const;
  std::optional<FieldId> fieldNamed(ClassId owner, std::string_view name) const;

  bool isSubtype(std::string_view sub, std::string_view super) const;
  bool isSubclass(ClassId sub, ClassId super) const;
  bool sameType(std::string_view a, std::string_view b) const;
  bool isResolvable(std::string_view type) const;

  const TypeUniverse& types() const { return types_; }

 private:
  TypeUniverse types_{};
  std::vector<ClassNode> classes_{};
  std::vector<MethodNode> methods_{};
  std::vector<FieldNode> fields_{};
};

} // namespace pullup::model
