/***
 * Name: pullup::analysis::MemberResolver
 * Purpose: Bind call and field-access nodes to declarations in the model.
 * Inputs:
 *   - A body node and the class whose code contains it
 * Outputs:
 *   - The resolved method/field id, or nothing when unresolvable
 * Theory of Operation:
 *   The receiver decides where the upward search starts: implicit and
 *   `this` receivers at the context class, `super` at its superclass, a
 *   local/parameter at the class named by its static type, any other
 *   expression at the class of its computed static type. Calls match on
 *   name and arity; at each level a candidate whose parameter types
 *   accept the argument types wins, otherwise the first arity match found
 *   anywhere on the chain is used. Unknown argument types accept anything.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "body/Nodes.h"
#include "model/Model.h"

namespace pullup::analysis {

class MemberResolver {
 public:
  explicit MemberResolver(const model::Model& model) : model_(model) {}

  std::optional<model::MethodId> resolveCall(const body::CallExpr& call, model::ClassId context) const;
  std::optional<model::FieldId> resolveField(const body::FieldAccessExpr& access, model::ClassId context) const;

  // Class where member lookup for `target` starts; null target means implicit this.
  std::optional<model::ClassId> receiverClass(const body::Expr* target, model::ClassId context) const;

  // Static type of an expression; empty when unknown.
  std::string staticType(const body::Expr& e, model::ClassId context) const;

  std::optional<model::MethodId> lookupMethod(model::ClassId start, std::string_view name,
                                              const std::vector<std::string>& argTypes) const;
  std::optional<model::FieldId> lookupField(model::ClassId start, std::string_view name) const;

 private:
  bool accepts(const model::MethodNode& m, const std::vector<std::string>& argTypes) const;

  const model::Model& model_;
};

} // namespace pullup::analysis
