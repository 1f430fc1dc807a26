/**
 * @file
 * @brief Orchestrator request resolution: origin class, method overload, destination.
 */
#include "refactor/Orchestrator.h"
#include "hierarchy/Navigator.h"
#include "model/Signature.h"
#include "pullup/exceptions/class_not_found.h"
#include "pullup/exceptions/method_not_found.h"
#include "pullup/exceptions/not_an_ancestor.h"

namespace pullup::refactor {

model::ClassId Orchestrator::resolveClass(const model::Model& model, std::string_view name) const {
  const auto hits = model.findClasses(name);
  if (hits.empty()) {
    throw exceptions::ClassNotFound("class '" + std::string(name) + "' not found");
  }
  if (hits.size() > 1) {
    std::string which;
    for (const auto id : hits) { which += (which.empty() ? "" : ", ") + model.cls(id).qualifiedName; }
    throw exceptions::ClassNotFound("class name '" + std::string(name) + "' is ambiguous: " + which);
  }
  return hits.front();
}

model::MethodId Orchestrator::resolveMethod(const model::Model& model, const model::ClassId origin,
                                            const MigrationRequest& request) const {
  const auto& originName = model.cls(origin).qualifiedName;
  const auto candidates = model.methodsNamed(origin, request.methodName);
  if (candidates.empty()) {
    throw exceptions::MethodNotFound("method '" + request.methodName + "' not found in " + originName);
  }
  if (!request.parameterTypes) { return candidates.front(); }
  for (const auto id : candidates) {
    if (model::sameParamTypes(model, model.method(id).paramTypes(), *request.parameterTypes)) { return id; }
  }
  std::string wanted = request.methodName + "(";
  for (std::size_t i = 0; i < request.parameterTypes->size(); ++i) {
    wanted += (i == 0 ? "" : ",") + (*request.parameterTypes)[i];
  }
  throw exceptions::MethodNotFound("method '" + wanted + ")' not found in " + originName);
}

model::ClassId Orchestrator::resolveDestination(const model::Model& model, const model::ClassId origin,
                                                const MigrationRequest& request) const {
  const hierarchy::Navigator nav(model);
  const auto& originName = model.cls(origin).qualifiedName;
  if (!request.destinationClass) {
    const auto sup = nav.superclassOf(origin);
    if (!sup) { throw exceptions::NotAnAncestor(originName + " has no superclass to pull members into"); }
    return *sup;
  }
  const auto dest = resolveClass(model, *request.destinationClass);
  if (!nav.isAncestor(dest, origin)) {
    throw exceptions::NotAnAncestor(model.cls(dest).qualifiedName + " is not an ancestor of " + originName);
  }
  return dest;
}

} // namespace pullup::refactor
