/**
 * @file
 * @brief Orchestrator read-only queries used by front ends to offer choices.
 */
#include "refactor/Orchestrator.h"
#include "hierarchy/Navigator.h"
#include "model/Signature.h"

namespace pullup::refactor {

std::vector<std::string> Orchestrator::classNames(const model::Model& model) const {
  std::vector<std::string> out;
  for (const auto id : model.classIds()) {
    if (!model.cls(id).external) { out.push_back(model.cls(id).qualifiedName); }
  }
  return out;
}

std::vector<std::string> Orchestrator::methodNames(const model::Model& model, std::string_view cls) const {
  const auto id = resolveClass(model, cls);
  std::vector<std::string> out;
  for (const auto mid : model.cls(id).methods) { out.push_back(model::signatureText(model.method(mid))); }
  return out;
}

std::vector<std::string> Orchestrator::ancestorNames(const model::Model& model, std::string_view cls) const {
  const auto id = resolveClass(model, cls);
  const hierarchy::Navigator nav(model);
  std::vector<std::string> out;
  for (const auto a : nav.ancestorsOf(id)) { out.push_back(model.cls(a).qualifiedName); }
  return out;
}

} // namespace pullup::refactor
