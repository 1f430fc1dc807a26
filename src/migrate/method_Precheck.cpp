/***
 * Name: pullup::migrate::MethodMigrator::precheck (impl)
 * Purpose: Read-only hard gates evaluated before any mutation.
 */
#include "migrate/MethodMigrator.h"
#include "check/ConflictChecker.h"
#include "model/Signature.h"
#include "pullup/exceptions/duplicate_method.h"
#include "pullup/exceptions/method_not_found.h"
#include "pullup/exceptions/not_an_ancestor.h"
#include "pullup/exceptions/overload_ambiguity.h"
#include "pullup/exceptions/signature_conflict.h"
#include "pullup/exceptions/unresolvable_type.h"
#include <deque>
#include <unordered_set>

namespace pullup::migrate {

MethodMigrator::MethodMigrator(model::Model& model, const Settings& settings, obs::Metrics* metrics)
    : model_(model), settings_(settings), metrics_(metrics), nav_(model), analyzer_(model, nav_),
      visibility_(model, nav_), unifier_(model, nav_), fields_(model, nav_, settings_, metrics),
      stubs_(model, nav_, settings_, metrics) {}

MigrationPlan MethodMigrator::prepare(const model::MethodId method, const model::ClassId destination) const {
  MigrationPlan plan;
  plan.method = method;
  plan.origin = model_.method(method).owner;
  plan.destination = destination;
  plan.crossModule = settings_.crossModuleDetection && visibility_.isCrossModule(plan.origin, destination);
  return plan;
}

void MethodMigrator::checkSignatureTypes(const model::MethodNode& m) const {
  const auto where = model::signatureText(m) + " in " + model_.cls(m.owner).qualifiedName;
  if (!model_.isResolvable(m.returnType)) {
    throw exceptions::UnresolvableType("return type " + m.returnType + " of " + where + " cannot be resolved");
  }
  for (const auto& p : m.params) {
    if (!model_.isResolvable(p.type)) {
      throw exceptions::UnresolvableType("parameter type " + p.type + " of " + where + " cannot be resolved");
    }
  }
}

void MethodMigrator::checkDependencyClosure(const MigrationPlan& plan) const {
  std::unordered_set<model::MethodId> seenMethods{plan.method};
  std::unordered_set<model::FieldId> seenFields;
  std::deque<analysis::DependencyFinding> work;
  for (auto& f : analyzer_.analyzeMethod(plan.method, plan.origin, plan.destination)) { work.push_back(std::move(f)); }
  while (!work.empty()) {
    const auto f = std::move(work.front());
    work.pop_front();
    std::vector<analysis::DependencyFinding> next;
    if (f.method) {
      if (!seenMethods.insert(*f.method).second) { continue; }
      checkSignatureTypes(model_.method(*f.method));
      next = analyzer_.analyzeMethod(*f.method, plan.origin, plan.destination);
    } else if (f.field) {
      if (!seenFields.insert(*f.field).second) { continue; }
      next = analyzer_.analyzeField(*f.field, plan.origin, plan.destination);
    }
    for (auto& n : next) { work.push_back(std::move(n)); }
  }
}

void MethodMigrator::precheck(MigrationPlan& plan) const {
  obs::ScopedTimer timer(metrics_, "migrate.precheck");
  const auto& m = model_.method(plan.method);
  if (!m.alive) { throw exceptions::MethodNotFound("method " + m.name + " is no longer in the model"); }
  const auto& originName = model_.cls(plan.origin).qualifiedName;
  const auto& dest = model_.cls(plan.destination);
  if (!nav_.isAncestor(plan.destination, plan.origin)) {
    throw exceptions::NotAnAncestor(dest.qualifiedName + " is not an ancestor of " + originName);
  }
  if (dest.external) {
    throw exceptions::NotAnAncestor(dest.qualifiedName + " is an external class and cannot receive members");
  }

  checkSignatureTypes(m);
  checkDependencyClosure(plan);

  const check::ConflictChecker checker(model_);
  plan.conflict = checker.check(plan.method, plan.destination);
  switch (plan.conflict.outcome) {
    case check::ConflictOutcome::SignatureConflict:
      throw exceptions::SignatureConflict(plan.conflict.message);
    case check::ConflictOutcome::OverloadAmbiguity:
      throw exceptions::OverloadAmbiguity(plan.conflict.message);
    case check::ConflictOutcome::Duplicate:
      throw exceptions::DuplicateMethod(plan.conflict.message);
    case check::ConflictOutcome::Clear:
      break;
  }
}

} // namespace pullup::migrate
