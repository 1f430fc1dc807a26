/***
 * Name: pullup::migrate::MethodMigrator::execute (impl)
 * Purpose: Apply the migration to the model once every gate has passed.
 */
#include "migrate/MethodMigrator.h"
#include "body/Clone.h"
#include "model/Signature.h"
#include "rewrite/CallSiteRewriter.h"
#include <vector>

namespace pullup::migrate {

void MethodMigrator::recordVisibility(const resolve::VisibilityDecision& decision, MigrationPlan& plan) {
  for (const auto c : decision.changed) {
    plan.touch(c);
    if (c != plan.destination) { plan.touchVisibility(c); }
  }
  if (metrics_ != nullptr && decision.adjustments > 0) {
    metrics_->incCounter("visibility.adjusted", decision.adjustments);
  }
}

void MethodMigrator::markDestinationAbstract(MigrationPlan& plan) {
  auto& dest = model_.cls(plan.destination);
  if (dest.isAbstract) { return; }
  dest.isAbstract = true;
  plan.destinationMadeAbstract = true;
  plan.touch(plan.destination);
  plan.warn(dest.qualifiedName + " was made abstract");
  if (metrics_ != nullptr) { metrics_->incCounter("migrate.destination_made_abstract"); }
}

void MethodMigrator::relocatePrimary(MigrationPlan& plan) {
  const auto& src = model_.method(plan.method);
  model::MethodNode copy;
  copy.name = src.name;
  copy.params = src.params;
  copy.returnType = src.returnType;
  copy.visibility = src.visibility;
  copy.isAbstract = src.isAbstract;
  copy.isStatic = src.isStatic;
  copy.isFinal = src.isFinal;
  copy.overrideMarker = src.overrideMarker;
  if (src.hasBody()) { copy.body = body::cloneBlock(*src.body); }
  const auto sig = model::signatureText(src);

  // 1. clone
  const auto id = model_.addMethod(plan.destination, std::move(copy));
  plan.migrated = id;
  plan.visitedMethods.insert(plan.method);
  plan.visitedMethods.insert(id);
  plan.touch(plan.destination);
  plan.note("cloned " + sig + " onto " + model_.cls(plan.destination).qualifiedName);
  if (model_.method(id).isAbstract) {
    markDestinationAbstract(plan);
    plan.introducedAbstracts.push_back(id);
  }

  // 2. visibility
  if (!model_.method(id).isStatic) {
    recordVisibility(visibility_.apply(id, plan.destination, plan.crossModule, plan.method), plan);
  } else {
    auto& m = model_.method(id);
    m.visibility = resolve::VisibilityResolver::widenForMove(m.visibility, plan.crossModule);
  }

  // 3. return type
  const auto peers = visibility_.counterparts(id, plan.destination, plan.method);
  const auto oldType = model_.method(id).returnType;
  const auto newType = unifiedReturnType(id, peers);
  if (newType != oldType) {
    auto& m = model_.method(id);
    m.returnType = newType;
    if (m.hasBody()) { retypeReturnedLocals(*m.body, oldType, newType); }
    plan.warn("return type of " + sig + " widened from " + oldType + " to " + newType);
  }

  // 4. self-reference downcasts, resolved as the body was written
  auto& moved = model_.method(id);
  if (moved.hasBody()) {
    rewrite::CallSiteRewriter rewriter(model_, nav_, settings_, plan, metrics_);
    rewriter.rewrite(*moved.body, plan.origin, rewrite::RewriteRules{.castSelf = true});
  }
}

void MethodMigrator::repairSuperCalls(MigrationPlan& plan) {
  rewrite::CallSiteRewriter rewriter(model_, nav_, settings_, plan, metrics_);
  if (plan.migrated) {
    auto& m = model_.method(*plan.migrated);
    if (m.hasBody()) {
      rewriter.rewrite(*m.body, plan.destination, rewrite::RewriteRules{.repairSuper = true, .relocated = true});
    }
  }
  for (const auto id : plan.relocatedStatics) {
    auto& m = model_.method(id);
    if (m.hasBody()) {
      rewriter.rewrite(*m.body, plan.destination, rewrite::RewriteRules{.repairSuper = true, .relocated = true});
    }
  }
  for (const auto id : plan.keptOverrides) {
    auto& m = model_.method(id);
    if (!m.alive || !m.hasBody()) { continue; }
    const auto before = plan.warnings.size();
    rewriter.rewrite(*m.body, m.owner, rewrite::RewriteRules{.repairSuper = true});
    if (plan.warnings.size() != before) { plan.touch(model_.method(id).owner); }
  }
}

void MethodMigrator::synthesizeStubs(MigrationPlan& plan) {
  const auto introduced = plan.introducedAbstracts;
  for (const auto id : introduced) {
    if (!model_.method(id).isAbstract) { continue; }
    stubs_.synthesize(id, plan);
  }
}

void MethodMigrator::settleDestinationAbstract(MigrationPlan& plan) {
  if (plan.introducedAbstracts.empty()) { return; }
  auto& dest = model_.cls(plan.destination);
  if (!dest.isAbstract) { return; }
  for (const auto id : dest.methods) {
    if (model_.method(id).isAbstract) { return; }
  }
  dest.isAbstract = false;
  plan.touch(plan.destination);
  if (plan.destinationMadeAbstract) {
    plan.destinationMadeAbstract = false;
    std::erase(plan.warnings, dest.qualifiedName + " was made abstract");
  }
  plan.note(dest.qualifiedName + " no longer declares abstract methods; abstract flag cleared");
}

void MethodMigrator::execute(MigrationPlan& plan) {
  obs::ScopedTimer timer(metrics_, "migrate.execute");
  relocatePrimary(plan);
  processDependencies(plan.method, plan);
  repairSuperCalls(plan);
  synthesizeStubs(plan);
  settleDestinationAbstract(plan);

  const auto sig = model::signatureText(model_.method(plan.method));
  model_.removeMethod(plan.method);
  plan.touch(plan.origin);
  plan.note("removed " + sig + " from " + model_.cls(plan.origin).qualifiedName);
  if (metrics_ != nullptr) { metrics_->incCounter("migrate.methods"); }
}

} // namespace pullup::migrate
