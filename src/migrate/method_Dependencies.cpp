/**
 * @file
 * @brief MethodMigrator dependency handling: fields move, methods become abstract, statics move.
 */
#include "migrate/MethodMigrator.h"
#include "body/Clone.h"
#include "model/Signature.h"

namespace pullup::migrate {

void MethodMigrator::handleFindings(const std::vector<analysis::DependencyFinding>& findings, MigrationPlan& plan) {
  for (const auto& f : findings) {
    if (!f.issue.empty()) { plan.note(f.issue + " (" + analysis::to_string(f.ownership) + ")"); }
    if (f.field) {
      migrateFieldDependency(*f.field, plan);
      continue;
    }
    const auto id = *f.method;
    if (!plan.visitedMethods.insert(id).second) { continue; }
    if (model_.method(id).isStatic) {
      relocateStatic(id, plan);
    } else {
      introduceAbstract(id, plan);
      processDependencies(id, plan);
    }
  }
}

void MethodMigrator::processDependencies(const model::MethodId source, MigrationPlan& plan) {
  handleFindings(analyzer_.analyzeMethod(source, plan.origin, plan.destination), plan);
}

void MethodMigrator::migrateFieldDependency(const model::FieldId field, MigrationPlan& plan) {
  if (plan.visitedFields.contains(field)) { return; }
  const auto initDeps = analyzer_.analyzeField(field, plan.origin, plan.destination);
  fields_.migrate(field, plan);
  handleFindings(initDeps, plan);
}

void MethodMigrator::introduceAbstract(const model::MethodId dependency, MigrationPlan& plan) {
  const auto& dep = model_.method(dependency);
  const auto sig = model::signatureText(dep);
  const auto& destName = model_.cls(plan.destination).qualifiedName;
  plan.keptOverrides.push_back(dependency);

  if (const auto existing = model_.findMethod(plan.destination, dep.name, dep.paramTypes())) {
    plan.note(destName + " already declares " + sig + (model_.method(*existing).isAbstract ? " as abstract" : ""));
    recordVisibility(visibility_.apply(*existing, plan.destination, plan.crossModule), plan);
    return;
  }
  for (const auto other : model_.methodsNamed(plan.destination, dep.name)) {
    plan.warn("abstract " + sig + " in " + destName + " overloads " + model::signatureText(model_.method(other)));
  }

  auto decl = model::MethodNode::abstractDecl(dep.name, dep.params, dep.returnType, dep.visibility);
  const auto id = model_.addMethod(plan.destination, std::move(decl));
  plan.introducedAbstracts.push_back(id);
  plan.visitedMethods.insert(id);
  plan.touch(plan.destination);
  markDestinationAbstract(plan);

  const auto peers = visibility_.counterparts(id, plan.destination);
  const auto unified = unifiedReturnType(id, peers);
  if (unified != model_.method(id).returnType) {
    plan.warn("abstract " + sig + " in " + destName + " returns " + unified + " to cover every override");
    model_.method(id).returnType = unified;
  }
  recordVisibility(visibility_.apply(id, plan.destination, plan.crossModule), plan);
  plan.note("introduced abstract " + sig + " in " + destName);
  if (metrics_ != nullptr) { metrics_->incCounter("migrate.abstracts"); }
}

void MethodMigrator::relocateStatic(const model::MethodId dependency, MigrationPlan& plan) {
  const auto& dep = model_.method(dependency);
  const auto sig = model::signatureText(dep);
  const auto& destName = model_.cls(plan.destination).qualifiedName;
  if (model_.findMethod(plan.destination, dep.name, dep.paramTypes())) {
    plan.warn("static " + sig + " left in " + model_.cls(dep.owner).qualifiedName + ": " + destName +
              " already declares it");
    return;
  }
  // Dependencies are read from the original, whose declaring class is still its context.
  const auto deps = analyzer_.analyzeMethod(dependency, plan.origin, plan.destination);

  model::MethodNode copy;
  copy.name = dep.name;
  copy.params = dep.params;
  copy.returnType = dep.returnType;
  copy.visibility = resolve::VisibilityResolver::widenForMove(dep.visibility, plan.crossModule);
  copy.isStatic = true;
  copy.isFinal = dep.isFinal;
  if (dep.hasBody()) { copy.body = body::cloneBlock(*dep.body); }
  const auto from = dep.owner;
  const auto id = model_.addMethod(plan.destination, std::move(copy));
  plan.visitedMethods.insert(id);
  plan.relocatedStatics.push_back(id);
  model_.removeMethod(dependency);
  plan.touch(plan.destination);
  plan.touch(from);
  plan.note("moved static " + sig + " from " + model_.cls(from).qualifiedName + " to " + destName);
  if (metrics_ != nullptr) { metrics_->incCounter("migrate.statics"); }
  handleFindings(deps, plan);
}

} // namespace pullup::migrate
