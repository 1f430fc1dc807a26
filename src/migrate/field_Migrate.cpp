/**
 * @file
 * @brief FieldMigrator::migrate and shadow removal.
 */
#include "migrate/FieldMigrator.h"
#include "body/Clone.h"
#include "resolve/TypeUnifier.h"
#include "resolve/VisibilityResolver.h"

namespace pullup::migrate {

void FieldMigrator::removeShadows(const std::string& name, MigrationPlan& plan) {
  for (const auto c : nav_.pathBetween(plan.origin, plan.destination)) {
    const auto shadow = model_.fieldNamed(c, name);
    if (!shadow) { continue; }
    model_.removeField(*shadow);
    plan.touch(c);
    plan.warn("removed shadowing field '" + name + "' from " + model_.cls(c).qualifiedName);
  }
}

std::optional<model::FieldId> FieldMigrator::migrate(const model::FieldId field, MigrationPlan& plan) {
  if (!plan.visitedFields.insert(field).second) { return std::nullopt; }
  const auto& src = model_.field(field);
  if (!src.alive) { return std::nullopt; }
  const auto& destName = model_.cls(plan.destination).qualifiedName;

  if (model_.fieldNamed(plan.destination, src.name)) {
    plan.warn("field '" + src.name + "' not moved: " + destName + " already declares a field with that name");
    return std::nullopt;
  }
  if (!model_.isResolvable(src.type)) {
    plan.warn("field '" + src.name + "' not moved: type " + src.type + " is not resolvable from " + destName);
    return std::nullopt;
  }

  model::FieldNode copy(src.name, src.type,
                        resolve::VisibilityResolver::widenForMove(src.visibility, plan.crossModule),
                        body::cloneExpr(src.initializer.get()));
  copy.isStatic = src.isStatic;
  if (copy.visibility != src.visibility) {
    plan.note("field '" + src.name + "' widened from " + model::to_string(src.visibility) + " to " +
              model::to_string(copy.visibility));
  }

  const auto& types = model_.types();
  if (!types.isPrimitive(src.type)) {
    std::vector<std::string> observed;
    for (const auto sub : nav_.descendantsOf(plan.destination)) {
      const auto other = model_.fieldNamed(sub, src.name);
      if (other && *other != field) { observed.push_back(model_.field(*other).type); }
    }
    const resolve::TypeUnifier unifier(model_, nav_);
    const auto unified = unifier.unify(src.type, observed);
    if (!model_.sameType(unified, src.type)) {
      plan.warn("field '" + src.name + "' retyped from " + src.type + " to " + unified +
                " to cover same-named fields in subclasses");
      copy.type = unified;
    }
  }

  const auto from = src.owner;
  const auto name = src.name;
  const auto moved = model_.addField(plan.destination, std::move(copy));
  plan.touch(plan.destination);
  plan.visitedFields.insert(moved);
  plan.migratedFields.push_back(moved);
  model_.removeField(field);
  plan.touch(from);
  removeShadows(name, plan);
  if (metrics_ != nullptr) { metrics_->incCounter("migrate.fields"); }
  plan.note("moved field '" + name + "' from " + model_.cls(from).qualifiedName + " to " + destName);
  return moved;
}

} // namespace pullup::migrate
