/**
 * @file
 * @brief Orchestrator post-migration steps: override markers, result record, collaborators, trace files.
 */
#include "refactor/Orchestrator.h"
#include "hierarchy/Navigator.h"
#include "model/Signature.h"
#include "pullup/support/fs.h"
#include <algorithm>
#include <iostream>

namespace pullup::refactor {

void Orchestrator::clearStaleOverrideMarkers(model::Model& model, migrate::MigrationPlan& plan) const {
  const hierarchy::Navigator nav(model);
  const auto ancestors = nav.ancestorsOf(plan.destination);
  for (const auto id : model.cls(plan.destination).methods) {
    auto& m = model.method(id);
    if (!m.overrideMarker) { continue; }
    const auto sig = model::signatureText(m);
    if (std::find(opts_.topLevelMethods.begin(), opts_.topLevelMethods.end(), sig) != opts_.topLevelMethods.end()) {
      continue;
    }
    const bool overrides = std::any_of(ancestors.begin(), ancestors.end(), [&](const model::ClassId a) {
      return model.findMethod(a, m.name, m.paramTypes()).has_value();
    });
    if (overrides) { continue; }
    m.overrideMarker = false;
    plan.touch(plan.destination);
    plan.note("removed override marker from " + sig + ": it overrides nothing above " +
              model.cls(plan.destination).qualifiedName);
  }
}

RefactorResult Orchestrator::buildResult(const model::Model& model, const migrate::MigrationPlan& plan) const {
  RefactorResult r;
  r.success = true;
  const auto& m = model.method(plan.method);
  r.message = "moved " + model::signatureText(m) + " from " + model.cls(plan.origin).qualifiedName + " to " +
              model.cls(plan.destination).qualifiedName;
  r.warnings = plan.warnings;
  for (const auto c : plan.mutatedClasses) {
    const auto& cls = model.cls(c);
    r.mutatedClasses.push_back(cls.qualifiedName);
    if (!cls.sourceFile.empty() &&
        std::find(r.modifiedFiles.begin(), r.modifiedFiles.end(), cls.sourceFile) == r.modifiedFiles.end()) {
      r.modifiedFiles.push_back(cls.sourceFile);
    }
  }
  for (const auto c : plan.visibilityChanged) { r.visibilityChangedClasses.push_back(model.cls(c).qualifiedName); }
  return r;
}

void Orchestrator::runCollaborators(const model::Model& model, const migrate::MigrationPlan& plan,
                                    const RefactorResult& result) {
  if (collab_.snapshots != nullptr) { collab_.snapshots->save(result.modifiedFiles); }
  if (collab_.writer != nullptr) {
    for (const auto c : plan.mutatedClasses) { collab_.writer->write(model, c); }
  }
  if (collab_.imports != nullptr) {
    for (const auto c : plan.mutatedClasses) { collab_.imports->fix(model, c); }
  }
  if (collab_.manifest != nullptr && plan.crossModule) {
    collab_.manifest->link(model.cls(plan.origin).module, model.cls(plan.destination).module);
  }
}

void Orchestrator::writeTrace(const std::string& suffix, const std::string& text) const {
  std::string err;
  if (!support::EnsureDirectory(opts_.logPath, err) ||
      !support::WriteFile(opts_.logPath + "/" + tsPrefix_ + suffix, text, err)) {
    std::cerr << "pullup: " << err << "\n";
  }
}

} // namespace pullup::refactor
