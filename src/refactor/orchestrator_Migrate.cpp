/***
 * Name: pullup::refactor::Orchestrator::migrate
 * Purpose: Run one pull-up migration end to end.
 */
#include "refactor/Orchestrator.h"
#include "migrate/MethodMigrator.h"
#include "model/Signature.h"
#include "observability/ModelPrinter.h"
#include "pullup/exceptions/class_not_found.h"
#include "pullup/exceptions/duplicate_method.h"
#include "pullup/exceptions/method_not_found.h"
#include "pullup/exceptions/not_an_ancestor.h"
#include "pullup/exceptions/overload_ambiguity.h"
#include "pullup/exceptions/signature_conflict.h"
#include "pullup/exceptions/unresolvable_type.h"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <utility>

namespace pullup::refactor {

Orchestrator::Orchestrator(Options opts, Collaborators collab) : opts_(std::move(opts)), collab_(collab) {
  opts_.validate();
}

static std::string timestampPrefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
#ifdef _WIN32
  localtime_s(&tmBuf, &tsTime);
#else
  localtime_r(&tsTime, &tmBuf);
#endif
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

static RefactorResult mutationFailure(const migrate::MigrationPlan& plan, const char* what) {
  auto r = RefactorResult::failure(ErrorKind::MigrationError, std::string("migration failed: ") + what);
  r.warnings = plan.warnings;
  return r;
}

RefactorResult Orchestrator::migrate(model::Model& model, const MigrationRequest& request) {
  obs::Metrics* metrics = opts_.metrics ? &metrics_ : nullptr;
  obs::ScopedTimer total(metrics, "total");
  if (metrics != nullptr) { metrics->setGauge("model.classes", model.classCount()); }
  tsPrefix_ = timestampPrefix();

  migrate::MethodMigrator migrator(model, opts_.settings(), metrics);
  migrate::MigrationPlan plan;
  try {
    obs::ScopedTimer resolveTimer(metrics, "resolve");
    const auto origin = resolveClass(model, request.originClass);
    const auto method = resolveMethod(model, origin, request);
    const auto destination = resolveDestination(model, origin, request);
    plan = migrator.prepare(method, destination);
    migrator.precheck(plan);
  } catch (const exceptions::DuplicateMethod& e) {
    RefactorResult r;
    r.success = true;
    r.message = "no change: the destination already has this method";
    r.warnings.emplace_back(e.what());
    return r;
  } catch (const exceptions::ClassNotFound& e) {
    return RefactorResult::failure(ErrorKind::ClassNotFound, e.what());
  } catch (const exceptions::MethodNotFound& e) {
    return RefactorResult::failure(ErrorKind::MethodNotFound, e.what());
  } catch (const exceptions::NotAnAncestor& e) {
    return RefactorResult::failure(ErrorKind::NotAnAncestor, e.what());
  } catch (const exceptions::UnresolvableType& e) {
    return RefactorResult::failure(ErrorKind::UnresolvableType, e.what());
  } catch (const exceptions::SignatureConflict& e) {
    return RefactorResult::failure(ErrorKind::SignatureConflict, e.what());
  } catch (const exceptions::OverloadAmbiguity& e) {
    return RefactorResult::failure(ErrorKind::OverloadAmbiguity, e.what());
  }

  if (opts_.trace) { writeTrace("pullup.before.log", obs::ModelPrinter(model).print()); }

  try {
    migrator.execute(plan);
    clearStaleOverrideMarkers(model, plan);
  } catch (const exceptions::PullupException& e) {
    return mutationFailure(plan, e.what());
  } catch (const std::exception& e) {
    return mutationFailure(plan, e.what());
  }

  auto result = buildResult(model, plan);
  try {
    runCollaborators(model, plan, result);
  } catch (const std::exception& e) {
    result.success = false;
    result.error = ErrorKind::MigrationError;
    result.message = std::string("migration applied in memory but persisting it failed: ") + e.what();
  }

  if (opts_.trace) {
    writeTrace("pullup.after.log", obs::ModelPrinter(model).print());
    std::ostringstream notes;
    for (const auto& n : plan.notes) { notes << "note: " << n << "\n"; }
    for (const auto& w : plan.warnings) { notes << "warning: " << w << "\n"; }
    if (metrics != nullptr) { notes << metrics->summaryText(); }
    writeTrace("pullup.trace.log", notes.str());
  }
  return result;
}

} // namespace pullup::refactor
