/***
 * Name: pullup::migrate::MigrationPlan
 * Purpose: Per-run state and result accumulator threaded through every pass.
 * Inputs:
 *   - The method under migration, its origin and the resolved destination
 * Outputs:
 *   - Warnings (user visible), notes (trace level) and the ids of every
 *     node created, moved or edited
 * Theory of Operation:
 *   Passes append to the plan instead of logging. The visited sets stop
 *   the dependency recursion from processing a member twice. touch()
 *   records classes needing re-serialization in first-touch order.
 */
#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include "check/ConflictChecker.h"
#include "model/Ids.h"

namespace pullup::migrate {

struct MigrationPlan {
  model::MethodId method{};
  model::ClassId origin{};
  model::ClassId destination{};
  bool crossModule{false};

  std::vector<std::string> warnings;
  std::vector<std::string> notes;

  check::ConflictReport conflict;
  std::optional<model::MethodId> migrated;
  std::vector<model::FieldId> migratedFields;
  std::vector<model::MethodId> introducedAbstracts;
  std::vector<model::MethodId> keptOverrides;
  std::vector<model::MethodId> relocatedStatics;
  std::vector<model::MethodId> stubs;
  std::vector<model::MethodId> forwarded;
  std::vector<model::ClassId> mutatedClasses;
  std::vector<model::ClassId> visibilityChanged;
  std::unordered_set<model::MethodId> visitedMethods;
  std::unordered_set<model::FieldId> visitedFields;
  bool destinationMadeAbstract{false};

  void warn(std::string text) { warnings.push_back(std::move(text)); }
  void note(std::string text) { notes.push_back(std::move(text)); }
  void touch(model::ClassId cls);
  void touchVisibility(model::ClassId cls);
};

} // namespace pullup::migrate
