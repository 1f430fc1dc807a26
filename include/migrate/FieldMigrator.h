/***
 * Name: pullup::migrate::FieldMigrator
 * Purpose: Move one field to the destination, removing shadows on the way.
 * Inputs:
 *   - Field id and the MigrationPlan of the current run
 * Outputs:
 *   - The id of the field now on the destination, or nothing when this
 *     field was skipped (the reason is a plan warning)
 * Theory of Operation:
 *   A field is skipped when the destination already declares the name or
 *   its type cannot be resolved; other fields of the same run proceed.
 *   The copy is widened (private/package to protected, public across
 *   modules) and its reference type unified with same-named fields on the
 *   destination's descendants. The original and every same-named field on
 *   the origin-to-destination path are then removed.
 */
#pragma once

#include <optional>
#include <string>
#include "hierarchy/Navigator.h"
#include "migrate/MigrationPlan.h"
#include "migrate/Settings.h"
#include "model/Model.h"
#include "observability/Metrics.h"

namespace pullup::migrate {

class FieldMigrator {
 public:
  FieldMigrator(model::Model& model, const hierarchy::Navigator& nav, const Settings& settings,
                obs::Metrics* metrics = nullptr)
      : model_(model), nav_(nav), settings_(settings), metrics_(metrics) {}

  std::optional<model::FieldId> migrate(model::FieldId field, MigrationPlan& plan);

 private:
  void removeShadows(const std::string& name, MigrationPlan& plan);

  model::Model& model_;
  const hierarchy::Navigator& nav_;
  const Settings& settings_;
  obs::Metrics* metrics_;
};

} // namespace pullup::migrate
