/***
 * Name: pullup::refactor collaborator interfaces
 * Purpose: Seams to the parts of the tool that live outside the engine.
 * Inputs:
 *   - The model after a successful in-memory migration
 * Outputs:
 *   - On-disk effects performed by the implementations
 * Theory of Operation:
 *   The orchestrator calls them in the order snapshot, write, import fix,
 *   manifest patch. Each is optional; a null pointer skips the step.
 *   Implementations report failure by throwing; the orchestrator turns
 *   that into a MigrationError result.
 */
#pragma once

#include <string>
#include <vector>
#include "model/Model.h"

namespace pullup::refactor {

class SnapshotStore {
 public:
  virtual ~SnapshotStore() = default;
  virtual void save(const std::vector<std::string>& files) = 0;
};

class ModelWriter {
 public:
  virtual ~ModelWriter() = default;
  virtual void write(const model::Model& model, model::ClassId cls) = 0;
};

class ImportFixer {
 public:
  virtual ~ImportFixer() = default;
  virtual void fix(const model::Model& model, model::ClassId cls) = 0;
};

class ManifestPatcher {
 public:
  virtual ~ManifestPatcher() = default;
  // Declare that fromModule now depends on toModule.
  virtual void link(const std::string& fromModule, const std::string& toModule) = 0;
};

struct Collaborators {
  SnapshotStore* snapshots{nullptr};
  ModelWriter* writer{nullptr};
  ImportFixer* imports{nullptr};
  ManifestPatcher* manifest{nullptr};
};

} // namespace pullup::refactor
