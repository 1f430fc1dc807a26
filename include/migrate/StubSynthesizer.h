/***
 * Name: pullup::migrate::StubSynthesizer
 * Purpose: Keep concrete descendants compilable after an abstract declaration is introduced.
 * Inputs:
 *   - The abstract declaration on the destination and the run's plan
 * Outputs:
 *   - Ids of the stub overrides added to descendants
 * Theory of Operation:
 *   Descendants are visited top-down (breadth first). Abstract and
 *   external classes are skipped. A descendant needs a stub unless it, or
 *   a class strictly between it and the destination, declares a concrete
 *   same-signature method; visiting top-down means a stub placed on a
 *   parent already covers its children. Void stubs get an empty body,
 *   others throw the configured not-implemented exception or return a
 *   default value depending on the stub policy.
 */
#pragma once

#include <string>
#include <vector>
#include "body/Block.h"
#include "hierarchy/Navigator.h"
#include "migrate/MigrationPlan.h"
#include "migrate/Settings.h"
#include "model/Model.h"
#include "observability/Metrics.h"

namespace pullup::migrate {

class StubSynthesizer {
 public:
  StubSynthesizer(model::Model& model, const hierarchy::Navigator& nav, const Settings& settings,
                  obs::Metrics* metrics = nullptr)
      : model_(model), nav_(nav), settings_(settings), metrics_(metrics) {}

  std::vector<model::MethodId> synthesize(model::MethodId abstractDecl, MigrationPlan& plan);

  body::Block stubBody(const model::MethodNode& decl) const;
  std::string defaultValue(const std::string& type) const;

 private:
  bool providedAlongChain(model::ClassId cls, const model::MethodNode& decl, model::ClassId destination) const;

  model::Model& model_;
  const hierarchy::Navigator& nav_;
  const Settings& settings_;
  obs::Metrics* metrics_;
};

} // namespace pullup::migrate
