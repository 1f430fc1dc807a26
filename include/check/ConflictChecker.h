/***
 * Name: pullup::check::ConflictChecker
 * Purpose: Detect destination-side collisions for a method about to be pulled up.
 * Inputs:
 *   - Candidate method id and destination class id
 * Outputs:
 *   - ConflictReport with outcome, the colliding declaration and a message
 * Theory of Operation:
 *   Only the destination's own declarations are inspected. An exact
 *   signature match is a duplicate when both bodies print to the same
 *   whitespace-normalized text, otherwise a signature conflict (an abstract
 *   declaration at the destination counts as differing). A same-name,
 *   same-arity method whose parameter types are pairwise related by
 *   subtyping (in either direction) is an overload ambiguity. Anything else
 *   is clear.
 */
#pragma once

#include <optional>
#include <string>
#include "model/Model.h"

namespace pullup::check {

enum class ConflictOutcome {
  Clear,
  Duplicate,
  SignatureConflict,
  OverloadAmbiguity
};

const char* to_string(ConflictOutcome o);

struct ConflictReport {
  ConflictOutcome outcome{ConflictOutcome::Clear};
  std::optional<model::MethodId> existing;
  std::string message;

  bool fatal() const {
    return outcome == ConflictOutcome::SignatureConflict || outcome == ConflictOutcome::OverloadAmbiguity;
  }
};

class ConflictChecker {
 public:
  explicit ConflictChecker(const model::Model& model) : model_(model) {}

  ConflictReport check(model::MethodId candidate, model::ClassId destination) const;

 private:
  bool sameBody(const model::MethodNode& a, const model::MethodNode& b) const;
  bool ambiguousWith(const model::MethodNode& a, const model::MethodNode& b) const;

  const model::Model& model_;
};

} // namespace pullup::check
