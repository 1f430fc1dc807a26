/***
 * Name: pullup::resolve::TypeUnifier
 * Purpose: Compute a common supertype for declarations that disagree on a type.
 * Inputs:
 *   - A seed type and the types observed on related declarations
 * Outputs:
 *   - The unified type name
 * Theory of Operation:
 *   Folds the observed types into the seed in the order given. A subtype
 *   of the current result keeps it; a supertype replaces it; otherwise the
 *   current type's ancestors are tried nearest first and the first one the
 *   observed type also extends wins. With no such ancestor (or an unknown
 *   or primitive mismatch) the result is the universal top type.
 */
#pragma once

#include <string>
#include <vector>
#include "hierarchy/Navigator.h"
#include "model/Model.h"

namespace pullup::resolve {

class TypeUnifier {
 public:
  TypeUnifier(const model::Model& model, const hierarchy::Navigator& nav) : model_(model), nav_(nav) {}

  std::string unify(const std::string& a, const std::string& b) const;
  std::string unify(const std::string& seed, const std::vector<std::string>& observed) const;

 private:
  const model::Model& model_;
  const hierarchy::Navigator& nav_;
};

} // namespace pullup::resolve
