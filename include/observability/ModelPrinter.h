/***
 * Name: pullup::obs::ModelPrinter
 * Purpose: Render classes of the model as Java-like text for logs and the demo.
 * Inputs:
 *   - model::Model and optionally one class id
 * Outputs:
 *   - Formatted declarations with fields, signatures and bodies
 * Theory of Operation:
 *   Classes print in arena order; external classes are skipped. Members
 *   print in declaration order with their modifiers, override markers and
 *   bodies rendered through body::printBlock.
 */
#pragma once

#include <string>
#include "model/Model.h"

namespace pullup::obs {

class ModelPrinter {
 public:
  explicit ModelPrinter(const model::Model& model) : model_(model) {}

  std::string print() const;
  std::string printClass(model::ClassId cls) const;

 private:
  const model::Model& model_;
};

} // namespace pullup::obs
