/**
 * @file
 * @brief Class declaration stored in the model arena.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "model/Ids.h"

namespace pullup::model {

struct ClassNode {
  std::string qualifiedName;
  std::optional<ClassId> superclass; // empty: extends the universal top type
  std::vector<MethodId> methods;     // declaration order, live members only
  std::vector<FieldId> fields;
  bool isAbstract{false};
  bool external{false};              // library type known by name only; never mutated
  std::string module;                // packaging unit (build module); may be empty
  std::string sourceFile;

  std::string simpleName() const;
  std::string packageName() const;
};

} // namespace pullup::model
