/**
 * @file
 * @brief MigrationPlan class bookkeeping and StubPolicy names.
 */
#include "migrate/MigrationPlan.h"
#include "migrate/Settings.h"
#include <algorithm>

namespace pullup::migrate {

const char* to_string(const StubPolicy p) {
  switch (p) {
    case StubPolicy::ThrowNotImplemented: return "throw-not-implemented";
    case StubPolicy::ReturnDefault: return "return-default";
  }
  return "unknown";
}

void MigrationPlan::touch(const model::ClassId cls) {
  if (std::find(mutatedClasses.begin(), mutatedClasses.end(), cls) == mutatedClasses.end()) {
    mutatedClasses.push_back(cls);
  }
}

void MigrationPlan::touchVisibility(const model::ClassId cls) {
  if (std::find(visibilityChanged.begin(), visibilityChanged.end(), cls) == visibilityChanged.end()) {
    visibilityChanged.push_back(cls);
  }
}

} // namespace pullup::migrate
