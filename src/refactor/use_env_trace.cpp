#include "refactor/Options.h"
#include "pullup/support/text.h"
#include <cstdlib>

namespace pullup::refactor {

bool Options::use_env_trace() {
  return support::IsTrueValue(std::getenv("PULLUP_TRACE"));
}

Options Options::fromEnvironment(Options base) {
  if (!base.trace) { base.trace = use_env_trace(); }
  return base;
}

} // namespace pullup::refactor
