/**
 * @file
 * @brief Options::validate and conversion to migrate::Settings.
 */
#include "refactor/Options.h"
#include "pullup/exceptions/config_error.h"

namespace pullup::refactor {

void Options::validate() const {
  if (trace && logPath.empty()) {
    throw exceptions::ConfigError("trace logging requires a non-empty log path");
  }
  if (stubPolicy == migrate::StubPolicy::ThrowNotImplemented && notImplementedType.empty()) {
    throw exceptions::ConfigError("stub policy throw-not-implemented requires an exception type");
  }
  for (const auto& sig : topLevelMethods) {
    const auto open = sig.find('(');
    if (open == std::string::npos || open == 0 || sig.back() != ')') {
      throw exceptions::ConfigError("top-level method '" + sig + "' is not of the form name(T1,T2)");
    }
  }
}

migrate::Settings Options::settings() const {
  migrate::Settings s;
  s.stubPolicy = stubPolicy;
  s.notImplementedType = notImplementedType;
  s.crossModuleDetection = crossModuleDetection;
  s.topLevelMethods = topLevelMethods;
  return s;
}

} // namespace pullup::refactor
