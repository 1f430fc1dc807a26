/**
 * @file
 * @brief Settings::declaredByTop: match a name and arity against the top-type method list.
 */
#include "migrate/Settings.h"
#include <algorithm>

namespace pullup::migrate {

static std::size_t arityOf(const std::string& sig) {
  const auto open = sig.find('(');
  const auto close = sig.rfind(')');
  if (open == std::string::npos || close == std::string::npos || close <= open + 1) { return 0; }
  const auto inner = sig.substr(open + 1, close - open - 1);
  return static_cast<std::size_t>(std::count(inner.begin(), inner.end(), ',')) + 1;
}

bool Settings::declaredByTop(const std::string& name, const std::size_t arity) const {
  for (const auto& sig : topLevelMethods) {
    if (sig.compare(0, sig.find('('), name) == 0 && sig.find('(') == name.size() && arityOf(sig) == arity) {
      return true;
    }
  }
  return false;
}

} // namespace pullup::migrate
