/***
 * Name: pullup::support::CollapseWhitespace
 * Purpose: Normalize printed code so layout differences do not matter when comparing bodies.
 */
#include "pullup/support/text.h"

#include <cctype>

namespace pullup {
namespace support {

std::string CollapseWhitespace(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool pendingSpace = false;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) { out.push_back(' '); pendingSpace = false; }
    out.push_back(c);
  }
  return out;
}

}  // namespace support
}  // namespace pullup
