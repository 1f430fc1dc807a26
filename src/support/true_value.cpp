#include "pullup/support/text.h"

#include <cctype>
#include <cstring>

namespace pullup {
namespace support {

bool EqualsIgnoreCase(const std::string_view lhs, const std::string_view rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const unsigned char lhsCh = static_cast<unsigned char>(lhs[i]);
    const unsigned char rhsCh = static_cast<unsigned char>(rhs[i]);
    if (std::tolower(lhsCh) != std::tolower(rhsCh)) { return false; }
  }
  return true;
}

bool IsTrueValue(const char* value) {
  if (value == nullptr) { return false; }
  const std::string_view view{value, std::strlen(value)};
  if (view == "1") { return true; }
  return EqualsIgnoreCase(view, "true") || EqualsIgnoreCase(view, "yes");
}

}  // namespace support
}  // namespace pullup
