/***
 * Name: pullup::support (text)
 * Purpose: Small string helpers shared by the printers and configuration.
 */
#pragma once

#include <string>
#include <string_view>

namespace pullup {
namespace support {

/*** CollapseWhitespace: Trim, and reduce every whitespace run to one space. */
std::string CollapseWhitespace(std::string_view text);

/*** EqualsIgnoreCase: ASCII case-insensitive comparison. */
bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);

/*** IsTrueValue: "1", "true" or "yes" (case-insensitive); false for null. */
bool IsTrueValue(const char* value);

}  // namespace support
}  // namespace pullup
