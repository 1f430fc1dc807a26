/**
 * @file
 * @brief Visibility display names and source keywords.
 */
#include "model/Visibility.h"

namespace pullup::model {

const char* to_string(const Visibility v) {
  switch (v) {
    case Visibility::Private: return "private";
    case Visibility::PackagePrivate: return "package-private";
    case Visibility::Protected: return "protected";
    case Visibility::Public: return "public";
  }
  return "unknown";
}

const char* keyword(const Visibility v) {
  switch (v) {
    case Visibility::Private: return "private";
    case Visibility::PackagePrivate: return "";
    case Visibility::Protected: return "protected";
    case Visibility::Public: return "public";
  }
  return "";
}

} // namespace pullup::model
