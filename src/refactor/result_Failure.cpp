/**
 * @file
 * @brief RefactorResult failure construction and ErrorKind names.
 */
#include "refactor/RefactorResult.h"
#include <utility>

namespace pullup::refactor {

const char* to_string(const ErrorKind k) {
  switch (k) {
    case ErrorKind::ClassNotFound: return "ClassNotFound";
    case ErrorKind::MethodNotFound: return "MethodNotFound";
    case ErrorKind::NotAnAncestor: return "NotAnAncestor";
    case ErrorKind::UnresolvableType: return "UnresolvableType";
    case ErrorKind::SignatureConflict: return "SignatureConflict";
    case ErrorKind::OverloadAmbiguity: return "OverloadAmbiguity";
    case ErrorKind::MigrationError: return "MigrationError";
  }
  return "unknown";
}

RefactorResult RefactorResult::failure(const ErrorKind kind, std::string message) {
  RefactorResult r;
  r.success = false;
  r.error = kind;
  r.message = std::move(message);
  return r;
}

} // namespace pullup::refactor
