/**
 * @file
 * @brief Outcome record returned by the orchestrator.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pullup::refactor {

// A duplicate method is reported as a successful no-op and bad options
// throw ConfigError from the Orchestrator constructor, so neither has a kind.
enum class ErrorKind {
  ClassNotFound,
  MethodNotFound,
  NotAnAncestor,
  UnresolvableType,
  SignatureConflict,
  OverloadAmbiguity,
  MigrationError
};

const char* to_string(ErrorKind k);

struct RefactorResult {
  bool success{false};
  std::string message;
  std::vector<std::string> modifiedFiles;
  std::vector<std::string> warnings;
  std::optional<ErrorKind> error;
  std::vector<std::string> mutatedClasses;           // qualified names needing re-serialization
  std::vector<std::string> visibilityChangedClasses; // descendants whose declarations were widened

  static RefactorResult failure(ErrorKind kind, std::string message);
};

// Origin may be simple or qualified; no destination means the direct superclass.
struct MigrationRequest {
  std::string originClass;
  std::string methodName;
  std::optional<std::vector<std::string>> parameterTypes;
  std::optional<std::string> destinationClass;
};

} // namespace pullup::refactor
