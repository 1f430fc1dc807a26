/***
 * Name: pullup::exceptions::ConfigError
 * Purpose: Exception for invalid refactoring options.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PullupException.
 */
#pragma once

#include "pullup/exceptions/pullup_exception.h"

namespace pullup {
namespace exceptions {

class ConfigError : public PullupException {
 public:
  using PullupException::PullupException;
};

}  // namespace exceptions
}  // namespace pullup
