/***
 * Name: pullup::exceptions::MethodNotFound
 * Purpose: Raised when the origin class declares no method matching the request.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PullupException.
 */
#pragma once

#include "pullup/exceptions/pullup_exception.h"

namespace pullup {
namespace exceptions {

class MethodNotFound : public PullupException {
 public:
  using PullupException::PullupException;
};

}  // namespace exceptions
}  // namespace pullup
