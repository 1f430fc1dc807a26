/***
 * Name: pullup::exceptions::DuplicateMethod
 * Purpose: Raised when the destination already declares an identical method.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PullupException.
 */
#pragma once

#include "pullup/exceptions/pullup_exception.h"

namespace pullup {
namespace exceptions {

class DuplicateMethod : public PullupException {
 public:
  using PullupException::PullupException;
};

}  // namespace exceptions
}  // namespace pullup
