/***
 * Name: pullup::exceptions::OverloadAmbiguity
 * Purpose: Raised when moving a method would make destination call sites ambiguous.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PullupException.
 */
#pragma once

#include "pullup/exceptions/pullup_exception.h"

namespace pullup {
namespace exceptions {

class OverloadAmbiguity : public PullupException {
 public:
  using PullupException::PullupException;
};

}  // namespace exceptions
}  // namespace pullup
