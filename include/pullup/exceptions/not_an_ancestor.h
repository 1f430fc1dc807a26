/***
 * Name: pullup::exceptions::NotAnAncestor
 * Purpose: Raised when the requested destination is not an editable ancestor of the origin.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PullupException.
 */
#pragma once

#include "pullup/exceptions/pullup_exception.h"

namespace pullup {
namespace exceptions {

class NotAnAncestor : public PullupException {
 public:
  using PullupException::PullupException;
};

}  // namespace exceptions
}  // namespace pullup
