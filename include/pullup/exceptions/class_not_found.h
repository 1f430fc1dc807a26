/***
 * Name: pullup::exceptions::ClassNotFound
 * Purpose: Raised when a class name does not resolve to exactly one class in the model.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PullupException.
 */
#pragma once

#include "pullup/exceptions/pullup_exception.h"

namespace pullup {
namespace exceptions {

class ClassNotFound : public PullupException {
 public:
  using PullupException::PullupException;
};

}  // namespace exceptions
}  // namespace pullup
