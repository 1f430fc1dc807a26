/***
 * Name: pullup::exceptions::MigrationError
 * Purpose: Generic failure raised while structural edits are being applied.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PullupException.
 */
#pragma once

#include "pullup/exceptions/pullup_exception.h"

namespace pullup {
namespace exceptions {

class MigrationError : public PullupException {
 public:
  using PullupException::PullupException;
};

}  // namespace exceptions
}  // namespace pullup
