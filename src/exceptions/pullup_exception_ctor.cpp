/***
 * Name: pullup::exceptions::PullupException::PullupException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pullup/exceptions/pullup_exception.h"

#include <utility>

namespace pullup {
namespace exceptions {

PullupException::PullupException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pullup
