/***
 * Name: pullup::exceptions::PullupException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pullup/exceptions/pullup_exception.h"

namespace pullup::exceptions {

const char* PullupException::what() const noexcept { return message_.c_str(); }

}  // namespace pullup::exceptions
