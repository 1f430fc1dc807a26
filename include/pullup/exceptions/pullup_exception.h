/***
 * Name: pullup::exceptions::PullupException
 * Purpose: Base class for all pullup exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception so boundary catch sites can
 *   treat unexpected library failures and engine failures alike, but every
 *   throw inside pullup uses a marker type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pullup {
namespace exceptions {

class PullupException : public std::exception {
 public:
  explicit PullupException(std::string msg) noexcept;
  virtual ~PullupException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  std::string message_;
};

}  // namespace exceptions
}  // namespace pullup
