/***
 * Name: pullup::support::EnsureDirectory
 * Purpose: Create a log directory on demand.
 * Inputs: dir
 * Outputs: err on failure
 */
#include "pullup/support/fs.h"

#include <filesystem>
#include <system_error>

namespace pullup {
namespace support {

bool EnsureDirectory(const std::string& dir, std::string& err) {
  namespace fs = std::filesystem;
  std::error_code errCode;
  if (fs::exists(dir, errCode)) { return true; }
  if (!fs::create_directories(dir, errCode) && !fs::exists(dir)) {
    err = "failed to create directory '" + dir + "': " + errCode.message();
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pullup
