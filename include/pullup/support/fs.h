/***
 * Name: pullup::support (fs)
 * Purpose: Minimal file IO helpers for trace log output.
 * Inputs: Paths and string buffers
 * Outputs: File contents on disk
 * Theory of Operation: Thin wrappers over std::filesystem and fstream that
 *   report failure through a return value plus an error string.
 */
#pragma once

#include <string>

namespace pullup {
namespace support {

/*** WriteFile: Write entire string to path. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

/*** EnsureDirectory: Create dir (and parents) unless it exists. Return true on success. */
bool EnsureDirectory(const std::string& dir, std::string& err);

}  // namespace support
}  // namespace pullup
