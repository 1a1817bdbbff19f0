#pragma once

#include <string>

namespace podfetch {
namespace core {

// Flushes a closed file's data, or a directory's entries, to the storage device.
// Returns false on failure.
bool syncToDisk(const std::string& path);

} // namespace core
} // namespace podfetch
