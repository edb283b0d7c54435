#pragma once

#include "lanshare/Types.hpp"

#include <filesystem>

namespace lanshare {

DeviceId generate_device_id();

// Reads the persisted device id, creating it on first run.
// Throws std::runtime_error when the file exists but is unreadable or corrupt.
DeviceId load_or_create_device_id(const std::filesystem::path& path);

}  // namespace lanshare
