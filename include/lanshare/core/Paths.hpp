#pragma once

#include <filesystem>
#include <string>

namespace lanshare {

// $XDG_CONFIG_HOME/LanShare, ~/.config/LanShare, or %APPDATA%\LanShare on Windows.
std::filesystem::path default_config_directory();
std::filesystem::path default_config_file();
std::filesystem::path default_identity_path();
std::filesystem::path default_recent_peers_path();

// ~/Downloads when present, otherwise the home directory, otherwise the working directory.
std::filesystem::path default_download_directory();

std::string local_host_name();

}  // namespace lanshare
