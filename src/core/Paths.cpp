#include "lanshare/core/Paths.hpp"

#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <unistd.h>
#endif

namespace lanshare {

namespace {

constexpr const char* kAppName = "LanShare";

std::filesystem::path env_path(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return {};
    }
    return std::filesystem::path(value);
}

std::filesystem::path home_directory() {
#ifdef _WIN32
    return env_path("USERPROFILE");
#else
    return env_path("HOME");
#endif
}

}  // namespace

std::filesystem::path default_config_directory() {
#ifdef _WIN32
    auto base = env_path("APPDATA");
    if (base.empty()) {
        base = home_directory();
    }
    return base / kAppName;
#else
    auto base = env_path("XDG_CONFIG_HOME");
    if (base.empty()) {
        const auto home = home_directory();
        base = home.empty() ? std::filesystem::path(".") : home / ".config";
    }
    return base / kAppName;
#endif
}

std::filesystem::path default_config_file() {
    return default_config_directory() / "config.json";
}

std::filesystem::path default_identity_path() {
    return default_config_directory() / "device_id";
}

std::filesystem::path default_recent_peers_path() {
    return default_config_directory() / "recent_peers.json";
}

std::filesystem::path default_download_directory() {
    std::error_code ec;
    const auto home = home_directory();
    if (!home.empty()) {
        const auto downloads = home / "Downloads";
        if (std::filesystem::is_directory(downloads, ec)) {
            return downloads;
        }
        if (std::filesystem::is_directory(home, ec)) {
            return home;
        }
    }
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

std::string local_host_name() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
        return "LanShare";
    }
    return std::string(buffer);
}

}  // namespace lanshare
