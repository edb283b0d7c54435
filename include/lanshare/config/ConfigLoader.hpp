#pragma once

#include "lanshare/Config.hpp"
#include "lanshare/config/Json.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lanshare::config {

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

// Applies a JSON settings document on top of `config`. Keys absent from the
// document keep their current value. Throws ConfigError.
void apply_config_document(const JsonValue& document, Config& config);

// Reads and applies a config.json file. Throws ConfigError.
void load_config_file(const std::filesystem::path& path, Config& config);

// Resolution order: explicit path, then $LANSHARE_CONFIG, then
// <config dir>/config.json when it exists.
std::optional<std::filesystem::path> locate_config_file(const std::optional<std::filesystem::path>& explicit_path);

// "host:port" with a non-zero port.
std::optional<Config::DiscoveryTarget> parse_discovery_target(std::string_view text);

// Clamps out-of-range values to usable ones.
Config sanitize_config(Config config);

}  // namespace lanshare::config
