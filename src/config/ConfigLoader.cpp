#include "lanshare/config/ConfigLoader.hpp"

#include "lanshare/core/Paths.hpp"
#include "lanshare/crypto/Checksum.hpp"
#include "lanshare/log/StructuredLogger.hpp"
#include "lanshare/protocol/Message.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace lanshare::config {

namespace {

constexpr std::chrono::seconds kMinAnnounceInterval{1};
constexpr std::chrono::seconds kMinTimeout{1};
constexpr std::size_t kMaxConcurrentTransfers = 64;
constexpr std::size_t kMaxRecentPeers = 100;

using Path = std::vector<std::string>;

std::string join_path(const Path& path) {
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined;
}

const JsonValue* find_path(const JsonValue& root, const Path& path) {
    const JsonValue* node = &root;
    for (const auto& segment : path) {
        node = node->find(segment);
        if (!node) {
            return nullptr;
        }
    }
    return node;
}

std::optional<std::string> get_string(const JsonValue& root, const Path& path) {
    const JsonValue* node = find_path(root, path);
    if (!node || node->type == JsonType::Null) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const JsonValue& root, const Path& path) {
    const JsonValue* node = find_path(root, path);
    if (!node || node->type == JsonType::Null) {
        return std::nullopt;
    }
    if (node->is_bool()) {
        return node->bool_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const JsonValue& root, const Path& path) {
    const JsonValue* node = find_path(root, path);
    if (!node || node->type == JsonType::Null) {
        return std::nullopt;
    }
    if (node->is_number()) {
        const double value = node->number_value;
        const double rounded = std::floor(value + 0.5);
        if (std::abs(value - rounded) < 1e-9 && std::abs(rounded) < 9.0e15) {
            return static_cast<std::int64_t>(rounded);
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

std::int64_t require_range(std::int64_t value, std::int64_t min, std::int64_t max, const Path& path) {
    if (value < min || value > max) {
        throw ConfigError("E_CONFIG_VALUE",
                          join_path(path) + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return value;
}

std::uint16_t get_port(const JsonValue& root, const Path& path, std::uint16_t current) {
    if (auto value = get_int64(root, path)) {
        return static_cast<std::uint16_t>(require_range(*value, 0, 65535, path));
    }
    return current;
}

std::chrono::seconds get_seconds(const JsonValue& root, const Path& path, std::chrono::seconds current) {
    if (auto value = get_int64(root, path)) {
        return std::chrono::seconds(require_range(*value, 1, 86400, path));
    }
    return current;
}

void warn_unknown_keys(const JsonValue& object,
                       const std::string& prefix,
                       std::initializer_list<std::string_view> known) {
    if (!object.is_object()) {
        return;
    }
    for (const auto& [key, value] : object.object_value) {
        bool recognised = false;
        for (const auto candidate : known) {
            if (key == candidate) {
                recognised = true;
                break;
            }
        }
        if (!recognised) {
            log::StructuredLogger::instance().warning(
                "config.unknown_key",
                {{"key", prefix.empty() ? key : prefix + "." + key}});
        }
    }
}

void require_object(const JsonValue& root, const std::string& key) {
    if (const auto* node = root.find(key); node && !node->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "'" + key + "' section must be an object");
    }
}

}  // namespace

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    if (!code.empty()) {
        formatted = "[" + code + "] " + message;
    } else {
        formatted = message;
    }
}

void apply_config_document(const JsonValue& document, Config& config) {
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }
    for (const auto* section : {"discovery", "transfer", "log", "history"}) {
        require_object(document, section);
    }

    warn_unknown_keys(document, {},
                      {"display_name", "download_directory", "identity_path", "discovery", "transfer", "log", "history"});

    if (auto name = get_string(document, {"display_name"})) {
        if (!protocol::is_valid_utf8(*name)) {
            throw ConfigError("E_CONFIG_VALUE", "display_name must be valid UTF-8");
        }
        config.display_name = *name;
    }
    if (auto directory = get_string(document, {"download_directory"})) {
        config.download_directory = *directory;
    }
    if (auto identity = get_string(document, {"identity_path"})) {
        config.identity_path = *identity;
    }

    if (const auto* discovery = document.find("discovery")) {
        warn_unknown_keys(*discovery, "discovery",
                          {"port", "announce_interval_seconds", "stale_after_seconds", "targets"});
        config.discovery_port = get_port(document, {"discovery", "port"}, config.discovery_port);
        config.announce_interval =
            get_seconds(document, {"discovery", "announce_interval_seconds"}, config.announce_interval);
        config.stale_after = get_seconds(document, {"discovery", "stale_after_seconds"}, config.stale_after);

        if (const auto* targets = discovery->find("targets")) {
            if (!targets->is_array()) {
                throw ConfigError("E_CONFIG_TYPE", "Expected array at config path discovery.targets");
            }
            std::vector<Config::DiscoveryTarget> parsed;
            for (const auto& item : targets->array_value) {
                if (!item.is_string()) {
                    throw ConfigError("E_CONFIG_TYPE", "discovery.targets entries must be strings");
                }
                auto target = parse_discovery_target(item.string_value);
                if (!target) {
                    throw ConfigError("E_CONFIG_VALUE", "Invalid discovery target: " + item.string_value,
                                      "Use host:port, for example 192.168.1.255:47800");
                }
                parsed.push_back(std::move(*target));
            }
            config.discovery_targets = std::move(parsed);
        }
    }

    if (document.find("transfer")) {
        warn_unknown_keys(*document.find("transfer"), "transfer",
                          {"host", "port", "chunk_size", "checksum", "max_concurrent", "connect_timeout_seconds",
                           "handshake_timeout_seconds", "offer_response_timeout_seconds", "idle_timeout_seconds",
                           "ack_every_chunks", "grace_period_seconds", "auto_accept"});
        if (auto host = get_string(document, {"transfer", "host"})) {
            config.transfer_host = *host;
        }
        config.transfer_port = get_port(document, {"transfer", "port"}, config.transfer_port);
        if (auto chunk = get_int64(document, {"transfer", "chunk_size"})) {
            config.chunk_size = static_cast<std::uint32_t>(
                require_range(*chunk, 0, protocol::kMaxChunkBytes, {"transfer", "chunk_size"}));
        }
        if (auto checksum = get_string(document, {"transfer", "checksum"})) {
            if (!crypto::checksum_algorithm_from_name(*checksum)) {
                throw ConfigError("E_CONFIG_VALUE", "Unsupported checksum algorithm: " + *checksum,
                                  "Use sha256 or crc32");
            }
            config.checksum_algorithm = *checksum;
        }
        if (auto max = get_int64(document, {"transfer", "max_concurrent"})) {
            config.max_concurrent_transfers = static_cast<std::size_t>(
                require_range(*max, 1, static_cast<std::int64_t>(kMaxConcurrentTransfers), {"transfer", "max_concurrent"}));
        }
        config.connect_timeout =
            get_seconds(document, {"transfer", "connect_timeout_seconds"}, config.connect_timeout);
        config.handshake_timeout =
            get_seconds(document, {"transfer", "handshake_timeout_seconds"}, config.handshake_timeout);
        config.offer_response_timeout =
            get_seconds(document, {"transfer", "offer_response_timeout_seconds"}, config.offer_response_timeout);
        config.idle_timeout = get_seconds(document, {"transfer", "idle_timeout_seconds"}, config.idle_timeout);
        if (auto ack = get_int64(document, {"transfer", "ack_every_chunks"})) {
            config.ack_every_chunks =
                static_cast<std::uint32_t>(require_range(*ack, 1, 1024, {"transfer", "ack_every_chunks"}));
        }
        config.terminal_grace_period =
            get_seconds(document, {"transfer", "grace_period_seconds"}, config.terminal_grace_period);
        if (auto auto_accept = get_bool(document, {"transfer", "auto_accept"})) {
            config.auto_accept = *auto_accept;
        }
    }

    if (const auto* log_section = document.find("log")) {
        warn_unknown_keys(*log_section, "log", {"level"});
        if (auto level = get_string(document, {"log", "level"})) {
            if (!log::StructuredLogger::parse_level(*level)) {
                throw ConfigError("E_CONFIG_VALUE", "Unknown log level: " + *level, "Use info, warning or error");
            }
            config.log_level = *level;
        }
    }

    if (const auto* history = document.find("history")) {
        warn_unknown_keys(*history, "history", {"path", "max_recent_peers"});
        if (auto path = get_string(document, {"history", "path"})) {
            config.recent_peers_path = *path;
        }
        if (auto limit = get_int64(document, {"history", "max_recent_peers"})) {
            config.max_recent_peers = static_cast<std::size_t>(
                require_range(*limit, 1, static_cast<std::int64_t>(kMaxRecentPeers), {"history", "max_recent_peers"}));
        }
    }
}

void load_config_file(const std::filesystem::path& path, Config& config) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    const auto& shown = ec ? path : absolute;

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + shown.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw ConfigError("E_CONFIG_IO", "Failed to read configuration file: " + shown.string());
    }

    JsonValue document;
    try {
        document = parse_json(buffer.str());
    } catch (const JsonError& error) {
        throw ConfigError("E_CONFIG_PARSE", std::string("Invalid JSON in ") + shown.string() + ": " + error.what());
    }
    apply_config_document(document, config);

    log::StructuredLogger::instance().info("config.loaded", {{"path", shown.string()}});
}

std::optional<std::filesystem::path> locate_config_file(const std::optional<std::filesystem::path>& explicit_path) {
    if (explicit_path) {
        return explicit_path;
    }
    if (const char* env = std::getenv("LANSHARE_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }
    const auto fallback = default_config_file();
    std::error_code ec;
    if (std::filesystem::is_regular_file(fallback, ec)) {
        return fallback;
    }
    return std::nullopt;
}

std::optional<Config::DiscoveryTarget> parse_discovery_target(std::string_view text) {
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }
    const auto port_text = text.substr(colon + 1);
    unsigned int port = 0;
    const auto* first = port_text.data();
    const auto* last = port_text.data() + port_text.size();
    const auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc() || ptr != last || port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    Config::DiscoveryTarget target{};
    target.host = std::string(text.substr(0, colon));
    target.port = static_cast<std::uint16_t>(port);
    return target;
}

Config sanitize_config(Config config) {
    if (config.announce_interval < kMinAnnounceInterval) {
        config.announce_interval = kMinAnnounceInterval;
    }
    if (config.stale_after < config.announce_interval) {
        config.stale_after = config.announce_interval;
    }
    if (config.chunk_size > protocol::kMaxChunkBytes) {
        config.chunk_size = protocol::kMaxChunkBytes;
    }
    if (!crypto::checksum_algorithm_from_name(config.checksum_algorithm)) {
        config.checksum_algorithm = "sha256";
    }
    if (config.max_concurrent_transfers == 0) {
        config.max_concurrent_transfers = 1;
    }
    if (config.max_concurrent_transfers > kMaxConcurrentTransfers) {
        config.max_concurrent_transfers = kMaxConcurrentTransfers;
    }
    if (config.max_recent_peers == 0) {
        config.max_recent_peers = 1;
    }
    if (config.max_recent_peers > kMaxRecentPeers) {
        config.max_recent_peers = kMaxRecentPeers;
    }
    if (config.ack_every_chunks == 0) {
        config.ack_every_chunks = 1;
    }
    for (auto* timeout : {&config.connect_timeout, &config.handshake_timeout, &config.offer_response_timeout,
                          &config.idle_timeout}) {
        if (*timeout < kMinTimeout) {
            *timeout = kMinTimeout;
        }
    }
    if (config.terminal_grace_period < std::chrono::seconds::zero()) {
        config.terminal_grace_period = std::chrono::seconds::zero();
    }
    return config;
}

}  // namespace lanshare::config
