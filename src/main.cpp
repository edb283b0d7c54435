#include "lanshare/Engine.hpp"
#include "lanshare/Version.hpp"
#include "lanshare/config/ConfigLoader.hpp"
#include "lanshare/core/Paths.hpp"
#include "lanshare/log/StructuredLogger.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <cstdio>
#include <io.h>
#else
#include <signal.h>
#include <unistd.h>
#endif

namespace {

using lanshare::transfer::TransferRole;
using lanshare::transfer::TransferState;
using lanshare::transfer::TransferStatus;

constexpr std::uint64_t kDefaultPeersWaitSeconds = 5;
constexpr std::uint64_t kDefaultSendWaitSeconds = 15;

struct GlobalOptions {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> display_name;
    std::optional<std::string> download_dir;
    std::optional<std::uint16_t> discovery_port;
    std::optional<std::uint16_t> transfer_port;
    std::vector<lanshare::Config::DiscoveryTarget> targets;
    std::optional<std::size_t> max_transfers;
    bool quiet{false};
};

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string trim(std::string value) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) { return !is_space(ch); }).base(), value.end());
    return value;
}

bool stdin_is_interactive() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return ::isatty(STDIN_FILENO) != 0;
#endif
}

bool confirm_action(const std::string& prompt, bool default_yes, bool assume_yes) {
    if (assume_yes || !stdin_is_interactive()) {
        return assume_yes || default_yes;
    }

    const std::string suffix = default_yes ? " [Y/n]: " : " [y/N]: ";
    while (true) {
        std::cout << prompt << suffix;
        std::cout.flush();
        std::string input;
        if (!std::getline(std::cin, input)) {
            return default_yes;
        }
        input = to_lower(trim(input));
        if (input.empty()) {
            return default_yes;
        }
        if (input == "y" || input == "yes") {
            return true;
        }
        if (input == "n" || input == "no") {
            return false;
        }
        std::cout << "Unrecognized answer. Type 'y' for yes or 'n' for no." << std::endl;
    }
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::array<const char*, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed;
    if (unit_index == 0 || value >= 100.0) {
        oss << std::setprecision(0);
    } else {
        oss << std::setprecision(1);
    }
    oss << value << ' ' << kUnits[unit_index];
    return oss.str();
}

class ProgressPrinter {
public:
    explicit ProgressPrinter(std::string label) : label_(std::move(label)) {}

    void update(std::uint64_t current, std::uint64_t total) {
        if (finished_) {
            return;
        }
        started_ = true;
        const double ratio = total == 0
                                 ? 1.0
                                 : std::clamp(static_cast<double>(current) / static_cast<double>(total), 0.0, 1.0);
        const int percent = static_cast<int>(std::round(ratio * 100.0));
        if (percent == last_percent_ && current < total) {
            return;
        }
        last_percent_ = percent;
        std::cout << '\r' << label_ << ": "
                  << std::setw(3) << percent << "% ("
                  << format_bytes(current) << " / "
                  << format_bytes(total) << ')'
                  << std::flush;
        if (current >= total) {
            std::cout << std::endl;
            finished_ = true;
        }
    }

    void cancel() {
        if (started_ && !finished_) {
            std::cout << std::endl;
            finished_ = true;
        }
    }

private:
    std::string label_;
    int last_percent_{-1};
    bool started_{false};
    bool finished_{false};
};

std::atomic<bool> g_run_loop{true};

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
#ifdef SIGBREAK
    case SIGBREAK:
#endif
        g_run_loop.store(false, std::memory_order_release);
        break;
    default:
        break;
    }
}

void install_termination_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGBREAK
    std::signal(SIGBREAK, signal_handler);
#endif
#else
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
#endif
}

bool running() {
    return g_run_loop.load(std::memory_order_acquire);
}

void print_usage() {
    std::cout << "LanShare CLI" << std::endl;
    std::cout << "Usage: lanshare [options] <command> [args]\n\n";
    std::cout << "Global options:\n"
              << "  --config <file>           Load settings from a JSON file\n"
              << "  --name <name>             Display name announced to peers\n"
              << "  --download-dir <path>     Directory for received files\n"
              << "  --discovery-port <port>   UDP discovery port (default 47800)\n"
              << "  --transfer-port <port>    TCP transfer port (default 47801, 0 = any)\n"
              << "  --target <host:port>      Announcement destination (repeatable)\n"
              << "  --max-transfers <n>       Concurrent transfer limit (default 4)\n"
              << "  --quiet                   Disable structured logs on stderr\n"
              << "  --version                 Print the CLI version and exit\n"
              << "  --help                    Print this help message\n\n";
    std::cout << "Commands:\n"
              << "  identity                  Show this device's id, name and address\n"
              << "  peers [--wait <sec>]      Listen for announcements and list peers\n"
              << "  send <peer> <path> [--wait <sec>]\n"
              << "                            Send a file or folder to a peer (device id or display name)\n"
              << "  receive [--yes] [--once]  Announce this device and accept incoming files\n"
              << "  recent [--clear]          List peers you recently sent files to\n"
              << "  help                      Alias for --help\n";
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    return !text.empty() && result.ec == std::errc{} && result.ptr == end;
}

bool parse_uint16(std::string_view text, std::uint16_t& value) {
    std::uint64_t temp{};
    if (!parse_uint64(text, temp) || temp > std::numeric_limits<std::uint16_t>::max()) {
        return false;
    }
    value = static_cast<std::uint16_t>(temp);
    return true;
}

std::uint16_t require_port(std::string_view option, const std::string& value) {
    std::uint16_t port{};
    if (!parse_uint16(value, port)) {
        throw_cli_error("E_INVALID_PORT",
                        std::string(option) + " must be between 0 and 65535",
                        "For example: " + std::string(option) + " 47800");
    }
    return port;
}

lanshare::Config build_config(const GlobalOptions& options) {
    lanshare::Config config{};
    config.display_name = lanshare::local_host_name();
    config.identity_path = lanshare::default_identity_path().string();
    config.recent_peers_path = lanshare::default_recent_peers_path().string();

    if (const auto path = lanshare::config::locate_config_file(options.config_path)) {
        try {
            lanshare::config::load_config_file(*path, config);
        } catch (const lanshare::config::ConfigError& ex) {
            throw CliException(ex.code, ex.message, ex.hint.empty() ? "Fix the configuration file or pass --config" : ex.hint);
        }
    }

    if (options.display_name) {
        config.display_name = *options.display_name;
    }
    if (options.download_dir) {
        config.download_directory = *options.download_dir;
    }
    if (options.discovery_port) {
        config.discovery_port = *options.discovery_port;
    }
    if (options.transfer_port) {
        config.transfer_port = *options.transfer_port;
    }
    if (!options.targets.empty()) {
        config.discovery_targets = options.targets;
    }
    if (options.max_transfers) {
        config.max_concurrent_transfers = *options.max_transfers;
    }

    auto& logger = lanshare::log::StructuredLogger::instance();
    if (const auto level = lanshare::log::StructuredLogger::parse_level(config.log_level)) {
        logger.set_min_level(*level);
    }
    logger.set_enabled(!options.quiet);
    return config;
}

// Collects engine events on worker threads and hands them to the command loop.
class EventQueue {
public:
    void push(const lanshare::EngineEvent& event) {
        {
            std::scoped_lock lock(mutex_);
            events_.push_back(event);
        }
        cv_.notify_one();
    }

    std::optional<lanshare::EngineEvent> pop(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !events_.empty(); });
        if (events_.empty()) {
            return std::nullopt;
        }
        auto event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<lanshare::EngineEvent> events_;
};

std::string describe_error(const TransferStatus& status) {
    if (!status.error) {
        return std::string(lanshare::transfer::to_string(status.state));
    }
    return std::string(lanshare::transfer::to_string(status.state)) + " (" + lanshare::to_string(*status.error) + ")";
}

void print_peers(const std::vector<lanshare::PeerRecord>& peers) {
    if (peers.empty()) {
        std::cout << "No peers discovered." << std::endl;
        return;
    }
    std::cout << std::left << std::setw(34) << "DEVICE ID" << std::setw(24) << "NAME" << std::setw(22) << "ADDRESS"
              << "STATUS" << std::endl;
    for (const auto& peer : peers) {
        const auto endpoint = peer.identity.address + ":" + std::to_string(peer.identity.port);
        std::cout << std::left << std::setw(34) << lanshare::device_id_to_string(peer.identity.device_id)
                  << std::setw(24) << peer.identity.display_name << std::setw(22) << endpoint
                  << lanshare::to_string(peer.status) << std::endl;
    }
}

void wait_for(std::chrono::seconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

std::chrono::seconds parse_wait(const std::string& value) {
    std::uint64_t seconds{};
    if (!parse_uint64(value, seconds) || seconds > 3600) {
        throw_cli_error("E_INVALID_WAIT", "--wait must be a number of seconds up to 3600", "For example: --wait 10");
    }
    return std::chrono::seconds(seconds);
}

int run_identity(const lanshare::Config& config) {
    lanshare::Engine engine(config);
    const auto identity = engine.identity();
    std::cout << "Device ID:      " << lanshare::device_id_to_string(identity.device_id) << '\n'
              << "Display name:   " << identity.display_name << '\n'
              << "Local address:  " << engine.local_address() << '\n'
              << "Discovery port: " << engine.config().discovery_port << '\n'
              << "Transfer port:  " << engine.config().transfer_port << '\n'
              << "Downloads:      " << engine.config().download_directory << std::endl;
    return 0;
}

int run_peers(const lanshare::Config& config, std::chrono::seconds wait) {
    lanshare::Engine engine(config);
    engine.start_discovery();
    std::cout << "Listening for peers for " << wait.count() << "s..." << std::endl;
    wait_for(wait);
    print_peers(engine.list_peers());
    engine.stop();
    return 0;
}

std::optional<lanshare::PeerRecord> find_peer(const lanshare::Engine& engine, const std::string& selector) {
    const auto id = lanshare::device_id_from_string(selector);
    std::optional<lanshare::PeerRecord> by_name;
    for (const auto& peer : engine.list_peers()) {
        if (peer.status != lanshare::PeerStatus::Online) {
            continue;
        }
        if (id && peer.identity.device_id == *id) {
            return peer;
        }
        if (peer.identity.display_name == selector && !by_name) {
            by_name = peer;
        }
    }
    return by_name;
}

int run_send(const lanshare::Config& config,
             const std::string& selector,
             const std::filesystem::path& path,
             std::chrono::seconds wait) {
    std::error_code ec;
    const bool directory = std::filesystem::is_directory(path, ec);
    if (!directory && !std::filesystem::is_regular_file(path, ec)) {
        throw_cli_error("E_FILE_NOT_FOUND", "File not found: " + path.string(), "Check the path and try again");
    }

    lanshare::Engine engine(config);
    EventQueue events;
    engine.subscribe([&events](const lanshare::EngineEvent& event) {
        if (event.transfer && event.transfer->role == TransferRole::Sender) {
            events.push(event);
        }
    });
    engine.start_discovery();

    std::cout << "Waiting for " << selector << "..." << std::endl;
    std::optional<lanshare::PeerRecord> peer;
    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (running() && !(peer = find_peer(engine, selector))) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw_cli_error("E_PEER_NOT_FOUND",
                            "Peer " + selector + " was not discovered within " + std::to_string(wait.count()) + "s",
                            "Run 'lanshare peers' to see who is online, or raise --wait");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!peer) {
        return 1;
    }

    std::vector<lanshare::TransferId> ids;
    try {
        if (directory) {
            ids = engine.send_directory(peer->identity.device_id, path);
        } else {
            ids.push_back(engine.send_file(peer->identity.device_id, path));
        }
    } catch (const lanshare::EngineError& ex) {
        throw_cli_error("E_SEND_FAILED", ex.what());
    }
    if (directory) {
        std::cout << "Queued " << ids.size() << " files from " << path.string() << " for "
                  << peer->identity.display_name << " (" << peer->identity.address << ")." << std::endl;
    } else {
        std::cout << "Offered " << path.filename().string() << " to " << peer->identity.display_name << " ("
                  << peer->identity.address << "), waiting for a reply..." << std::endl;
    }

    std::map<lanshare::TransferId, ProgressPrinter> printers;
    std::size_t finished = 0;
    std::size_t failed = 0;
    while (finished < ids.size()) {
        if (!running()) {
            for (const auto id : ids) {
                engine.cancel_transfer(id);
            }
            for (auto& entry : printers) {
                entry.second.cancel();
            }
            std::cout << "Transfer cancelled." << std::endl;
            return 1;
        }
        const auto event = events.pop(std::chrono::milliseconds(200));
        if (!event || std::find(ids.begin(), ids.end(), event->transfer->transfer_id) == ids.end()) {
            continue;
        }
        const auto& status = *event->transfer;
        auto printer = printers.try_emplace(status.transfer_id, "Sending " + status.file_name).first;
        if (status.state == TransferState::InProgress || status.state == TransferState::Completed) {
            printer->second.update(status.bytes_transferred, status.total_bytes);
        }
        if (!lanshare::transfer::is_terminal(status.state)) {
            continue;
        }
        ++finished;
        if (status.state == TransferState::Completed) {
            std::cout << "Delivered " << status.file_name << " (" << format_bytes(status.total_bytes) << ") to "
                      << peer->identity.display_name << "." << std::endl;
        } else {
            printer->second.cancel();
            std::cerr << status.file_name << ": " << describe_error(status) << std::endl;
            ++failed;
        }
        printers.erase(printer);
    }
    return failed == 0 ? 0 : 1;
}

int run_receive(const lanshare::Config& config, bool assume_yes, bool once) {
    lanshare::Engine engine(config);
    EventQueue events;
    engine.subscribe([&events](const lanshare::EngineEvent& event) {
        if (event.transfer && event.transfer->role == TransferRole::Receiver) {
            events.push(event);
        }
    });
    engine.start_discovery();

    const auto identity = engine.identity();
    std::cout << "Receiving as " << identity.display_name << " (" << lanshare::device_id_to_string(identity.device_id)
              << ") on " << engine.local_address() << ":" << engine.config().transfer_port << '\n'
              << "Saving files to " << engine.config().download_directory << '\n'
              << "Press Ctrl+C to stop." << std::endl;

    std::map<lanshare::TransferId, ProgressPrinter> printers;
    int exit_code = 0;
    while (running()) {
        const auto event = events.pop(std::chrono::milliseconds(200));
        if (!event) {
            continue;
        }
        const auto& status = *event->transfer;

        if (event->kind == lanshare::EventKind::OfferReceived) {
            std::cout << status.peer.display_name << " wants to send " << status.file_name << " ("
                      << format_bytes(status.total_bytes) << ")." << std::endl;
            if (engine.config().auto_accept) {
                continue;
            }
            const bool accept = confirm_action("Accept?", false, assume_yes);
            engine.respond_to_offer(status.transfer_id, accept);
            continue;
        }

        auto printer = printers.try_emplace(status.transfer_id, "Receiving " + status.file_name).first;
        if (status.state == TransferState::InProgress || status.state == TransferState::Completed) {
            printer->second.update(status.bytes_transferred, status.total_bytes);
        }
        if (!lanshare::transfer::is_terminal(status.state)) {
            continue;
        }
        if (status.state == TransferState::Completed) {
            std::cout << "Saved " << status.local_path << std::endl;
            exit_code = 0;
        } else {
            printer->second.cancel();
            std::cerr << status.file_name << ": " << describe_error(status) << std::endl;
            exit_code = 1;
        }
        printers.erase(printer);
        if (once) {
            break;
        }
    }

    engine.stop();
    return exit_code;
}

int run_recent(const lanshare::Config& config, bool clear) {
    lanshare::Engine engine(config);
    if (clear) {
        engine.clear_recent_peers();
        std::cout << "Recent peers cleared." << std::endl;
        return 0;
    }

    const auto peers = engine.recent_peers();
    if (peers.empty()) {
        std::cout << "No recent peers." << std::endl;
        return 0;
    }
    std::cout << std::left << std::setw(34) << "DEVICE ID" << std::setw(24) << "NAME" << std::setw(22) << "ADDRESS"
              << "SUCCESS" << std::endl;
    for (const auto& peer : peers) {
        const auto endpoint = peer.address + ":" + std::to_string(peer.port);
        std::ostringstream rate;
        rate << std::fixed << std::setprecision(0) << peer.success_rate() << "% (" << peer.success_count << "/"
             << peer.total_attempts << ")";
        std::cout << std::left << std::setw(34) << lanshare::device_id_to_string(peer.device_id) << std::setw(24)
                  << peer.display_name << std::setw(22) << endpoint << rate.str() << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        std::optional<std::string> command;
        std::vector<std::string> positional;
        std::optional<std::chrono::seconds> wait;
        bool assume_yes = false;
        bool once = false;
        bool clear = false;

        while (index < args.size()) {
            const auto arg = args[index++];
            if (!arg.starts_with("-")) {
                if (!command) {
                    command = std::string(arg);
                } else {
                    positional.emplace_back(arg);
                }
                continue;
            }

            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            }
            if (arg == "--version") {
                std::cout << "LanShare " << lanshare::kLanShareVersion << std::endl;
                return 0;
            }
            if (arg == "--config") {
                if (options.config_path) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(arg);
                continue;
            }
            if (arg == "--name") {
                options.display_name = require_value(arg);
                continue;
            }
            if (arg == "--download-dir") {
                options.download_dir = require_value(arg);
                continue;
            }
            if (arg == "--discovery-port") {
                options.discovery_port = require_port(arg, require_value(arg));
                continue;
            }
            if (arg == "--transfer-port") {
                options.transfer_port = require_port(arg, require_value(arg));
                continue;
            }
            if (arg == "--target") {
                const auto value = require_value(arg);
                auto target = lanshare::config::parse_discovery_target(value);
                if (!target) {
                    throw_cli_error("E_INVALID_TARGET",
                                    "Invalid discovery target: " + value,
                                    "Use host:port, for example --target 192.168.1.255:47800");
                }
                options.targets.push_back(std::move(*target));
                continue;
            }
            if (arg == "--max-transfers") {
                const auto value = require_value(arg);
                std::uint64_t parsed{};
                if (!parse_uint64(value, parsed) || parsed == 0 || parsed > 64) {
                    throw_cli_error("E_INVALID_MAX_TRANSFERS",
                                    "--max-transfers must be between 1 and 64",
                                    "For example: --max-transfers 2");
                }
                options.max_transfers = static_cast<std::size_t>(parsed);
                continue;
            }
            if (arg == "--quiet" || arg == "-q") {
                options.quiet = true;
                continue;
            }
            if (arg == "--wait") {
                wait = parse_wait(require_value(arg));
                continue;
            }
            if (arg == "--clear") {
                clear = true;
                continue;
            }
            if (arg == "--yes" || arg == "-y") {
                assume_yes = true;
                continue;
            }
            if (arg == "--once") {
                once = true;
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION", "Unknown option " + std::string(arg), "Run 'lanshare --help' for usage");
        }

        if (!command || *command == "help") {
            print_usage();
            return command ? 0 : 1;
        }

        auto expect_arguments = [&](std::size_t count, const char* usage) {
            if (positional.size() != count) {
                throw_cli_error("E_USAGE", std::string("Usage: ") + usage);
            }
        };

        const auto config = build_config(options);
        install_termination_handlers();

        if (*command == "identity") {
            expect_arguments(0, "lanshare identity");
            return run_identity(config);
        }
        if (*command == "peers") {
            expect_arguments(0, "lanshare peers [--wait <sec>]");
            return run_peers(config, wait.value_or(std::chrono::seconds(kDefaultPeersWaitSeconds)));
        }
        if (*command == "send") {
            expect_arguments(2, "lanshare send <device-id|name> <file|folder> [--wait <sec>]");
            return run_send(config, positional[0], positional[1],
                            wait.value_or(std::chrono::seconds(kDefaultSendWaitSeconds)));
        }
        if (*command == "receive") {
            expect_arguments(0, "lanshare receive [--yes] [--once]");
            auto receive_config = config;
            if (assume_yes) {
                receive_config.auto_accept = true;
            }
            return run_receive(receive_config, assume_yes, once);
        }
        if (*command == "recent") {
            expect_arguments(0, "lanshare recent [--clear]");
            return run_recent(config, clear);
        }

        throw_cli_error("E_UNKNOWN_COMMAND", "Unknown command " + *command, "Run 'lanshare --help' for usage");
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const lanshare::EngineError& ex) {
        std::cerr << "Error [E_ENGINE]: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
