#include "lanshare/core/Identity.hpp"

#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>

namespace lanshare {

DeviceId generate_device_id() {
    std::random_device rd;
    DeviceId id{};
    for (auto& byte : id) {
        byte = static_cast<std::uint8_t>(rd() & 0xFFu);
    }
    return id;
}

DeviceId load_or_create_device_id(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        if (!input) {
            throw std::runtime_error("Unable to read device identity at " + path.string());
        }
        std::string text;
        input >> text;
        const auto parsed = device_id_from_string(text);
        if (!parsed) {
            throw std::runtime_error("Device identity file is corrupt: " + path.string());
        }
        return *parsed;
    }

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Unable to create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    const auto id = generate_device_id();
    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Unable to write device identity at " + path.string());
    }
    output << device_id_to_string(id) << '\n';
    if (!output) {
        throw std::runtime_error("Unable to write device identity at " + path.string());
    }
    return id;
}

}  // namespace lanshare
