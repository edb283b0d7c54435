#include "lanshare/core/Identity.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>

int main() {
    using namespace lanshare;

    const auto root = std::filesystem::temp_directory_path() / "lanshare_identity_test";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);

    const auto path = root / "nested" / "device_id";
    const auto created = load_or_create_device_id(path);
    assert(std::filesystem::exists(path));
    assert(load_or_create_device_id(path) == created);

    const auto text = device_id_to_string(created);
    assert(text.size() == 32);
    assert(device_id_from_string(text) == created);
    assert(!device_id_from_string("abc"));
    assert(!device_id_from_string(std::string(32, 'z')));

    DeviceId fixed{};
    fixed.fill(0xAB);
    assert(device_id_to_string(fixed) == "abababababababababababababababab");

    assert(generate_device_id() != generate_device_id());

    {
        std::ofstream corrupt(path, std::ios::trunc);
        corrupt << "not-a-device-id\n";
    }
    bool threw = false;
    try {
        load_or_create_device_id(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::filesystem::remove_all(root, ec);
    return 0;
}
