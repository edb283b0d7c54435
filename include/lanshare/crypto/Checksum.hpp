#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lanshare::crypto {

enum class ChecksumAlgorithm : std::uint8_t {
    Sha256 = 1,
    Crc32 = 2,
};

std::optional<ChecksumAlgorithm> checksum_algorithm_from_byte(std::uint8_t value) noexcept;
std::optional<ChecksumAlgorithm> checksum_algorithm_from_name(std::string_view name) noexcept;
const char* to_string(ChecksumAlgorithm algorithm) noexcept;
std::size_t digest_size(ChecksumAlgorithm algorithm) noexcept;

class Sha256 {
public:
    static constexpr std::size_t kDigestSize = 32;

    Sha256();

    void update(std::span<const std::uint8_t> data);
    std::array<std::uint8_t, kDigestSize> finalize();

    static std::array<std::uint8_t, kDigestSize> digest(std::span<const std::uint8_t> data);

private:
    void compress(const std::uint8_t* block);

    std::array<std::uint32_t, 8> state_{};
    std::array<std::uint8_t, 64> pending_{};
    std::size_t pending_size_{0};
    std::uint64_t total_bytes_{0};
};

// IEEE 802.3 CRC-32, reflected polynomial 0xEDB88320.
class Crc32 {
public:
    void update(std::span<const std::uint8_t> data);
    [[nodiscard]] std::uint32_t value() const noexcept { return crc_ ^ 0xFFFFFFFFu; }

    static std::uint32_t compute(std::span<const std::uint8_t> data);

private:
    std::uint32_t crc_{0xFFFFFFFFu};
};

// Running digest over a byte stream using the algorithm named in an Offer.
class ChecksumAccumulator {
public:
    explicit ChecksumAccumulator(ChecksumAlgorithm algorithm);

    void update(std::span<const std::uint8_t> data);
    std::vector<std::uint8_t> finalize();

    [[nodiscard]] ChecksumAlgorithm algorithm() const noexcept { return algorithm_; }

private:
    ChecksumAlgorithm algorithm_;
    Sha256 sha_{};
    Crc32 crc_{};
    bool finalized_{false};
};

// Returns std::nullopt when the file cannot be read or when `stop` returns
// true between blocks.
std::optional<std::vector<std::uint8_t>> checksum_file(const std::filesystem::path& path,
                                                       ChecksumAlgorithm algorithm,
                                                       const std::function<bool()>& stop = {});

std::string digest_to_hex(std::span<const std::uint8_t> digest);

}  // namespace lanshare::crypto
