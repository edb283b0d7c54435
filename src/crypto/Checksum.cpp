#include "lanshare/crypto/Checksum.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lanshare::crypto {

namespace {

constexpr std::array<std::uint32_t, 64> kSha256K = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

constexpr std::uint32_t rotr(std::uint32_t value, int shift) noexcept {
    return (value >> shift) | (value << (32 - shift));
}

constexpr std::array<std::uint32_t, 256> make_crc_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t index = 0; index < 256; ++index) {
        std::uint32_t value = index;
        for (int bit = 0; bit < 8; ++bit) {
            value = (value & 1u) ? (0xEDB88320u ^ (value >> 1)) : (value >> 1);
        }
        table[index] = value;
    }
    return table;
}

constexpr auto kCrcTable = make_crc_table();

}  // namespace

std::optional<ChecksumAlgorithm> checksum_algorithm_from_byte(std::uint8_t value) noexcept {
    switch (value) {
        case static_cast<std::uint8_t>(ChecksumAlgorithm::Sha256):
            return ChecksumAlgorithm::Sha256;
        case static_cast<std::uint8_t>(ChecksumAlgorithm::Crc32):
            return ChecksumAlgorithm::Crc32;
        default:
            return std::nullopt;
    }
}

std::optional<ChecksumAlgorithm> checksum_algorithm_from_name(std::string_view name) noexcept {
    if (name == "sha256" || name == "sha-256") {
        return ChecksumAlgorithm::Sha256;
    }
    if (name == "crc32" || name == "crc-32") {
        return ChecksumAlgorithm::Crc32;
    }
    return std::nullopt;
}

const char* to_string(ChecksumAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ChecksumAlgorithm::Sha256:
            return "sha256";
        case ChecksumAlgorithm::Crc32:
            return "crc32";
    }
    return "unknown";
}

std::size_t digest_size(ChecksumAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ChecksumAlgorithm::Sha256:
            return Sha256::kDigestSize;
        case ChecksumAlgorithm::Crc32:
            return 4;
    }
    return 0;
}

Sha256::Sha256()
    : state_{0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
             0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u} {}

void Sha256::update(std::span<const std::uint8_t> data) {
    total_bytes_ += data.size();
    std::size_t offset = 0;

    if (pending_size_ > 0) {
        const auto take = std::min(data.size(), pending_.size() - pending_size_);
        std::copy_n(data.begin(), take, pending_.begin() + static_cast<std::ptrdiff_t>(pending_size_));
        pending_size_ += take;
        offset = take;
        if (pending_size_ < pending_.size()) {
            return;
        }
        compress(pending_.data());
        pending_size_ = 0;
    }

    while (data.size() - offset >= 64) {
        compress(data.data() + offset);
        offset += 64;
    }

    const auto rest = data.size() - offset;
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), rest, pending_.begin());
    pending_size_ = rest;
}

std::array<std::uint8_t, Sha256::kDigestSize> Sha256::finalize() {
    const std::uint64_t bit_length = total_bytes_ * 8;

    std::array<std::uint8_t, 128> tail{};
    std::copy_n(pending_.begin(), pending_size_, tail.begin());
    tail[pending_size_] = 0x80;
    const std::size_t tail_size = pending_size_ < 56 ? 64 : 128;
    for (int index = 0; index < 8; ++index) {
        tail[tail_size - 1 - static_cast<std::size_t>(index)] =
            static_cast<std::uint8_t>((bit_length >> (8 * index)) & 0xFFu);
    }
    compress(tail.data());
    if (tail_size == 128) {
        compress(tail.data() + 64);
    }

    std::array<std::uint8_t, kDigestSize> digest{};
    for (std::size_t word = 0; word < state_.size(); ++word) {
        digest[word * 4] = static_cast<std::uint8_t>(state_[word] >> 24);
        digest[word * 4 + 1] = static_cast<std::uint8_t>(state_[word] >> 16);
        digest[word * 4 + 2] = static_cast<std::uint8_t>(state_[word] >> 8);
        digest[word * 4 + 3] = static_cast<std::uint8_t>(state_[word]);
    }
    return digest;
}

std::array<std::uint8_t, Sha256::kDigestSize> Sha256::digest(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

void Sha256::compress(const std::uint8_t* block) {
    std::array<std::uint32_t, 64> w{};
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = (static_cast<std::uint32_t>(block[i * 4]) << 24) |
               (static_cast<std::uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<std::uint32_t>(block[i * 4 + 2]) << 8) |
               static_cast<std::uint32_t>(block[i * 4 + 3]);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        const auto s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        const auto s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    auto [a, b, c, d, e, f, g, h] = state_;
    for (std::size_t i = 0; i < 64; ++i) {
        const auto s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        const auto choice = (e & f) ^ (~e & g);
        const auto t1 = h + s1 + choice + kSha256K[i] + w[i];
        const auto s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        const auto majority = (a & b) ^ (a & c) ^ (b & c);
        const auto t2 = s0 + majority;
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
    state_[5] += f;
    state_[6] += g;
    state_[7] += h;
}

void Crc32::update(std::span<const std::uint8_t> data) {
    for (const auto byte : data) {
        crc_ = kCrcTable[(crc_ ^ byte) & 0xFFu] ^ (crc_ >> 8);
    }
}

std::uint32_t Crc32::compute(std::span<const std::uint8_t> data) {
    Crc32 crc;
    crc.update(data);
    return crc.value();
}

ChecksumAccumulator::ChecksumAccumulator(ChecksumAlgorithm algorithm)
    : algorithm_(algorithm) {}

void ChecksumAccumulator::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        throw std::logic_error("checksum already finalized");
    }
    if (algorithm_ == ChecksumAlgorithm::Sha256) {
        sha_.update(data);
    } else {
        crc_.update(data);
    }
}

std::vector<std::uint8_t> ChecksumAccumulator::finalize() {
    if (finalized_) {
        throw std::logic_error("checksum already finalized");
    }
    finalized_ = true;
    if (algorithm_ == ChecksumAlgorithm::Sha256) {
        const auto digest = sha_.finalize();
        return std::vector<std::uint8_t>(digest.begin(), digest.end());
    }
    const auto value = crc_.value();
    return {static_cast<std::uint8_t>(value >> 24),
            static_cast<std::uint8_t>(value >> 16),
            static_cast<std::uint8_t>(value >> 8),
            static_cast<std::uint8_t>(value)};
}

std::optional<std::vector<std::uint8_t>> checksum_file(const std::filesystem::path& path,
                                                       ChecksumAlgorithm algorithm,
                                                       const std::function<bool()>& stop) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::nullopt;
    }

    ChecksumAccumulator accumulator(algorithm);
    std::vector<std::uint8_t> buffer(64 * 1024);
    while (input) {
        if (stop && stop()) {
            return std::nullopt;
        }
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto count = input.gcount();
        if (count > 0) {
            accumulator.update(std::span<const std::uint8_t>(buffer.data(), static_cast<std::size_t>(count)));
        }
    }
    if (input.bad()) {
        return std::nullopt;
    }
    return accumulator.finalize();
}

std::string digest_to_hex(std::span<const std::uint8_t> digest) {
    std::ostringstream oss;
    for (const auto byte : digest) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

}  // namespace lanshare::crypto
