#include "lanshare/crypto/Checksum.hpp"
#include "lanshare/log/StructuredLogger.hpp"
#include "lanshare/protocol/Message.hpp"

#include <cassert>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace {

using namespace lanshare;
using namespace lanshare::protocol;

DeviceId make_id(std::uint8_t seed) {
    DeviceId id{};
    for (std::size_t i = 0; i < id.size(); ++i) {
        id[i] = static_cast<std::uint8_t>(seed + i);
    }
    return id;
}

ControlMessage round_trip(const ControlMessage& message) {
    const auto bytes = encode(message);
    ErrorCode error = ErrorCode::Cancelled;
    const auto decoded = decode(bytes, &error);
    assert(decoded.has_value());
    assert(decoded->transfer_id == message.transfer_id);
    assert(decoded->type() == message.type());
    return *decoded;
}

ControlMessage make_offer() {
    OfferPayload offer{};
    offer.sender_id = make_id(1);
    offer.receiver_id = make_id(100);
    offer.sender_name = "Laptop \xC3\xA9t\xC3\xA9";
    offer.file_name = "holiday photos.zip";
    offer.file_size = 5'000'000'000ull;
    offer.checksum_algorithm = crypto::ChecksumAlgorithm::Sha256;
    offer.checksum.assign(32, 0xAB);
    offer.chunk_size = 4u * 1024u * 1024u;

    ControlMessage message{};
    message.transfer_id = 0x0102030405060708ull;
    message.payload = offer;
    return message;
}

void test_announcement() {
    Announcement announcement{};
    announcement.device_id = make_id(7);
    announcement.display_name = "Kitchen PC";
    announcement.listen_port = 47801;

    const auto bytes = encode_announcement(announcement);
    const auto decoded = decode_announcement(bytes);
    assert(decoded);
    assert(decoded->version == kProtocolVersion);
    assert(decoded->device_id == announcement.device_id);
    assert(decoded->display_name == "Kitchen PC");
    assert(decoded->listen_port == 47801);

    // Over-long names are cut on a code point boundary.
    std::string long_name;
    for (int i = 0; i < 200; ++i) {
        long_name += "\xC3\xA9";
    }
    announcement.display_name = long_name;
    const auto truncated = decode_announcement(encode_announcement(announcement));
    assert(truncated);
    assert(truncated->display_name.size() <= kMaxDisplayNameBytes);
    assert(truncated->display_name.size() % 2 == 0);
    assert(is_valid_utf8(truncated->display_name));

    ErrorCode error = ErrorCode::Cancelled;
    auto wrong_version = bytes;
    wrong_version[0] = 2;
    assert(!decode_announcement(wrong_version, &error));
    assert(error == ErrorCode::UnsupportedVersion);

    error = ErrorCode::Cancelled;
    const std::vector<std::uint8_t> cut(bytes.begin(), bytes.end() - 1);
    assert(!decode_announcement(cut, &error));
    assert(error == ErrorCode::MalformedFrame);

    error = ErrorCode::Cancelled;
    auto trailing = bytes;
    trailing.push_back(0);
    assert(!decode_announcement(trailing, &error));
    assert(error == ErrorCode::MalformedFrame);

    error = ErrorCode::Cancelled;
    assert(!decode_announcement({}, &error));
    assert(error == ErrorCode::MalformedFrame);

    announcement.display_name = "x";
    announcement.listen_port = 0;
    error = ErrorCode::Cancelled;
    assert(!decode_announcement(encode_announcement(announcement), &error));
    assert(error == ErrorCode::MalformedFrame);
}

void test_control_messages() {
    const auto offer_message = make_offer();
    const auto decoded_offer = round_trip(offer_message);
    const auto& offer = std::get<OfferPayload>(decoded_offer.payload);
    const auto& original = std::get<OfferPayload>(offer_message.payload);
    assert(offer.sender_id == original.sender_id);
    assert(offer.receiver_id == original.receiver_id);
    assert(offer.sender_name == original.sender_name);
    assert(offer.file_name == original.file_name);
    assert(offer.file_size == original.file_size);
    assert(offer.checksum == original.checksum);
    assert(offer.chunk_size == original.chunk_size);

    ControlMessage accept{};
    accept.transfer_id = 9;
    accept.payload = AcceptPayload{};
    round_trip(accept);

    ControlMessage reject{};
    reject.transfer_id = 10;
    reject.payload = RejectPayload{ErrorCode::Busy};
    assert(std::get<RejectPayload>(round_trip(reject).payload).reason == ErrorCode::Busy);

    ControlMessage chunk{};
    chunk.transfer_id = 11;
    chunk.payload = ChunkHeaderPayload{41, 65536, true};
    const auto header = std::get<ChunkHeaderPayload>(round_trip(chunk).payload);
    assert(header.sequence == 41 && header.payload_length == 65536 && header.is_final);

    ControlMessage ack{};
    ack.transfer_id = 12;
    ack.payload = AckPayload{40};
    assert(std::get<AckPayload>(round_trip(ack).payload).sequence == 40);

    ControlMessage complete{};
    complete.transfer_id = 13;
    complete.payload = CompletePayload{123456789};
    assert(std::get<CompletePayload>(round_trip(complete).payload).bytes == 123456789);

    ControlMessage abort_message{};
    abort_message.transfer_id = 14;
    abort_message.payload = AbortPayload{ErrorCode::ChecksumMismatch};
    assert(std::get<AbortPayload>(round_trip(abort_message).payload).reason == ErrorCode::ChecksumMismatch);
}

void test_control_rejections() {
    const auto bytes = encode(make_offer());
    ErrorCode error = ErrorCode::Cancelled;

    auto wrong_version = bytes;
    wrong_version[0] = 0x7F;
    assert(!decode(wrong_version, &error));
    assert(error == ErrorCode::UnsupportedVersion);

    for (std::size_t length = 1; length < bytes.size(); length += 7) {
        error = ErrorCode::Cancelled;
        const std::vector<std::uint8_t> cut(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(length));
        assert(!decode(cut, &error));
        assert(error == ErrorCode::MalformedFrame);
    }

    error = ErrorCode::Cancelled;
    auto trailing = bytes;
    trailing.push_back(0xFF);
    assert(!decode(trailing, &error));
    assert(error == ErrorCode::MalformedFrame);

    error = ErrorCode::Cancelled;
    auto unknown_type = bytes;
    unknown_type[1] = 0x42;
    assert(!decode(unknown_type, &error));
    assert(error == ErrorCode::MalformedFrame);

    // Checksum length must match the algorithm.
    auto mismatched = make_offer();
    std::get<OfferPayload>(mismatched.payload).checksum_algorithm = crypto::ChecksumAlgorithm::Crc32;
    error = ErrorCode::Cancelled;
    assert(!decode(encode(mismatched), &error));
    assert(error == ErrorCode::MalformedFrame);

    auto zero_chunk = make_offer();
    std::get<OfferPayload>(zero_chunk.payload).chunk_size = 0;
    assert(!decode(encode(zero_chunk)));

    auto empty_name = make_offer();
    std::get<OfferPayload>(empty_name.payload).file_name.clear();
    assert(!decode(encode(empty_name)));

    ControlMessage chunk{};
    chunk.payload = ChunkHeaderPayload{0, 10, false};
    auto bad_flag = encode(chunk);
    bad_flag.back() = 2;
    assert(!decode(bad_flag));

    ControlMessage reject{};
    reject.payload = RejectPayload{ErrorCode::Declined};
    auto bad_reason = encode(reject);
    bad_reason.back() = 0xEE;
    assert(!decode(bad_reason));
}

void test_utf8() {
    assert(is_valid_utf8("plain"));
    assert(is_valid_utf8("\xE2\x82\xAC"));
    assert(!is_valid_utf8("\xC3"));
    assert(!is_valid_utf8("\xFF"));
    assert(truncate_utf8("\xE2\x82\xAC\xE2\x82\xAC", 4) == "\xE2\x82\xAC");
}

}  // namespace

int main() {
    lanshare::log::StructuredLogger::instance().set_enabled(false);

    test_announcement();
    test_control_messages();
    test_control_rejections();
    test_utf8();
    return 0;
}
