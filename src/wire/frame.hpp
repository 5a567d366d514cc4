#pragma once

// Frame envelope of the binary patch format:
//   magic (4 bytes: 'C' 'T' 'X' 'P')
//   checksum (4 bytes: CRC-32 of body, big-endian)
//   frame type (1 byte)
//   body length (ULEB128)
//   body (body length bytes)
//
// Internal header — not installed.

#include "../encoding/compression.hpp"
#include "../encoding/leb128.hpp"
#include "reader.hpp"
#include "writer.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace collab_text::wire {

inline constexpr std::array<std::byte, 4> frame_magic = {
    std::byte{'C'}, std::byte{'T'}, std::byte{'X'}, std::byte{'P'}
};

enum class FrameType : std::uint8_t {
    plain    = 0x00,  // body is the encoded patch
    deflated = 0x01,  // body is ULEB128(inflated size) + raw DEFLATE data
};

struct FrameHeader {
    FrameType type;
    std::uint32_t checksum;
    std::size_t body_offset;  // offset into data where the body starts
    std::size_t body_length;
};

// Parse and bounds-check a frame header. Does not verify the checksum.
inline auto parse_frame_header(std::span<const std::byte> data) -> std::optional<FrameHeader> {
    auto reader = Reader{data};

    auto magic = reader.read_bytes(frame_magic.size());
    if (!magic || !std::equal(magic->begin(), magic->end(), frame_magic.begin())) {
        return std::nullopt;
    }

    auto checksum = reader.read_u32_be();
    if (!checksum) return std::nullopt;

    auto type = reader.read_u8();
    if (!type || *type > static_cast<std::uint8_t>(FrameType::deflated)) return std::nullopt;

    auto length = reader.read_uleb128();
    if (!length || *length > reader.remaining()) return std::nullopt;

    return FrameHeader{
        .type = static_cast<FrameType>(*type),
        .checksum = *checksum,
        .body_offset = reader.pos(),
        .body_length = static_cast<std::size_t>(*length),
    };
}

inline auto frame_body(const FrameHeader& header, std::span<const std::byte> data)
    -> std::span<const std::byte> {
    return data.subspan(header.body_offset, header.body_length);
}

inline auto validate_frame_checksum(const FrameHeader& header,
                                    std::span<const std::byte> data) -> bool {
    return encoding::crc32(frame_body(header, data)) == header.checksum;
}

// Write a complete frame: magic + checksum + type + ULEB128(length) + body.
inline void write_frame(FrameType type, std::span<const std::byte> body,
                        std::vector<std::byte>& output) {
    auto writer = Writer{};
    writer.write_bytes(frame_magic);
    writer.write_u32_be(encoding::crc32(body));
    writer.write_u8(static_cast<std::uint8_t>(type));
    writer.write_uleb128(body.size());
    writer.write_bytes(body);
    const auto& bytes = writer.data();
    output.insert(output.end(), bytes.begin(), bytes.end());
}

}  // namespace collab_text::wire
