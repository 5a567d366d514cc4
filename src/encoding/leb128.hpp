#pragma once

// Unsigned LEB128 (Little Endian Base 128) variable-length integers.
// Every count and length in the binary patch format is a ULEB128.
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace collab_text::encoding {

// Longest valid encoding of a uint64: ceil(64 / 7) bytes.
inline constexpr std::size_t max_uleb128_size = 10;

// Encode a uint64 as unsigned LEB128, appending bytes to output.
inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) {
            byte |= std::byte{0x80};  // more bytes follow
        }
        output.push_back(byte);
    } while (value != 0);
}

inline auto encode_uleb128(std::uint64_t value) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    encode_uleb128(value, result);
    return result;
}

// Number of bytes encode_uleb128 writes for a value.
constexpr auto uleb128_size(std::uint64_t value) noexcept -> std::size_t {
    auto n = std::size_t{1};
    while (value >>= 7) ++n;
    return n;
}

struct DecodeResult {
    std::uint64_t value;
    std::size_t bytes_read;
};

// Decode an unsigned LEB128 value from the front of a byte span.
// Returns nullopt on truncation or when the value overflows 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    auto value = std::uint64_t{0};
    auto shift = 0u;

    for (std::size_t i = 0; i < input.size() && i < max_uleb128_size; ++i) {
        const auto bits = static_cast<std::uint64_t>(input[i] & std::byte{0x7F});
        if (shift == 63 && bits > 1) return std::nullopt;  // overflow
        value |= bits << shift;
        shift += 7;

        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            return DecodeResult{.value = value, .bytes_read = i + 1};
        }
    }

    return std::nullopt;
}

}  // namespace collab_text::encoding
