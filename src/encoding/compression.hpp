#pragma once

// zlib helpers for the binary patch format: raw DEFLATE for large bodies
// and CRC-32 for the frame checksum.
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace collab_text::encoding {

// Bodies smaller than this are never compressed.
inline constexpr std::size_t deflate_threshold = 256;

// Decompressed bodies larger than this are rejected.
inline constexpr std::size_t max_inflated_size = std::size_t{64} * 1024 * 1024;

inline auto crc32(std::span<const std::byte> data) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data.data()),
                  static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

// Compress using raw DEFLATE (negative window bits: no zlib header).
inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    if (input.empty()) return std::vector<std::byte>{};

    auto stream = z_stream{};
    if (::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8,
                       Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    auto ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Decompress raw DEFLATE data whose inflated size is known up front. The
// output starts at 4x the input and doubles, never beyond inflated_size.
inline auto deflate_decompress(std::span<const std::byte> input, std::size_t inflated_size)
    -> std::optional<std::vector<std::byte>> {
    if (inflated_size > max_inflated_size) return std::nullopt;
    if (input.empty()) {
        if (inflated_size != 0) return std::nullopt;
        return std::vector<std::byte>{};
    }

    auto output_size = std::min(std::max<std::size_t>(input.size() * 4, 1), inflated_size);
    auto output = std::vector<std::byte>(output_size);

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    if (::inflateInit2(&stream, -15) != Z_OK) return std::nullopt;
    auto ret = ::inflate(&stream, Z_FINISH);

    // Need more space
    while ((ret == Z_BUF_ERROR || ret == Z_OK) && stream.avail_out == 0 &&
           output_size < inflated_size) {
        const auto written = static_cast<std::size_t>(stream.total_out);
        output_size = std::min(output_size * 2, inflated_size);
        output.resize(output_size);
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + written);
        stream.avail_out = static_cast<uInt>(output_size - written);
        ret = ::inflate(&stream, Z_FINISH);
    }

    const auto produced = static_cast<std::size_t>(stream.total_out);
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END || produced != inflated_size) return std::nullopt;
    return output;
}

}  // namespace collab_text::encoding
