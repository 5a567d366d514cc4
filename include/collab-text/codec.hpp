/// @file codec.hpp
/// @brief Compact binary encoding of patches.

#pragma once

#include <collab-text/patch.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace collab_text {

/// Encode a patch as a checksummed binary frame.
///
/// Bodies of 256 bytes or more are stored raw-DEFLATE compressed when that
/// makes the frame smaller.
auto encode_patch(const Patch& patch) -> std::vector<std::byte>;

/// Decode a frame produced by encode_patch().
/// @return The patch, or nullopt if the data is truncated, fails the
///   checksum, does not decompress, or holds a malformed patch.
auto decode_patch(std::span<const std::byte> data) -> std::optional<Patch>;

}  // namespace collab_text
