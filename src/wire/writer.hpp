#pragma once

// Byte stream writer for the binary patch format.
// Internal header — not installed.

#include <collab-text/identifier.hpp>
#include <collab-text/patch.hpp>
#include "../encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace collab_text::wire {

class Writer {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_u32_be(std::uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            write_u8(static_cast<std::uint8_t>((v >> shift) & 0xFF));
        }
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    // Length-prefixed raw bytes.
    void write_string(std::string_view s) {
        write_uleb128(s.size());
        for (auto c : s) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    void write_identifier(const Identifier& id) {
        write_string(id.bytes());
    }

    void write_identifiers(const std::vector<Identifier>& ids) {
        write_uleb128(ids.size());
        for (const auto& id : ids) write_identifier(id);
    }

    void write_patch_part(const PatchPart& part) {
        write_identifiers(part.removed_ids);
        write_string(part.removed_text);
        write_identifiers(part.inserted_ids);
        write_string(part.inserted_text);
    }

    void write_patch(const Patch& patch) {
        write_uleb128(patch.size());
        for (const auto& part : patch) write_patch_part(part);
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace collab_text::wire
