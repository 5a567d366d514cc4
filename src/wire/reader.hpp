#pragma once

// Byte stream reader for the binary patch format. Every read returns
// nullopt instead of running past the end of the input.
// Internal header — not installed.

#include <collab-text/identifier.hpp>
#include <collab-text/patch.hpp>
#include "../encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace collab_text::wire {

class Reader {
public:
    explicit Reader(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_u32_be() -> std::optional<std::uint32_t> {
        auto value = std::uint32_t{0};
        for (int i = 0; i < 4; ++i) {
            auto b = read_u8();
            if (!b) return std::nullopt;
            value = (value << 8) | *b;
        }
        return value;
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    // A count of items that each take at least one byte; bounded by the
    // remaining input so corrupt counts cannot trigger huge allocations.
    auto read_count() -> std::optional<std::size_t> {
        auto n = read_uleb128();
        if (!n || *n > remaining()) return std::nullopt;
        return static_cast<std::size_t>(*n);
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_count();
        if (!len) return std::nullopt;
        auto bytes = read_bytes(*len);
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_identifier() -> std::optional<Identifier> {
        auto bytes = read_string();
        if (!bytes) return std::nullopt;
        auto id = Identifier{std::move(*bytes)};
        if (!id.is_well_formed()) return std::nullopt;
        return id;
    }

    auto read_identifiers() -> std::optional<std::vector<Identifier>> {
        auto n = read_count();
        if (!n) return std::nullopt;
        auto ids = std::vector<Identifier>{};
        ids.reserve(*n);
        for (std::size_t i = 0; i < *n; ++i) {
            auto id = read_identifier();
            if (!id) return std::nullopt;
            ids.push_back(std::move(*id));
        }
        return ids;
    }

    auto read_patch_part() -> std::optional<PatchPart> {
        auto removed_ids = read_identifiers();
        if (!removed_ids) return std::nullopt;
        auto removed_text = read_string();
        if (!removed_text || removed_text->size() != removed_ids->size()) return std::nullopt;
        auto inserted_ids = read_identifiers();
        if (!inserted_ids) return std::nullopt;
        auto inserted_text = read_string();
        if (!inserted_text || inserted_text->size() != inserted_ids->size()) return std::nullopt;
        return PatchPart{
            .removed_ids = std::move(*removed_ids),
            .removed_text = std::move(*removed_text),
            .inserted_ids = std::move(*inserted_ids),
            .inserted_text = std::move(*inserted_text),
        };
    }

    auto read_patch() -> std::optional<Patch> {
        auto n = read_count();
        if (!n) return std::nullopt;
        auto patch = Patch{};
        patch.reserve(*n);
        for (std::size_t i = 0; i < *n; ++i) {
            auto part = read_patch_part();
            if (!part) return std::nullopt;
            patch.push_back(std::move(*part));
        }
        return patch;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace collab_text::wire
