/// @file identifier.hpp
/// @brief Identifier: the permanent, totally ordered position of a character.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace collab_text {

/// One level of an identifier path.
///
/// Serialized as 20 big-endian bytes: path (6), version (6), store (4),
/// sequence (4). Byte order of the serialized form equals the tuple order
/// of the fields.
struct Triplet {
    static constexpr std::size_t size = 20;           ///< Serialized size in bytes.
    static constexpr std::uint64_t max_path = 0xFFFF'FFFF'FFFFULL;
    static constexpr std::uint64_t max_version = 0xFFFF'FFFF'FFFFULL;

    std::uint64_t path{0};      ///< Position within the level (48 bits).
    std::uint64_t version{0};   ///< Version of the allocating replica (48 bits).
    std::uint32_t store{0};     ///< Store id of the allocating replica.
    std::uint32_t sequence{0};  ///< Allocation counter within one update.

    auto operator<=>(const Triplet&) const = default;
    auto operator==(const Triplet&) const -> bool = default;
};

/// An immutable, totally ordered position token assigned to one character.
///
/// An Identifier is a sequence of Triplets stored as raw bytes. Two
/// identifiers compare by unsigned lexicographic byte comparison, so a
/// proper prefix sorts before its extensions. Identifiers are dense:
/// between any two distinct identifiers another one can be allocated
/// (see IdAllocator).
class Identifier {
public:
    /// The empty identifier. Never allocated; sorts before everything.
    Identifier() = default;

    /// Construct from raw serialized bytes.
    explicit Identifier(std::string bytes) : bytes_{std::move(bytes)} {}

    /// Number of triplet levels (a trailing partial level counts as one).
    auto levels() const noexcept -> std::size_t {
        return (bytes_.size() + Triplet::size - 1) / Triplet::size;
    }

    /// Decode the triplet at a level. Levels past the end, and missing
    /// trailing bytes of a partial level, read as zero.
    auto triplet(std::size_t level) const noexcept -> Triplet;

    /// Append a triplet as a new deepest level.
    void push_back(const Triplet& t);

    auto bytes() const noexcept -> const std::string& { return bytes_; }
    auto empty() const noexcept -> bool { return bytes_.empty(); }

    /// True if the byte length is a positive multiple of Triplet::size.
    auto is_well_formed() const noexcept -> bool {
        return !bytes_.empty() && bytes_.size() % Triplet::size == 0;
    }

    /// Lowercase hex rendering. Preserves order under string comparison.
    auto to_hex() const -> std::string;

    /// Parse the output of to_hex(). Returns nullopt on odd length or a
    /// non-hex character.
    static auto from_hex(std::string_view hex) -> std::optional<Identifier>;

    auto operator<=>(const Identifier& other) const noexcept -> std::strong_ordering {
        // std::char_traits<char>::compare orders as unsigned char.
        return bytes_.compare(other.bytes_) <=> 0;
    }
    auto operator==(const Identifier&) const -> bool = default;

private:
    std::string bytes_;
};

/// Three-way identifier comparison returning <0, 0 or >0.
inline auto compare(const Identifier& a, const Identifier& b) noexcept -> int {
    return a.bytes().compare(b.bytes());
}

}  // namespace collab_text

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<collab_text::Identifier> {
    auto operator()(const collab_text::Identifier& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.bytes());
    }
};

/// @endcond
