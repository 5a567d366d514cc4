#include <collab-text/identifier.hpp>

#include <optional>
#include <string>
#include <utility>

namespace collab_text {

namespace {

auto read_be(const std::string& bytes, std::size_t offset, std::size_t width) -> std::uint64_t {
    auto value = std::uint64_t{0};
    for (std::size_t i = 0; i < width; ++i) {
        value <<= 8;
        if (offset + i < bytes.size()) {
            value |= static_cast<unsigned char>(bytes[offset + i]);
        }
    }
    return value;
}

void write_be(std::string& out, std::uint64_t value, std::size_t width) {
    for (std::size_t i = width; i-- > 0;) {
        out.push_back(static_cast<char>((value >> (i * 8)) & 0xFF));
    }
}

auto hex_nibble(char c) -> std::optional<unsigned> {
    if (c >= '0' && c <= '9') return static_cast<unsigned>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<unsigned>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<unsigned>(c - 'A' + 10);
    return std::nullopt;
}

}  // namespace

auto Identifier::triplet(std::size_t level) const noexcept -> Triplet {
    const auto base = level * Triplet::size;
    if (base >= bytes_.size()) return Triplet{};
    return Triplet{
        .path = read_be(bytes_, base, 6),
        .version = read_be(bytes_, base + 6, 6),
        .store = static_cast<std::uint32_t>(read_be(bytes_, base + 12, 4)),
        .sequence = static_cast<std::uint32_t>(read_be(bytes_, base + 16, 4)),
    };
}

void Identifier::push_back(const Triplet& t) {
    bytes_.reserve(bytes_.size() + Triplet::size);
    write_be(bytes_, t.path & Triplet::max_path, 6);
    write_be(bytes_, t.version & Triplet::max_version, 6);
    write_be(bytes_, t.store, 4);
    write_be(bytes_, t.sequence, 4);
}

auto Identifier::to_hex() const -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(bytes_.size() * 2);
    for (auto c : bytes_) {
        auto b = static_cast<unsigned char>(c);
        result.push_back(hex_chars[b >> 4]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

auto Identifier::from_hex(std::string_view hex) -> std::optional<Identifier> {
    if (hex.size() % 2 != 0) return std::nullopt;
    auto bytes = std::string{};
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        auto hi = hex_nibble(hex[i]);
        auto lo = hex_nibble(hex[i + 1]);
        if (!hi || !lo) return std::nullopt;
        bytes.push_back(static_cast<char>((*hi << 4) | *lo));
    }
    return Identifier{std::move(bytes)};
}

}  // namespace collab_text
