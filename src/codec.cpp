#include <collab-text/codec.hpp>

#include "encoding/compression.hpp"
#include "log.hpp"
#include "wire/frame.hpp"
#include "wire/reader.hpp"
#include "wire/writer.hpp"

namespace collab_text {

auto encode_patch(const Patch& patch) -> std::vector<std::byte> {
    auto writer = wire::Writer{};
    writer.write_patch(patch);
    auto body = writer.take();

    auto output = std::vector<std::byte>{};
    if (body.size() >= encoding::deflate_threshold) {
        if (auto compressed = encoding::deflate_compress(body)) {
            auto deflated = wire::Writer{};
            deflated.write_uleb128(body.size());
            deflated.write_bytes(*compressed);
            if (deflated.data().size() < body.size()) {
                wire::write_frame(wire::FrameType::deflated, deflated.data(), output);
                return output;
            }
        }
    }
    wire::write_frame(wire::FrameType::plain, body, output);
    return output;
}

auto decode_patch(std::span<const std::byte> data) -> std::optional<Patch> {
    auto header = wire::parse_frame_header(data);
    if (!header) {
        detail::logger().debug("patch frame rejected: bad header");
        return std::nullopt;
    }
    if (!wire::validate_frame_checksum(*header, data)) {
        detail::logger().debug("patch frame rejected: checksum mismatch");
        return std::nullopt;
    }

    auto body = wire::frame_body(*header, data);
    auto inflated = std::vector<std::byte>{};
    if (header->type == wire::FrameType::deflated) {
        auto reader = wire::Reader{body};
        auto size = reader.read_uleb128();
        if (!size) return std::nullopt;
        auto rest = body.subspan(reader.pos());
        auto decompressed = encoding::deflate_decompress(rest, static_cast<std::size_t>(*size));
        if (!decompressed) {
            detail::logger().debug("patch frame rejected: inflate failed");
            return std::nullopt;
        }
        inflated = std::move(*decompressed);
        body = inflated;
    }

    auto reader = wire::Reader{body};
    auto patch = reader.read_patch();
    if (!patch || !reader.at_end()) {
        detail::logger().debug("patch frame rejected: malformed body");
        return std::nullopt;
    }
    return patch;
}

}  // namespace collab_text
