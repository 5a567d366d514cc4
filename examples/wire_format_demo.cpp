// wire_format_demo — sending patches as JSON and as binary frames
//
// Demonstrates: nlohmann/json interop, encode_patch / decode_patch,
//               metadata snapshots, log levels

#include <collab-text/collab_text.hpp>
#include <collab-text/json.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace ct = collab_text;
using json = nlohmann::json;

int main() {
    ct::set_log_level(spdlog::level::debug);

    auto writer = ct::Replica{1};
    auto first = writer.splice(0, 0, "abc");
    auto second = writer.splice(1, 1, "XY");

    // JSON: human readable, identifiers as hex strings.
    json j = second.patch;
    std::printf("Patch as JSON:\n%s\n", j.dump(2).c_str());

    // Binary: checksummed frame, compressed when large.
    auto small = ct::encode_patch(first.patch);
    auto big = ct::encode_patch(writer.splice(0, 0, std::string(1000, '.')).patch);
    std::printf("\nBinary frame sizes: %zu bytes (3 chars), %zu bytes (1000 chars)\n",
                small.size(), big.size());

    // A reader rebuilds the text from frames delivered out of order.
    auto reader = ct::Replica{2};
    for (const auto* frame : {&big, &small}) {
        if (auto patch = ct::decode_patch(*frame)) {
            reader.apply_patch(*patch);
        }
    }
    reader.apply_patch(json::parse(j.dump()).get<ct::Patch>());
    std::printf("Reader text length %zu, matches writer: %s\n", reader.size(),
                reader.text() == writer.text() ? "yes" : "no");

    // A corrupted frame is rejected, not half-applied.
    auto corrupt = small;
    corrupt.back() ^= std::byte{0xFF};
    std::printf("Corrupted frame decodes: %s\n", ct::decode_patch(corrupt) ? "yes" : "no");

    // Metadata snapshot.
    json meta = reader.metadata();
    std::printf("\nReader metadata: %zu ids, cemetery %s\n", meta["ids"].size(),
                meta["cemetery"].dump().c_str());
    return 0;
}
