// Fuzz target for decode_patch() — exercises the frame, inflate and body
// readers. Any decoded patch is re-encoded and decoded again to verify
// consistency.

#include <collab-text/codec.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto patch = collab_text::decode_patch(span);
    if (patch) {
        auto again = collab_text::decode_patch(collab_text::encode_patch(*patch));
        if (!again || *again != *patch) std::abort();
    }
    return 0;
}
