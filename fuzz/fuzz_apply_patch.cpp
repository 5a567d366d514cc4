// Fuzz target for TextField::apply_patch() — any patch that decodes must
// apply without breaking the metadata invariants, and a second delivery
// of an insert-only patch must change nothing.

#include <collab-text/codec.hpp>
#include <collab-text/replica.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto patch = collab_text::decode_patch(span);
    if (!patch) return 0;

    auto replica = collab_text::Replica{1};
    replica.splice(0, 0, "fuzz");
    replica.apply_patch(*patch);
    if (collab_text::validate(replica.text(), replica.metadata())) std::abort();

    const auto insert_only = std::ranges::all_of(*patch, [](const auto& part) {
        return part.removed_ids.empty();
    });
    if (insert_only && replica.metadata().cemetery.empty()) {
        const auto before = replica.text();
        if (!replica.apply_patch(*patch).empty() || replica.text() != before) std::abort();
    }

    // Local edits must keep working on whatever the patch produced.
    replica.splice(static_cast<std::int64_t>(replica.size() / 2), 1, "ab");
    if (collab_text::validate(replica.text(), replica.metadata())) std::abort();
    return 0;
}
