#include <collab-text/text_field.hpp>

#include "chunk_search.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace collab_text {

namespace {

void require_matching_length(std::string_view value, const Metadata& metadata) {
    if (metadata.ids.size() != value.size()) {
        throw std::logic_error{"text field metadata has " + std::to_string(metadata.ids.size()) +
                               " ids for a value of length " + std::to_string(value.size())};
    }
}

// Clamp a possibly negative index into [0, size].
auto clamp_index(std::int64_t index, std::size_t size) -> std::size_t {
    const auto n = static_cast<std::int64_t>(size);
    if (index < 0) index = std::max<std::int64_t>(0, n + index);
    return static_cast<std::size_t>(std::min(index, n));
}

auto clamp_count(std::int64_t count, std::size_t available) -> std::size_t {
    if (count <= 0) return 0;
    return std::min(static_cast<std::size_t>(count), available);
}

auto offset(std::size_t i) -> std::ptrdiff_t { return static_cast<std::ptrdiff_t>(i); }

// Phase A: drop the present removed ids, tombstone the rest.
void apply_removals(const PatchPart& part, std::string& value, Metadata& metadata,
                    Change& change) {
    auto& ids = metadata.ids;
    auto search = detail::find_removal_chunks(ids, part.removed_ids);
    auto& log = detail::logger();
    const auto trace = log.should_log(spdlog::level::debug);

    for (auto i : search.missing) {
        const auto& id = part.removed_ids[i];
        auto count = metadata.cemetery.bury(id);
        if (trace) log.debug("remove of absent id {} buried (count {})", id.to_hex(), count);
    }

    // Highest chunk first so lower chunk indices stay valid.
    for (auto it = search.chunks.rbegin(); it != search.chunks.rend(); ++it) {
        ids.erase(ids.begin() + offset(it->index), ids.begin() + offset(it->index + it->count));
        auto removed = value.substr(it->index, it->count);
        value.erase(it->index, it->count);
        change.push_back(ChangePart{.index = it->index, .removed = std::move(removed), .inserted = {}});
    }
}

// Phase B: consume tombstones, skip duplicates, splice in the rest.
void apply_insertions(const PatchPart& part, std::string& value, Metadata& metadata,
                      Change& change) {
    // An id without a matching character is malformed and ignored.
    const auto n = std::min(part.inserted_ids.size(), part.inserted_text.size());

    auto live_ids = std::vector<Identifier>{};
    auto live_text = std::string{};
    live_ids.reserve(n);
    live_text.reserve(n);
    auto& log = detail::logger();
    const auto trace = log.should_log(spdlog::level::debug);

    for (std::size_t i = 0; i < n; ++i) {
        const auto& id = part.inserted_ids[i];
        if (metadata.cemetery.exhume(id)) {
            if (trace) log.debug("insert of id {} was already removed", id.to_hex());
            continue;
        }
        live_ids.push_back(id);
        live_text.push_back(part.inserted_text[i]);
    }
    if (live_ids.empty()) return;

    auto& ids = metadata.ids;
    auto search = detail::find_insertion_chunks(ids, live_ids);
    if (!search.present.empty()) {
        log.debug("skipped {} already-present inserted ids", search.present.size());
    }

    // Highest slot first so lower slots stay valid.
    for (auto it = search.chunks.rbegin(); it != search.chunks.rend(); ++it) {
        auto chunk_ids = std::vector<Identifier>{};
        auto chunk_text = std::string{};
        chunk_ids.reserve(it->members.size());
        chunk_text.reserve(it->members.size());
        for (auto member : it->members) {
            chunk_ids.push_back(live_ids[member]);
            chunk_text.push_back(live_text[member]);
        }
        ids.insert(ids.begin() + offset(it->index),
                   std::make_move_iterator(chunk_ids.begin()),
                   std::make_move_iterator(chunk_ids.end()));
        value.insert(it->index, chunk_text);
        change.push_back(ChangePart{.index = it->index, .removed = {}, .inserted = std::move(chunk_text)});
    }
}

}  // namespace

TextField::TextField(Options options) : options_{std::move(options)} {}

auto TextField::apply_update(const UpdateArgs& args) const -> UpdateResult {
    require_matching_length(args.previous, args.metadata);

    auto result = UpdateResult{.value = std::string{args.previous}, .change = {}, .patch = {}};
    auto& value = result.value;
    // Committed to the metadata only once every splice has succeeded.
    auto ids = args.metadata.ids;
    auto allocator = IdAllocator{options_.allocation, args.version, args.store_id};

    result.change.reserve(args.update.size());
    result.patch.reserve(args.update.size());

    for (const auto& splice : args.update) {
        const auto index = clamp_index(splice.index, value.size());
        const auto count = clamp_count(splice.remove, value.size() - index);

        // Bounds are taken before removal: new ids sort below the removed
        // ones and can never collide with them.
        const Identifier* lower = index > 0 ? &ids[index - 1] : nullptr;
        const Identifier* upper = index < ids.size() ? &ids[index] : nullptr;
        auto new_ids = allocator.allocate(lower, upper, splice.text.size());

        auto first = ids.begin() + offset(index);
        auto removed_ids = std::vector<Identifier>(std::make_move_iterator(first),
                                                   std::make_move_iterator(first + offset(count)));
        ids.erase(first, first + offset(count));
        ids.insert(ids.begin() + offset(index), new_ids.begin(), new_ids.end());

        auto removed_text = value.substr(index, count);
        value.replace(index, count, splice.text);

        result.change.push_back(ChangePart{
            .index = index,
            .removed = removed_text,
            .inserted = splice.text,
        });
        result.patch.push_back(PatchPart{
            .removed_ids = std::move(removed_ids),
            .removed_text = std::move(removed_text),
            .inserted_ids = std::move(new_ids),
            .inserted_text = splice.text,
        });
    }
    args.metadata.ids = std::move(ids);
    return result;
}

auto TextField::apply_patch(const PatchArgs& args) const -> PatchResult {
    require_matching_length(args.previous, args.metadata);

    auto result = PatchResult{.value = std::string{args.previous}, .change = {}};
    for (const auto& part : args.patch) {
        if (!part.removed_ids.empty()) {
            apply_removals(part, result.value, args.metadata, result.change);
        }
        if (!part.inserted_ids.empty()) {
            apply_insertions(part, result.value, args.metadata, result.change);
        }
    }
    return result;
}

}  // namespace collab_text
