#pragma once

// Binary search plus run coalescing over a strictly increasing identifier
// sequence. Shared by the removal and insertion phases of the remote
// applier; knows nothing about text, changes or patches.
// Internal header — not installed.

#include <collab-text/identifier.hpp>

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <span>
#include <vector>

namespace collab_text::detail {

// A run of `count` consecutive entries of `ids` starting at `index`.
struct RemovalChunk {
    std::size_t index;
    std::size_t count;

    auto operator==(const RemovalChunk&) const -> bool = default;
};

struct RemovalSearch {
    std::vector<RemovalChunk> chunks;  // ascending, non-overlapping
    std::vector<std::size_t> missing;  // positions into targets not found in ids
};

// Candidates that all belong in the gap before ids[index] (or at the end
// when index == ids.size()). Members are positions into the candidate
// span, in identifier order.
struct InsertionChunk {
    std::size_t index;
    std::vector<std::size_t> members;

    auto operator==(const InsertionChunk&) const -> bool = default;
};

struct InsertionSearch {
    std::vector<InsertionChunk> chunks;  // ascending by index
    std::vector<std::size_t> present;    // positions already in ids, or repeated
};

// Position of `id` in `ids`, or ids.size() when absent.
inline auto find_position(std::span<const Identifier> ids, const Identifier& id) -> std::size_t {
    auto it = std::ranges::lower_bound(ids, id);
    if (it != ids.end() && *it == id) {
        return static_cast<std::size_t>(it - ids.begin());
    }
    return ids.size();
}

// Locate each target in ids and merge the hits into contiguous runs.
// Targets may come in any order and may repeat.
inline auto find_removal_chunks(std::span<const Identifier> ids,
                                std::span<const Identifier> targets) -> RemovalSearch {
    auto result = RemovalSearch{};
    auto hits = std::vector<std::size_t>{};
    hits.reserve(targets.size());

    for (std::size_t i = 0; i < targets.size(); ++i) {
        auto pos = find_position(ids, targets[i]);
        if (pos == ids.size()) {
            result.missing.push_back(i);
        } else {
            hits.push_back(pos);
        }
    }

    std::ranges::sort(hits);
    auto [first, last] = std::ranges::unique(hits);
    hits.erase(first, last);

    for (auto pos : hits) {
        if (!result.chunks.empty()) {
            auto& back = result.chunks.back();
            if (back.index + back.count == pos) {
                ++back.count;
                continue;
            }
        }
        result.chunks.push_back(RemovalChunk{.index = pos, .count = 1});
    }
    return result;
}

// Find the insertion slot of each candidate not yet in ids. Candidates
// sharing a slot are grouped; since no existing id lies between them they
// form one contiguous run once inserted.
inline auto find_insertion_chunks(std::span<const Identifier> ids,
                                  std::span<const Identifier> candidates) -> InsertionSearch {
    auto result = InsertionSearch{};

    auto order = std::vector<std::size_t>(candidates.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
        return candidates[a] < candidates[b];
    });

    const Identifier* previous = nullptr;
    for (auto member : order) {
        const auto& id = candidates[member];
        if (previous && *previous == id) {
            result.present.push_back(member);
            continue;
        }
        previous = &id;

        auto it = std::ranges::lower_bound(ids, id);
        if (it != ids.end() && *it == id) {
            result.present.push_back(member);
            continue;
        }

        auto slot = static_cast<std::size_t>(it - ids.begin());
        if (!result.chunks.empty() && result.chunks.back().index == slot) {
            result.chunks.back().members.push_back(member);
        } else {
            result.chunks.push_back(InsertionChunk{.index = slot, .members = {member}});
        }
    }
    return result;
}

}  // namespace collab_text::detail
