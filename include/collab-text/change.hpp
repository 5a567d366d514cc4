/// @file change.hpp
/// @brief User-facing edit types: Splice (input) and ChangePart (output).

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace collab_text {

/// A local edit: remove `remove` characters at `index`, then insert `text`.
///
/// A negative index counts from the end of the value. Both index and
/// remove are clamped to the current bounds before use, so every splice
/// is valid.
struct Splice {
    std::int64_t index{0};   ///< Position of the edit; negative counts from the end.
    std::int64_t remove{0};  ///< Number of characters to remove.
    std::string text;        ///< Characters to insert.

    auto operator==(const Splice&) const -> bool = default;
};

/// The splices of one local update, applied in order.
///
/// A single Splice converts implicitly, so `.update = Splice{...}` and
/// `.update = {first, second}` both work.
struct SpliceList : std::vector<Splice> {
    using std::vector<Splice>::vector;

    SpliceList() = default;
    SpliceList(std::vector<Splice> splices) : std::vector<Splice>(std::move(splices)) {}
    SpliceList(Splice splice) { push_back(std::move(splice)); }
};

/// One step of a user-visible diff.
///
/// `index` is expressed in the coordinates of the value as it was when
/// this part was applied, i.e. after all earlier parts of the same change.
struct ChangePart {
    std::size_t index{0};  ///< Where the edit happened.
    std::string removed;   ///< Characters removed at index.
    std::string inserted;  ///< Characters inserted at index.

    auto operator==(const ChangePart&) const -> bool = default;
};

/// An ordered list of change parts.
using Change = std::vector<ChangePart>;

/// Concatenate two sequential changes into one, preserving order.
inline auto merge_change(const Change& first, const Change& second) -> Change {
    auto result = Change{};
    result.reserve(first.size() + second.size());
    result.insert(result.end(), first.begin(), first.end());
    result.insert(result.end(), second.begin(), second.end());
    return result;
}

}  // namespace collab_text
