/// @file metadata.hpp
/// @brief Per-field replicated bookkeeping: identifiers and cemetery.

#pragma once

#include <collab-text/cemetery.hpp>
#include <collab-text/error.hpp>
#include <collab-text/identifier.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace collab_text {

/// Replicated state of one text field, mutated in place by the appliers.
///
/// Invariants, for the value the metadata belongs to:
/// - `ids.size() == value.size()`, `ids[i]` naming `value[i]`;
/// - `ids` is strictly increasing.
/// The cemetery never holds a zero count (Cemetery erases such entries).
struct Metadata {
    std::vector<Identifier> ids;  ///< One identifier per character, in order.
    Cemetery cemetery;            ///< Removes still waiting for their insert.

    auto operator==(const Metadata&) const -> bool = default;
};

/// Check the metadata invariants against a value.
/// @return The first violated invariant, or nullopt if all hold.
auto validate(std::string_view value, const Metadata& metadata) -> std::optional<Error>;

}  // namespace collab_text
