/// @file patch.hpp
/// @brief Replica-facing edit types, expressed in identifier space.

#pragma once

#include <collab-text/identifier.hpp>

#include <string>
#include <vector>

namespace collab_text {

/// One step of a replica-facing diff.
///
/// Positions are carried by identifiers only, so a patch part means the
/// same thing at every replica regardless of local character offsets.
/// `removed_ids[i]` names the character `removed_text[i]`, and likewise
/// for the inserted pair.
struct PatchPart {
    std::vector<Identifier> removed_ids;   ///< Identifiers of removed characters.
    std::string removed_text;              ///< The removed characters.
    std::vector<Identifier> inserted_ids;  ///< Identifiers of inserted characters.
    std::string inserted_text;             ///< The inserted characters.

    auto operator==(const PatchPart&) const -> bool = default;
};

/// An ordered list of patch parts; the unit exchanged between replicas.
using Patch = std::vector<PatchPart>;

/// Concatenate two sequential patches into one, preserving order.
inline auto merge_patch(const Patch& first, const Patch& second) -> Patch {
    auto result = Patch{};
    result.reserve(first.size() + second.size());
    result.insert(result.end(), first.begin(), first.end());
    result.insert(result.end(), second.begin(), second.end());
    return result;
}

}  // namespace collab_text
