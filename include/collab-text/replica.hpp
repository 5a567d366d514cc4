/// @file replica.hpp
/// @brief Replica -- one site's copy of a text field.

#pragma once

#include <collab-text/change.hpp>
#include <collab-text/metadata.hpp>
#include <collab-text/patch.hpp>
#include <collab-text/text_field.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace collab_text {

/// A single site's copy of a collaborative text field.
///
/// Replica owns the value and its metadata together, so both are only
/// ever changed by the field operations and always stay in step. Each
/// local splice bumps the replica version before allocating identifiers,
/// which keeps the (version, store id) salt of every update unique.
///
/// Replica is not thread-safe; callers serialize access.
///
/// @code
/// auto alice = Replica{1};
/// auto bob = Replica{2};
/// auto update = alice.splice(0, 0, "hello");
/// bob.apply_patch(update.patch);
/// // bob.text() == "hello"
/// @endcode
class Replica {
public:
    /// Construct an empty replica for a store id.
    explicit Replica(std::uint32_t store_id, TextField::Options options = {});

    // -- Identity -------------------------------------------------------------

    auto store_id() const noexcept -> std::uint32_t { return store_id_; }

    /// The version used by the most recent local update (0 before any).
    auto version() const noexcept -> std::uint64_t { return version_; }

    auto field() const noexcept -> const TextField& { return field_; }

    // -- Reading --------------------------------------------------------------

    auto text() const noexcept -> const std::string& { return value_; }
    auto metadata() const noexcept -> const Metadata& { return metadata_; }
    auto size() const noexcept -> std::size_t { return value_.size(); }

    // -- Mutation -------------------------------------------------------------

    /// Apply one local splice.
    auto splice(std::int64_t index, std::int64_t remove, std::string_view text)
        -> TextField::UpdateResult;

    /// Apply several local splices as one update (one version).
    auto splice(std::vector<Splice> splices) -> TextField::UpdateResult;

    /// Apply a patch from another replica (or an echo of our own).
    /// @return The net visible change.
    auto apply_patch(const Patch& patch) -> Change;

    /// Copy this replica's state under a new store id. The copy starts at
    /// this replica's version.
    auto fork(std::uint32_t store_id) const -> Replica;

private:
    TextField field_;
    std::uint32_t store_id_;
    std::uint64_t version_{0};
    std::string value_;
    Metadata metadata_;
};

}  // namespace collab_text
