/// @file text_field.hpp
/// @brief TextField -- the collaborative text field operations.

#pragma once

#include <collab-text/change.hpp>
#include <collab-text/id_allocator.hpp>
#include <collab-text/metadata.hpp>
#include <collab-text/patch.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace collab_text {

/// A replicated text field.
///
/// TextField itself is stateless apart from its options: the field's state
/// is a value (`std::string`) plus its Metadata, both owned by the caller
/// and passed to every operation. Local edits go through apply_update(),
/// which returns the new value, the user-facing change and the patch to
/// broadcast. Patches from other replicas go through apply_patch().
///
/// Applying the same set of patches at every replica, in any order and
/// with any duplication of whole patches, converges every replica to the
/// same value and identifiers.
///
/// @code
/// auto field = TextField{};
/// auto value = field.create_value();
/// auto meta = field.create_metadata();
/// auto result = field.apply_update({
///     .previous = value, .update = {Splice{0, 0, "abc"}},
///     .metadata = meta, .version = 1, .store_id = 7});
/// // result.value == "abc", result.patch is sent to the other replicas
/// @endcode
class TextField {
public:
    /// Options for constructing a text field.
    struct Options {
        std::string description;      ///< Human-readable description.
        AllocationPolicy allocation;  ///< Identifier allocation tuning.
    };

    /// Arguments to apply_update().
    struct UpdateArgs {
        std::string_view previous;   ///< The current value.
        SpliceList update;           ///< Splices, applied in order.
        Metadata& metadata;          ///< The field metadata, updated in place.
        std::uint64_t version;       ///< The local replica version.
        std::uint32_t store_id;      ///< The local store id.
    };

    /// Result of apply_update().
    struct UpdateResult {
        std::string value;  ///< The new value.
        Change change;      ///< One part per splice.
        Patch patch;        ///< One part per splice.
    };

    /// Arguments to apply_patch().
    struct PatchArgs {
        std::string_view previous;  ///< The current value.
        const Patch& patch;         ///< The patch received from a replica.
        Metadata& metadata;         ///< The field metadata, updated in place.
    };

    /// Result of apply_patch().
    struct PatchResult {
        std::string value;  ///< The new value.
        Change change;      ///< The net visible effect of the patch.
    };

    TextField() = default;
    explicit TextField(Options options);

    auto description() const noexcept -> const std::string& { return options_.description; }
    auto options() const noexcept -> const Options& { return options_; }

    /// The discriminated field type name, always "text".
    static constexpr auto type() noexcept -> std::string_view { return "text"; }

    /// The initial value: an empty string.
    auto create_value() const -> std::string { return {}; }

    /// The initial metadata: no identifiers, empty cemetery.
    auto create_metadata() const -> Metadata { return {}; }

    /// Apply local splices. Either every splice is applied or the
    /// metadata is left untouched.
    /// @throws std::logic_error if the metadata length does not match
    ///   `previous` (checked before anything is modified).
    /// @throws std::invalid_argument if the metadata ids are not strictly
    ///   increasing around an edit.
    auto apply_update(const UpdateArgs& args) const -> UpdateResult;

    /// Apply a patch produced by any replica, including this one.
    /// Total over all patches: unknown removed identifiers are tombstoned,
    /// already-present inserted identifiers are skipped.
    /// @throws std::logic_error if the metadata length does not match
    ///   `previous` (checked before anything is modified).
    auto apply_patch(const PatchArgs& args) const -> PatchResult;

    /// Concatenate two sequential changes.
    auto merge_change(const Change& first, const Change& second) const -> Change {
        return collab_text::merge_change(first, second);
    }

    /// Concatenate two sequential patches.
    auto merge_patch(const Patch& first, const Patch& second) const -> Patch {
        return collab_text::merge_patch(first, second);
    }

private:
    Options options_;
};

}  // namespace collab_text
