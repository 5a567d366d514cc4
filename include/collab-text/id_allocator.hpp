/// @file id_allocator.hpp
/// @brief Dense identifier allocation between two bounds.

#pragma once

#include <collab-text/identifier.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace collab_text {

/// Tuning for identifier allocation.
struct AllocationPolicy {
    /// Largest path step taken from the lower bound when a level has room.
    /// Smaller values keep identifiers short under sequential typing at the
    /// cost of more frequent level growth. Must be at least 2.
    std::uint64_t boundary{1024};

    auto operator==(const AllocationPolicy&) const -> bool = default;
};

/// Allocates identifiers for one local update.
///
/// Every identifier produced by one allocator ends in a fresh triplet
/// carrying (version, store, sequence), where sequence counts the
/// allocations made by this instance. As long as a store never reuses a
/// version, no two allocations anywhere produce the same identifier.
/// Path choices are deterministic in (version, store, sequence).
///
/// @code
/// auto alloc = IdAllocator{AllocationPolicy{}, version, store_id};
/// auto ids = alloc.allocate(lower, upper, 3);  // lower < ids[0] < ids[1] < ids[2] < upper
/// @endcode
class IdAllocator {
public:
    /// @throws std::invalid_argument if policy.boundary < 2.
    IdAllocator(AllocationPolicy policy, std::uint64_t version, std::uint32_t store_id);

    /// Allocate one identifier strictly between the bounds.
    /// @param lower Exclusive lower bound, or nullptr for the start.
    /// @param upper Exclusive upper bound, or nullptr for the end.
    /// @throws std::invalid_argument if lower >= upper.
    auto allocate_between(const Identifier* lower, const Identifier* upper) -> Identifier;

    /// Allocate `count` strictly increasing identifiers between the bounds.
    auto allocate(const Identifier* lower, const Identifier* upper, std::size_t count)
        -> std::vector<Identifier>;

    auto version() const noexcept -> std::uint64_t { return version_; }
    auto store_id() const noexcept -> std::uint32_t { return store_id_; }

    /// Number of identifiers allocated so far.
    auto allocated() const noexcept -> std::uint32_t { return sequence_; }

private:
    auto next_step(std::uint64_t room) noexcept -> std::uint64_t;

    AllocationPolicy policy_;
    std::uint64_t version_;
    std::uint32_t store_id_;
    std::uint32_t sequence_{0};
};

}  // namespace collab_text
