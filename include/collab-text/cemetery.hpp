/// @file cemetery.hpp
/// @brief Tombstone counts for identifiers removed before they were inserted.

#pragma once

#include <collab-text/identifier.hpp>

#include <cstddef>
#include <cstdint>
#include <map>

namespace collab_text {

/// A counted set of tombstoned identifiers.
///
/// When a remove arrives for an identifier that is not present locally,
/// the identifier's count is incremented. A later insert of that
/// identifier consumes one count instead of inserting the character.
/// Entries are erased as soon as their count drops to zero, so the
/// cemetery only holds removes still waiting for their insert.
class Cemetery {
public:
    using map_type = std::map<Identifier, std::uint32_t>;

    /// The tombstone count for an identifier (0 when absent).
    auto count(const Identifier& id) const -> std::uint32_t {
        auto it = entries_.find(id);
        return it != entries_.end() ? it->second : 0;
    }

    auto contains(const Identifier& id) const -> bool { return entries_.contains(id); }

    /// Record one more remove of an identifier. Returns the new count.
    auto bury(const Identifier& id) -> std::uint32_t {
        return ++entries_[id];
    }

    /// Consume one tombstone. Returns false (and changes nothing) when the
    /// identifier has no tombstone.
    auto exhume(const Identifier& id) -> bool {
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        if (--it->second == 0) {
            entries_.erase(it);
        }
        return true;
    }

    /// Set a count directly; zero erases the entry.
    void set(const Identifier& id, std::uint32_t count) {
        if (count == 0) {
            entries_.erase(id);
        } else {
            entries_[id] = count;
        }
    }

    auto size() const noexcept -> std::size_t { return entries_.size(); }
    auto empty() const noexcept -> bool { return entries_.empty(); }
    void clear() noexcept { entries_.clear(); }

    /// Sum of all counts.
    auto total() const -> std::uint64_t {
        auto sum = std::uint64_t{0};
        for (const auto& [id, n] : entries_) sum += n;
        return sum;
    }

    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }
    auto entries() const noexcept -> const map_type& { return entries_; }

    auto operator==(const Cemetery&) const -> bool = default;

private:
    map_type entries_;
};

}  // namespace collab_text
