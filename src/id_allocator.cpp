#include <collab-text/id_allocator.hpp>

#include <algorithm>
#include <stdexcept>

namespace collab_text {

namespace {

// splitmix64 finalizer
auto mix(std::uint64_t z) noexcept -> std::uint64_t {
    z += 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

}  // namespace

IdAllocator::IdAllocator(AllocationPolicy policy, std::uint64_t version, std::uint32_t store_id)
    : policy_{policy}, version_{version & Triplet::max_version}, store_id_{store_id} {
    if (policy_.boundary < 2) {
        throw std::invalid_argument{"allocation boundary must be at least 2"};
    }
}

auto IdAllocator::next_step(std::uint64_t room) noexcept -> std::uint64_t {
    const auto bound = std::min(room, policy_.boundary);
    const auto seed = mix(version_) ^ ((std::uint64_t{store_id_} << 32) | sequence_);
    return 1 + mix(seed) % bound;
}

auto IdAllocator::allocate_between(const Identifier* lower, const Identifier* upper) -> Identifier {
    if (lower && upper && *lower >= *upper) {
        throw std::invalid_argument{"identifier bounds are not ordered"};
    }

    auto result = Identifier{};
    auto bounded = upper != nullptr;

    for (std::size_t level = 0;; ++level) {
        const auto lo = lower ? lower->triplet(level) : Triplet{};
        auto hi_path = Triplet::max_path + 1;

        if (bounded) {
            // Still sharing a prefix with the upper bound.
            if (level >= upper->levels()) {
                throw std::invalid_argument{"identifier bounds are not ordered"};
            }
            const auto hi = upper->triplet(level);
            if (lo == hi) {
                result.push_back(lo);
                continue;
            }
            if (lo > hi) {
                throw std::invalid_argument{"identifier bounds are not ordered"};
            }
            hi_path = hi.path;
        }

        if (hi_path - lo.path > 1) {
            const auto room = hi_path - lo.path - 1;
            result.push_back(Triplet{
                .path = lo.path + next_step(room),
                .version = version_,
                .store = store_id_,
                .sequence = sequence_,
            });
            ++sequence_;
            return result;
        }

        // No free path at this level: follow the lower bound. The result
        // now sorts below the upper bound whatever comes next.
        result.push_back(lo);
        bounded = false;
    }
}

auto IdAllocator::allocate(const Identifier* lower, const Identifier* upper, std::size_t count)
    -> std::vector<Identifier> {
    auto ids = std::vector<Identifier>{};
    ids.reserve(count);
    const auto* previous = lower;
    for (std::size_t i = 0; i < count; ++i) {
        ids.push_back(allocate_between(previous, upper));
        previous = &ids.back();  // stable: capacity reserved above
    }
    return ids;
}

}  // namespace collab_text
