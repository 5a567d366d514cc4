#include <collab-text/replica.hpp>

#include <utility>

namespace collab_text {

Replica::Replica(std::uint32_t store_id, TextField::Options options)
    : field_{std::move(options)},
      store_id_{store_id},
      value_{field_.create_value()},
      metadata_{field_.create_metadata()} {}

auto Replica::splice(std::int64_t index, std::int64_t remove, std::string_view text)
    -> TextField::UpdateResult {
    return splice(std::vector<Splice>{Splice{.index = index, .remove = remove, .text = std::string{text}}});
}

auto Replica::splice(std::vector<Splice> splices) -> TextField::UpdateResult {
    auto result = field_.apply_update({
        .previous = value_,
        .update = std::move(splices),
        .metadata = metadata_,
        .version = version_ + 1,
        .store_id = store_id_,
    });
    ++version_;
    value_ = result.value;
    return result;
}

auto Replica::apply_patch(const Patch& patch) -> Change {
    auto result = field_.apply_patch({
        .previous = value_,
        .patch = patch,
        .metadata = metadata_,
    });
    value_ = std::move(result.value);
    return std::move(result.change);
}

auto Replica::fork(std::uint32_t store_id) const -> Replica {
    auto copy = *this;
    copy.store_id_ = store_id;
    return copy;
}

}  // namespace collab_text
