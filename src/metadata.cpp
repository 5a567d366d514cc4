#include <collab-text/metadata.hpp>

#include <string>

namespace collab_text {

auto validate(std::string_view value, const Metadata& metadata) -> std::optional<Error> {
    if (metadata.ids.size() != value.size()) {
        return Error{ErrorKind::invalid_metadata,
                     "ids length " + std::to_string(metadata.ids.size()) +
                     " does not match value length " + std::to_string(value.size())};
    }
    for (std::size_t i = 0; i < metadata.ids.size(); ++i) {
        if (!metadata.ids[i].is_well_formed()) {
            return Error{ErrorKind::invalid_identifier,
                         "malformed identifier at index " + std::to_string(i)};
        }
        if (i > 0 && !(metadata.ids[i - 1] < metadata.ids[i])) {
            return Error{ErrorKind::invalid_metadata,
                         "ids are not strictly increasing at index " + std::to_string(i)};
        }
    }
    return std::nullopt;
}

}  // namespace collab_text
