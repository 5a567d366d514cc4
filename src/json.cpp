#include <collab-text/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace collab_text {

namespace {

auto parse_identifier(const std::string& hex) -> Identifier {
    auto id = Identifier::from_hex(hex);
    if (!id || !id->is_well_formed()) {
        throw std::runtime_error{"invalid identifier: \"" + hex + "\""};
    }
    return std::move(*id);
}

auto parse_count(const nlohmann::json& j) -> std::uint32_t {
    if (j.is_number_unsigned()) {
        const auto n = j.get<std::uint64_t>();
        if (n >= 1 && n <= std::numeric_limits<std::uint32_t>::max()) {
            return static_cast<std::uint32_t>(n);
        }
    } else if (j.is_number_integer()) {
        const auto n = j.get<std::int64_t>();
        if (n >= 1 && n <= std::int64_t{std::numeric_limits<std::uint32_t>::max()}) {
            return static_cast<std::uint32_t>(n);
        }
    }
    throw std::runtime_error{"invalid cemetery count: " + j.dump()};
}

}  // namespace

// -- Identity -----------------------------------------------------------------

void to_json(nlohmann::json& j, const Identifier& id) {
    j = id.to_hex();
}

void from_json(const nlohmann::json& j, Identifier& id) {
    id = parse_identifier(j.get<std::string>());
}

// -- Edits --------------------------------------------------------------------

void to_json(nlohmann::json& j, const Splice& s) {
    j = nlohmann::json{{"index", s.index}, {"remove", s.remove}, {"text", s.text}};
}

void from_json(const nlohmann::json& j, Splice& s) {
    s.index = j.value("index", std::int64_t{0});
    s.remove = j.value("remove", std::int64_t{0});
    s.text = j.value("text", std::string{});
}

void to_json(nlohmann::json& j, const ChangePart& c) {
    j = nlohmann::json{{"index", c.index}, {"removed", c.removed}, {"inserted", c.inserted}};
}

void from_json(const nlohmann::json& j, ChangePart& c) {
    j.at("index").get_to(c.index);
    j.at("removed").get_to(c.removed);
    j.at("inserted").get_to(c.inserted);
}

void to_json(nlohmann::json& j, const PatchPart& p) {
    j = nlohmann::json{
        {"removedIds", p.removed_ids},
        {"removedText", p.removed_text},
        {"insertedIds", p.inserted_ids},
        {"insertedText", p.inserted_text},
    };
}

void from_json(const nlohmann::json& j, PatchPart& p) {
    j.at("removedIds").get_to(p.removed_ids);
    j.at("removedText").get_to(p.removed_text);
    j.at("insertedIds").get_to(p.inserted_ids);
    j.at("insertedText").get_to(p.inserted_text);
    if (p.removed_ids.size() != p.removed_text.size() ||
        p.inserted_ids.size() != p.inserted_text.size()) {
        throw std::runtime_error{"patch part id count does not match text length"};
    }
}

// -- State --------------------------------------------------------------------

void to_json(nlohmann::json& j, const Metadata& m) {
    auto cemetery = nlohmann::json::object();
    for (const auto& [id, count] : m.cemetery) {
        cemetery[id.to_hex()] = count;
    }
    j = nlohmann::json{{"ids", m.ids}, {"cemetery", std::move(cemetery)}};
}

void from_json(const nlohmann::json& j, Metadata& m) {
    j.at("ids").get_to(m.ids);
    m.cemetery.clear();
    for (const auto& entry : j.at("cemetery").items()) {
        m.cemetery.set(parse_identifier(entry.key()), parse_count(entry.value()));
    }
}

}  // namespace collab_text
