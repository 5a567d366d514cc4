// json_test.cpp — Tests for nlohmann/json interoperability

#include <collab-text/json.hpp>
#include <collab-text/replica.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace ct = collab_text;
using json = nlohmann::json;

namespace {

auto id_at(std::uint64_t path) -> ct::Identifier {
    auto id = ct::Identifier{};
    id.push_back(ct::Triplet{.path = path, .version = 2, .store = 3, .sequence = 4});
    return id;
}

}  // namespace

// =============================================================================
// Identifier
// =============================================================================

TEST(JsonIdentifier, renders_as_hex_string) {
    json j = id_at(1);
    ASSERT_TRUE(j.is_string());
    EXPECT_EQ(j.get<std::string>(), id_at(1).to_hex());
    EXPECT_EQ(j.get<std::string>().size(), 40u);
}

TEST(JsonIdentifier, parses_back) {
    json j = id_at(77);
    EXPECT_EQ(j.get<ct::Identifier>(), id_at(77));
}

TEST(JsonIdentifier, rejects_bad_hex) {
    EXPECT_THROW(json("zz").get<ct::Identifier>(), std::runtime_error);
    EXPECT_THROW(json("").get<ct::Identifier>(), std::runtime_error);
    // Valid hex, but not a whole number of triplets.
    EXPECT_THROW(json("abcd").get<ct::Identifier>(), std::runtime_error);
}

// =============================================================================
// Splice and ChangePart
// =============================================================================

TEST(JsonSplice, uses_field_names) {
    json j = ct::Splice{.index = -1, .remove = 2, .text = "xy"};
    EXPECT_EQ(j["index"], -1);
    EXPECT_EQ(j["remove"], 2);
    EXPECT_EQ(j["text"], "xy");
}

TEST(JsonSplice, missing_fields_default) {
    auto s = json::parse(R"({"text": "abc"})").get<ct::Splice>();
    EXPECT_EQ(s, (ct::Splice{.index = 0, .remove = 0, .text = "abc"}));
}

TEST(JsonChange, round_trip) {
    const auto change = ct::Change{{.index = 3, .removed = "b", .inserted = "de"}};
    json j = change;
    EXPECT_EQ(j[0]["index"], 3);
    EXPECT_EQ(j[0]["removed"], "b");
    EXPECT_EQ(j[0]["inserted"], "de");
    EXPECT_EQ(j.get<ct::Change>(), change);
}

TEST(JsonChange, requires_all_fields) {
    EXPECT_THROW(json::parse(R"({"index": 0, "removed": ""})").get<ct::ChangePart>(),
                 json::out_of_range);
}

// =============================================================================
// PatchPart
// =============================================================================

TEST(JsonPatch, uses_camel_case_keys) {
    json j = ct::PatchPart{
        .removed_ids = {id_at(1)},
        .removed_text = "a",
        .inserted_ids = {id_at(2), id_at(3)},
        .inserted_text = "bc",
    };
    ASSERT_TRUE(j.contains("removedIds"));
    ASSERT_TRUE(j.contains("removedText"));
    ASSERT_TRUE(j.contains("insertedIds"));
    ASSERT_TRUE(j.contains("insertedText"));
    EXPECT_EQ(j["insertedIds"].size(), 2u);
    EXPECT_EQ(j["removedIds"][0], id_at(1).to_hex());
}

TEST(JsonPatch, rejects_mismatched_counts) {
    auto j = json{
        {"removedIds", json::array()},
        {"removedText", ""},
        {"insertedIds", json::array({id_at(1).to_hex()})},
        {"insertedText", "ab"},
    };
    EXPECT_THROW(j.get<ct::PatchPart>(), std::runtime_error);
}

TEST(JsonPatch, text_round_trip_then_apply) {
    auto alice = ct::Replica{1};
    auto created = alice.splice(0, 0, "hello");
    auto update = alice.splice(1, 3, "ipp");

    auto wire = json(update.patch).dump();
    auto patch = json::parse(wire).get<ct::Patch>();
    EXPECT_EQ(patch, update.patch);

    auto bob = ct::Replica{2};
    bob.apply_patch(json::parse(json(created.patch).dump()).get<ct::Patch>());
    bob.apply_patch(patch);
    EXPECT_EQ(bob.text(), "hippo");
    EXPECT_EQ(bob.metadata(), alice.metadata());
}

// =============================================================================
// Metadata
// =============================================================================

TEST(JsonMetadata, shape) {
    auto meta = ct::Metadata{.ids = {id_at(1), id_at(2)}, .cemetery = {}};
    meta.cemetery.set(id_at(9), 2);

    json j = meta;
    EXPECT_EQ(j["ids"].size(), 2u);
    ASSERT_TRUE(j["cemetery"].is_object());
    EXPECT_EQ(j["cemetery"][id_at(9).to_hex()], 2);
}

TEST(JsonMetadata, round_trip) {
    auto meta = ct::Metadata{.ids = {id_at(1), id_at(2)}, .cemetery = {}};
    meta.cemetery.bury(id_at(5));
    meta.cemetery.bury(id_at(5));
    meta.cemetery.bury(id_at(6));

    auto back = json::parse(json(meta).dump()).get<ct::Metadata>();
    EXPECT_EQ(back, meta);
}

TEST(JsonMetadata, empty) {
    json j = ct::Metadata{};
    EXPECT_EQ(j, json::parse(R"({"ids": [], "cemetery": {}})"));
}

TEST(JsonMetadata, rejects_invalid_cemetery_counts) {
    const auto key = id_at(9).to_hex();
    for (const auto* count : {"-1", "0", "2.7", "4294967296", "\"3\"", "true"}) {
        auto text = std::string{R"({"ids": [], "cemetery": {")"} + key + "\": " + count + "}}";
        EXPECT_THROW(json::parse(text).get<ct::Metadata>(), std::runtime_error) << count;
    }
}

TEST(JsonMetadata, accepts_cemetery_count_bounds) {
    const auto key = id_at(9).to_hex();
    auto low = json{{"ids", json::array()}, {"cemetery", {{key, 1}}}}.get<ct::Metadata>();
    EXPECT_EQ(low.cemetery.count(id_at(9)), 1u);

    auto text = std::string{R"({"ids": [], "cemetery": {")"} + key + "\": 4294967295}}";
    auto high = json::parse(text).get<ct::Metadata>();
    EXPECT_EQ(high.cemetery.count(id_at(9)), 4294967295u);
}
