#include <collab-text/text_field.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace collab_text;

namespace {

struct Site {
    std::string value;
    Metadata meta;
};

auto update(const TextField& field, Site& site, Splice splice, std::uint64_t version,
            std::uint32_t store_id = 1) -> TextField::UpdateResult {
    auto result = field.apply_update({
        .previous = site.value,
        .update = {std::move(splice)},
        .metadata = site.meta,
        .version = version,
        .store_id = store_id,
    });
    site.value = result.value;
    return result;
}

auto patch(const TextField& field, Site& site, const Patch& p) -> TextField::PatchResult {
    auto result = field.apply_patch({.previous = site.value, .patch = p, .metadata = site.meta});
    site.value = result.value;
    return result;
}

}  // namespace

// -- Basics -------------------------------------------------------------------

TEST(TextFieldPatch, applies_insert_to_fresh_replica) {
    const auto field = TextField{};
    auto source = Site{};
    auto created = update(field, source, {.index = 0, .remove = 0, .text = "abc"}, 1);

    auto target = Site{};
    auto result = patch(field, target, created.patch);
    EXPECT_EQ(result.value, "abc");
    ASSERT_EQ(result.change.size(), 1u);
    EXPECT_EQ(result.change[0], (ChangePart{.index = 0, .removed = "", .inserted = "abc"}));
    EXPECT_EQ(target.meta, source.meta);
}

TEST(TextFieldPatch, applies_remove) {
    const auto field = TextField{};
    auto source = Site{};
    auto created = update(field, source, {.index = 0, .remove = 0, .text = "abcde"}, 1);
    auto removed = update(field, source, {.index = 1, .remove = 3, .text = ""}, 2);

    auto target = Site{};
    patch(field, target, created.patch);
    auto result = patch(field, target, removed.patch);
    EXPECT_EQ(target.value, "ae");
    ASSERT_EQ(result.change.size(), 1u);
    EXPECT_EQ(result.change[0], (ChangePart{.index = 1, .removed = "bcd", .inserted = ""}));
    EXPECT_TRUE(target.meta.cemetery.empty());
}

TEST(TextFieldPatch, empty_patch_is_noop) {
    const auto field = TextField{};
    auto site = Site{};
    auto result = patch(field, site, Patch{});
    EXPECT_EQ(result.value, "");
    EXPECT_TRUE(result.change.empty());
}

TEST(TextFieldPatch, rejects_mismatched_metadata) {
    const auto field = TextField{};
    auto meta = Metadata{};
    const auto p = Patch{};
    EXPECT_THROW(field.apply_patch({.previous = "xy", .patch = p, .metadata = meta}),
                 std::logic_error);
}

// -- Ordering -----------------------------------------------------------------

TEST(TextFieldPatch, allows_out_of_order_patches) {
    const auto field = TextField{};
    auto source = Site{};
    auto first = update(field, source, {.index = 0, .remove = 0, .text = "agc"}, 1);
    auto second = update(field, source, {.index = 1, .remove = 1, .text = "b"}, 2);
    auto third = update(field, source, {.index = 3, .remove = 0, .text = "def"}, 3);
    ASSERT_EQ(source.value, "abcdef");

    auto target = Site{};
    auto r1 = patch(field, target, third.patch);
    ASSERT_EQ(r1.change.size(), 1u);
    EXPECT_EQ(r1.change[0], (ChangePart{.index = 0, .removed = "", .inserted = "def"}));

    auto r2 = patch(field, target, second.patch);
    ASSERT_EQ(r2.change.size(), 1u);
    EXPECT_EQ(r2.change[0], (ChangePart{.index = 0, .removed = "", .inserted = "b"}));
    EXPECT_EQ(target.meta.cemetery.size(), 1u);

    auto r3 = patch(field, target, first.patch);
    ASSERT_EQ(r3.change.size(), 2u);
    EXPECT_EQ(r3.change[0], (ChangePart{.index = 1, .removed = "", .inserted = "c"}));
    EXPECT_EQ(r3.change[1], (ChangePart{.index = 0, .removed = "", .inserted = "a"}));
    EXPECT_EQ(target.value, "abcdef");
    EXPECT_EQ(target.meta, source.meta);
}

TEST(TextFieldPatch, allows_racing_patches) {
    const auto field = TextField{};
    const auto letters = std::string{"abcdefghijk"};
    auto source = Site{};
    auto patches = std::vector<Patch>{};
    for (std::size_t i = 0; i < letters.size(); ++i) {
        auto result = update(field, source,
                             {.index = static_cast<std::int64_t>(i), .remove = 0,
                              .text = letters.substr(i, 1)},
                             i);
        patches.push_back(std::move(result.patch));
    }
    ASSERT_EQ(source.value, letters);

    auto rng = std::mt19937{20190601};
    for (int round = 0; round < 10; ++round) {
        std::ranges::shuffle(patches, rng);
        auto target = Site{};
        for (const auto& p : patches) patch(field, target, p);
        EXPECT_EQ(target.value, letters) << "round " << round;
        EXPECT_EQ(target.meta.ids, source.meta.ids) << "round " << round;
    }
}

TEST(TextFieldPatch, sorts_unordered_inserted_ids) {
    const auto field = TextField{};
    auto source = Site{};
    auto created = update(field, source, {.index = 0, .remove = 0, .text = "abc"}, 1);
    const auto& ids = created.patch[0].inserted_ids;

    const auto scrambled = Patch{PatchPart{
        .removed_ids = {},
        .removed_text = {},
        .inserted_ids = {ids[2], ids[0], ids[1]},
        .inserted_text = "cab",
    }};
    auto target = Site{};
    auto result = patch(field, target, scrambled);
    EXPECT_EQ(target.value, "abc");
    ASSERT_EQ(result.change.size(), 1u);
    EXPECT_EQ(result.change[0].inserted, "abc");
}

// -- Cemetery -----------------------------------------------------------------

TEST(TextFieldPatch, remove_before_insert_is_tombstoned) {
    const auto field = TextField{};
    auto source = Site{};
    auto created = update(field, source, {.index = 0, .remove = 0, .text = "abc"}, 1);
    auto removed = update(field, source, {.index = 1, .remove = 1, .text = ""}, 2);
    const auto& b = created.patch[0].inserted_ids[1];

    auto target = Site{};
    auto r1 = patch(field, target, removed.patch);
    EXPECT_EQ(target.value, "");
    EXPECT_TRUE(r1.change.empty());
    EXPECT_EQ(target.meta.cemetery.count(b), 1u);

    auto r2 = patch(field, target, created.patch);
    EXPECT_EQ(target.value, "ac");
    EXPECT_EQ(target.meta.cemetery.count(b), 0u);
    EXPECT_TRUE(target.meta.cemetery.empty());
    ASSERT_EQ(r2.change.size(), 1u);
    EXPECT_EQ(r2.change[0], (ChangePart{.index = 0, .removed = "", .inserted = "ac"}));
}

TEST(TextFieldPatch, handles_concurrently_deleted_values) {
    const auto field = TextField{};
    auto origin = Site{};
    auto common = update(field, origin, {.index = 0, .remove = 0, .text = "abcd"}, 1);
    const auto& b = common.patch[0].inserted_ids[1];

    auto a = Site{};
    patch(field, a, common.patch);
    auto update_a = update(field, a, {.index = 1, .remove = 2, .text = ""}, 2, 2);
    EXPECT_EQ(a.value, "ad");

    auto bsite = Site{};
    patch(field, bsite, common.patch);
    auto update_b = update(field, bsite, {.index = 0, .remove = 2, .text = ""}, 2, 3);
    EXPECT_EQ(bsite.value, "cd");

    patch(field, bsite, update_a.patch);
    EXPECT_EQ(bsite.value, "d");
    patch(field, a, update_b.patch);
    EXPECT_EQ(a.value, "d");

    auto c = Site{};
    patch(field, c, update_b.patch);
    patch(field, c, update_a.patch);
    patch(field, c, common.patch);
    EXPECT_EQ(c.value, "d");

    EXPECT_EQ(a.meta, bsite.meta);
    EXPECT_EQ(a.meta, c.meta);
    EXPECT_EQ(c.meta.cemetery.count(b), 1u);
    EXPECT_EQ(c.meta.cemetery.size(), 1u);
}

TEST(TextFieldPatch, duplicate_remove_is_counted) {
    const auto field = TextField{};
    auto source = Site{};
    auto created = update(field, source, {.index = 0, .remove = 0, .text = "x"}, 1);
    auto removed = update(field, source, {.index = 0, .remove = 1, .text = ""}, 2);
    const auto& x = created.patch[0].inserted_ids[0];

    auto target = Site{};
    patch(field, target, removed.patch);
    patch(field, target, removed.patch);
    EXPECT_EQ(target.meta.cemetery.count(x), 2u);

    patch(field, target, created.patch);
    EXPECT_EQ(target.value, "");
    EXPECT_EQ(target.meta.cemetery.count(x), 1u);
}

// -- Idempotence --------------------------------------------------------------

TEST(TextFieldPatch, duplicate_insert_is_noop) {
    const auto field = TextField{};
    auto source = Site{};
    auto created = update(field, source, {.index = 0, .remove = 0, .text = "abc"}, 1);

    auto target = Site{};
    patch(field, target, created.patch);
    const auto before = target.meta;
    auto again = patch(field, target, created.patch);
    EXPECT_EQ(target.value, "abc");
    EXPECT_TRUE(again.change.empty());
    EXPECT_EQ(target.meta, before);
}

TEST(TextFieldPatch, echo_of_own_insert_is_noop) {
    const auto field = TextField{};
    auto site = Site{};
    auto created = update(field, site, {.index = 0, .remove = 0, .text = "hi"}, 1);
    auto echo = patch(field, site, created.patch);
    EXPECT_EQ(site.value, "hi");
    EXPECT_TRUE(echo.change.empty());
    EXPECT_TRUE(site.meta.cemetery.empty());
}

TEST(TextFieldPatch, partially_present_insert_adds_the_rest) {
    const auto field = TextField{};
    auto source = Site{};
    auto created = update(field, source, {.index = 0, .remove = 0, .text = "abc"}, 1);
    const auto& part = created.patch[0];

    auto target = Site{};
    patch(field, target, Patch{PatchPart{.removed_ids = {},
                                         .removed_text = {},
                                         .inserted_ids = {part.inserted_ids[1]},
                                         .inserted_text = "b"}});
    auto result = patch(field, target, created.patch);
    EXPECT_EQ(target.value, "abc");
    ASSERT_EQ(result.change.size(), 2u);
    EXPECT_EQ(result.change[0], (ChangePart{.index = 1, .removed = "", .inserted = "c"}));
    EXPECT_EQ(result.change[1], (ChangePart{.index = 0, .removed = "", .inserted = "a"}));
}

// -- Malformed parts ----------------------------------------------------------

TEST(TextFieldPatch, ignores_ids_without_characters) {
    const auto field = TextField{};
    auto source = Site{};
    auto created = update(field, source, {.index = 0, .remove = 0, .text = "abc"}, 1);

    auto short_text = created.patch;
    short_text[0].inserted_text = "ab";
    auto target = Site{};
    patch(field, target, short_text);
    EXPECT_EQ(target.value, "ab");
    EXPECT_FALSE(validate(target.value, target.meta).has_value());
}
