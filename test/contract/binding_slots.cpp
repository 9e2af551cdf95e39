#include <gtest/gtest.h>

#include <set>

#include <magic_enum.hpp>

#include <shaderlink/contract/contracts.hpp>
#include <shaderlink/contract/generations/multi_light.hpp>
#include <shaderlink/contract/generations/pbr_hybrid.hpp>
#include <shaderlink/contract/generations/ray_traced.hpp>

namespace sl::contract {

TEST(BindingSlots, SlotsAreUniqueInsideEachNamespace) {
    for (auto generation : magic_enum::enum_values<Generation>()) {
        auto const& table = slot_table(generation);
        EXPECT_TRUE(table.validate().empty()) << table.generation;
        for (auto space : magic_enum::enum_values<SlotNamespace>()) {
            std::set<uint32_t> slots{};
            for (auto const& entry : table.entries_in(space)) {
                EXPECT_TRUE(slots.insert(entry.slot).second) << table.generation << " " << entry.role;
            }
        }
    }
}

TEST(BindingSlots, NamespacesAreIndependent) {
    auto const& table = slot_table(Generation::forward);
    EXPECT_EQ(table.find(SlotNamespace::buffer, "mesh_vertices"), 0u);
    EXPECT_EQ(table.find(SlotNamespace::vertex_attribute, "position"), 0u);
    EXPECT_EQ(table.find(SlotNamespace::texture, "base_color"), 0u);
    EXPECT_FALSE(table.find(SlotNamespace::texture, "mesh_vertices").has_value());
}

TEST(BindingSlots, LookupsAreStable) {
    auto const& first = slot_table(Generation::pbr_hybrid);
    auto const& second = slot_table(Generation::pbr_hybrid);
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.find(SlotNamespace::buffer, "rt_instances"), slot_for(pbr_hybrid::BufferIndex::rt_instances));
    EXPECT_EQ(slot_for(multi_light::BufferIndex::rt_dir_lights), 8u);
    EXPECT_EQ(slot_for(ray_traced::BufferIndex::rt_frame), 3u);
}

TEST(BindingSlots, DuplicateSlotIsReported) {
    SlotTable table{};
    table.generation = "broken";
    table.entries = {
        SlotEntry{.space = SlotNamespace::buffer, .role = "a", .slot = 0},
        SlotEntry{.space = SlotNamespace::buffer, .role = "b", .slot = 0},
        SlotEntry{.space = SlotNamespace::texture, .role = "c", .slot = 0},
    };
    auto issues = table.validate();
    ASSERT_EQ(issues.size(), 1);
    EXPECT_EQ(issues[0].space, SlotNamespace::buffer);
    EXPECT_EQ(issues[0].slot, 0u);
}

TEST(BindingSlots, AppendOnlyGenerationsNeedNoNotes) {
    EXPECT_TRUE(check_slot_migration(slot_table(Generation::forward), slot_table(Generation::shadowed), {}).empty());
    EXPECT_TRUE(check_slot_migration(slot_table(Generation::shadowed), slot_table(Generation::ray_traced), {}).empty());
    EXPECT_TRUE(check_slot_migration(slot_table(Generation::multi_light), slot_table(Generation::pbr_hybrid), {}).empty());
}

TEST(BindingSlots, RenumberingWithoutNotesIsReported) {
    auto issues = check_slot_migration(slot_table(Generation::ray_traced), slot_table(Generation::multi_light), {});
    EXPECT_EQ(issues.size(), 9);

    auto notes = migration_notes(Generation::multi_light);
    EXPECT_TRUE(check_slot_migration(slot_table(Generation::ray_traced), slot_table(Generation::multi_light), notes).empty());
}

TEST(BindingSlots, FixedTexturesStayOutsideMaterialTable) {
    for (auto generation : {Generation::multi_light, Generation::pbr_hybrid}) {
        auto const& table = slot_table(generation);
        auto table_start = table.find(SlotNamespace::texture, "material_textures");
        ASSERT_TRUE(table_start.has_value()) << table.generation;
        auto table_end = table_start.value() + material_texture_table_size;
        for (auto const& entry : table.entries_in(SlotNamespace::texture)) {
            if (entry.role == "material_textures") { continue; }
            EXPECT_TRUE(entry.slot < table_start.value() || entry.slot >= table_end)
                << table.generation << " " << entry.role << " at " << entry.slot;
        }
    }
    EXPECT_EQ(slot_for(pbr_hybrid::TextureIndex::material_textures), 4u);
    EXPECT_EQ(slot_for(pbr_hybrid::TextureIndex::shadow_map), 36u);
    EXPECT_EQ(slot_for(pbr_hybrid::TextureIndex::environment), 37u);
}

TEST(BindingSlots, PartialNotesLeaveTheRestReported) {
    std::vector<SlotMigrationNote> notes{
        SlotMigrationNote{SlotNamespace::buffer, 2, "light_params", "rt_frame", "removed"},
    };
    auto issues = check_slot_migration(
        slot_table(Generation::ray_traced), slot_table(Generation::multi_light), Span<SlotMigrationNote const>{notes}
    );
    EXPECT_EQ(issues.size(), 8);
    for (auto const& issue : issues) {
        EXPECT_FALSE(issue.space == SlotNamespace::buffer && issue.slot == 2);
    }
}

TEST(BindingSlots, RegistryIsConsistent) {
    EXPECT_TRUE(verify_registry());
}

}
