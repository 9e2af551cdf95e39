#include <shaderlink/contract/binding_slots.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <utility>

#include <fmt/format.h>

namespace sl::contract {

auto SlotTable::validate() const -> std::vector<SlotIssue> {
    std::vector<SlotIssue> issues{};
    std::map<std::pair<SlotNamespace, uint32_t>, std::string_view> used{};
    for (auto const& entry : entries) {
        auto [it, inserted] = used.try_emplace({entry.space, entry.slot}, entry.role);
        if (!inserted) {
            issues.push_back(SlotIssue{
                .space = entry.space,
                .slot = entry.slot,
                .description = fmt::format(
                    "{} slot {} of generation '{}' is used by both '{}' and '{}'",
                    magic_enum::enum_name(entry.space), entry.slot, generation, it->second, entry.role
                ),
            });
        }
    }
    return issues;
}

auto SlotTable::find(SlotNamespace space, std::string_view role) const -> std::optional<uint32_t> {
    auto it = std::find_if(entries.begin(), entries.end(), [space, role](SlotEntry const& entry) {
        return entry.space == space && entry.role == role;
    });
    if (it == entries.end()) { return std::nullopt; }
    return it->slot;
}

auto SlotTable::role_at(SlotNamespace space, uint32_t slot) const -> SlotEntry const* {
    auto it = std::find_if(entries.begin(), entries.end(), [space, slot](SlotEntry const& entry) {
        return entry.space == space && entry.slot == slot;
    });
    return it == entries.end() ? nullptr : &*it;
}

auto SlotTable::entries_in(SlotNamespace space) const -> std::vector<SlotEntry> {
    std::vector<SlotEntry> result{};
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(result), [space](SlotEntry const& entry) {
        return entry.space == space;
    });
    return result;
}

auto check_slot_migration(
    SlotTable const& from, SlotTable const& to, Span<SlotMigrationNote const> notes
) -> std::vector<SlotIssue> {
    std::vector<SlotIssue> issues{};
    for (auto const& entry : to.entries) {
        auto previous = from.role_at(entry.space, entry.slot);
        if (!previous || previous->role == entry.role) { continue; }

        auto noted = std::any_of(notes.begin(), notes.end(), [&entry, previous](SlotMigrationNote const& note) {
            return note.space == entry.space && note.slot == entry.slot
                && note.from_role == previous->role && note.to_role == entry.role;
        });
        if (!noted) {
            issues.push_back(SlotIssue{
                .space = entry.space,
                .slot = entry.slot,
                .description = fmt::format(
                    "{} slot {} is '{}' in '{}' but '{}' in '{}' without a migration note",
                    magic_enum::enum_name(entry.space), entry.slot,
                    previous->role, from.generation, entry.role, to.generation
                ),
            });
        }
    }
    return issues;
}

}
