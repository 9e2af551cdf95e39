#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <magic_enum.hpp>

#include "../prelude/span.hpp"
#include "../prelude/traits.hpp"

namespace sl::contract {

enum class SlotNamespace : uint8_t {
    buffer,
    vertex_attribute,
    texture,
};

// Slot numbers are the enumerator values of a generation's slot enums.
template <traits::Enum E>
constexpr auto slot_for(E role) -> uint32_t {
    return static_cast<uint32_t>(role);
}

struct SlotEntry final {
    SlotNamespace space = SlotNamespace::buffer;
    std::string role;
    uint32_t slot = 0;
};

struct SlotIssue final {
    SlotNamespace space = SlotNamespace::buffer;
    uint32_t slot = 0;
    std::string description;
};

// Documents that `slot` changes role between two generations on purpose.
struct SlotMigrationNote final {
    SlotNamespace space = SlotNamespace::buffer;
    uint32_t slot = 0;
    std::string_view from_role;
    std::string_view to_role;
    std::string_view note;
};

struct SlotTable final {
    template <traits::Enum BufferIndex, traits::Enum VertexAttribute, traits::Enum TextureIndex>
    static auto from_enums(std::string_view generation) -> SlotTable {
        SlotTable table{};
        table.generation = std::string{generation};
        table.append<BufferIndex>(SlotNamespace::buffer);
        table.append<VertexAttribute>(SlotNamespace::vertex_attribute);
        table.append<TextureIndex>(SlotNamespace::texture);
        return table;
    }

    // Reports every slot number used by more than one role inside one namespace.
    auto validate() const -> std::vector<SlotIssue>;

    auto find(SlotNamespace space, std::string_view role) const -> std::optional<uint32_t>;
    auto role_at(SlotNamespace space, uint32_t slot) const -> SlotEntry const*;
    auto entries_in(SlotNamespace space) const -> std::vector<SlotEntry>;

    std::string generation;
    std::vector<SlotEntry> entries;

private:
    template <traits::Enum E>
    auto append(SlotNamespace space) -> void {
        for (auto [value, name] : magic_enum::enum_entries<E>()) {
            entries.push_back(SlotEntry{.space = space, .role = std::string{name}, .slot = slot_for(value)});
        }
    }
};

// Every slot of `to` that `from` used for a different role must be covered by a note,
// otherwise an already-compiled consumer of `from` would silently read the wrong resource.
auto check_slot_migration(
    SlotTable const& from, SlotTable const& to, Span<SlotMigrationNote const> notes
) -> std::vector<SlotIssue>;

}
