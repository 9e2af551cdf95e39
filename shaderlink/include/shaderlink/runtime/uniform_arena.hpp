#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <fmt/format.h>

#include "capacity.hpp"
#include "frame_ring.hpp"
#include "../prelude/expected.hpp"
#include "../prelude/math.hpp"
#include "../prelude/span.hpp"

namespace sl::rt {

// Per-draw records of every ring slot in one buffer. Each record starts on a 256-byte
// boundary so it can be bound as a constant buffer view at its offset.
template <typename T>
struct UniformArena final {
    static constexpr size_t record_alignment = 256;
    static constexpr size_t stride = aligned_size(sizeof(T), record_alignment);

    struct Allocation final {
        uint32_t index;
        // Byte offset from the start of the whole arena.
        size_t offset;
    };

    UniformArena(uint32_t slot_count, uint32_t max_draws_per_frame)
        : max_draws_per_frame_(max_draws_per_frame)
        , blocks_(static_cast<size_t>(slot_count) * max_draws_per_frame)
        , counts_(slot_count, 0)
    {}

    auto slot_count() const -> uint32_t { return static_cast<uint32_t>(counts_.size()); }
    auto capacity() const -> uint32_t { return max_draws_per_frame_; }

    // Forgets the records of `slot`, called when a frame starts writing it.
    auto reset(uint32_t slot) -> void { counts_.at(slot) = 0; }

    auto allocate(uint32_t slot, T const& value) -> Expected<Allocation, CapacityError> {
        auto& count = counts_.at(slot);
        if (count >= max_draws_per_frame_) {
            return CapacityError{
                .kind = CapacityKind::draws,
                .requested = static_cast<size_t>(count) + 1,
                .capacity = max_draws_per_frame_,
            };
        }
        auto block_index = block_of(slot, count);
        std::memcpy(blocks_[block_index].data, &value, sizeof(T));
        Allocation allocation{.index = count, .offset = block_index * stride};
        ++count;
        return allocation;
    }

    auto count(uint32_t slot) const -> uint32_t { return counts_.at(slot); }

    auto record(uint32_t slot, uint32_t index) const -> T {
        if (index >= counts_.at(slot)) {
            throw FrameRingError{fmt::format("draw {} was not allocated in slot {}", index, slot)};
        }
        T value;
        std::memcpy(&value, blocks_[block_of(slot, index)].data, sizeof(T));
        return value;
    }

    auto bytes() const -> Span<std::byte const> {
        return Span<std::byte const>{reinterpret_cast<std::byte const*>(blocks_.data()), blocks_.size() * stride};
    }
    auto slot_bytes(uint32_t slot) const -> Span<std::byte const> {
        return bytes().subspan(block_of(slot, 0) * stride, static_cast<size_t>(counts_.at(slot)) * stride);
    }

private:
    struct alignas(record_alignment) Block final {
        std::byte data[stride];
    };
    static_assert(sizeof(Block) == stride);

    auto block_of(uint32_t slot, uint32_t index) const -> size_t {
        return static_cast<size_t>(slot) * max_draws_per_frame_ + index;
    }

    uint32_t max_draws_per_frame_;
    std::vector<Block> blocks_;
    std::vector<uint32_t> counts_;
};

}
