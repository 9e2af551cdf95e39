#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "../prelude/expected.hpp"

namespace sl::rt {

enum class RingError : uint8_t {
    // The accelerator has not signaled completion of the frame that last used the slot.
    slot_in_flight,
    // The previous frame was neither submitted nor dropped.
    frame_open,
};

struct FrameRingError final : std::exception {
    FrameRingError() noexcept = default;
    FrameRingError(std::string const& str) noexcept : error_(str) {}
    FrameRingError(std::string&& str) noexcept : error_(std::move(str)) {}

    auto what() const noexcept -> char const* override { return error_.c_str(); }

private:
    std::string error_;
};

enum class SlotState : uint8_t {
    free,
    writing,
    submitted,
};

// Per-frame buffer sets shared between a CPU producer and an accelerator. A slot may be
// written only between `begin_frame()` and `submit()`, and becomes writable again once the
// accelerator signals completion of the frame that used it.
template <typename T>
struct FrameRing final {
    struct Frame final {
        uint64_t index;
        uint32_t slot;
        // Unique per `begin_frame()`, a dropped frame index is handed out again under a new serial.
        uint64_t serial;
    };

    FrameRing(uint32_t slot_count, uint32_t max_frames_in_flight)
        : max_frames_in_flight_(max_frames_in_flight)
        , data_(slot_count)
        , slots_(slot_count, Slot{SlotState::free, 0, 0})
    {
        if (max_frames_in_flight == 0 || slot_count <= max_frames_in_flight) {
            throw FrameRingError{fmt::format(
                "ring of {} slots cannot serve {} frames in flight, it needs at least one more slot",
                slot_count, max_frames_in_flight
            )};
        }
    }

    auto slot_count() const -> uint32_t { return static_cast<uint32_t>(slots_.size()); }
    auto max_frames_in_flight() const -> uint32_t { return max_frames_in_flight_; }

    auto begin_frame() -> Expected<Frame, RingError> {
        std::lock_guard lock{mutex_};
        return try_begin_frame();
    }

    // Blocks until a slot is released or `timeout` expires.
    auto wait_and_begin_frame(std::chrono::milliseconds timeout) -> Expected<Frame, RingError> {
        std::unique_lock lock{mutex_};
        auto result = try_begin_frame();
        if (!result && result.error() == RingError::slot_in_flight) {
            completed_cv_.wait_for(lock, timeout, [this] { return slot_available(); });
            return try_begin_frame();
        }
        return result;
    }

    auto data(Frame const& frame) -> T& {
        std::lock_guard lock{mutex_};
        auto const& slot = checked_slot(frame);
        if (slot.state != SlotState::writing) {
            throw FrameRingError{fmt::format(
                "frame {} was handed to the accelerator, slot {} cannot be written until it completes",
                frame.index, frame.slot
            )};
        }
        return data_[frame.slot];
    }

    // Read access for the consumer side, valid while the frame is submitted.
    auto submitted_data(Frame const& frame) const -> T const& {
        std::lock_guard lock{mutex_};
        auto const& slot = checked_slot(frame);
        if (slot.state != SlotState::submitted) {
            throw FrameRingError{fmt::format("frame {} is not submitted", frame.index)};
        }
        return data_[frame.slot];
    }

    auto submit(Frame const& frame) -> void {
        std::lock_guard lock{mutex_};
        auto& slot = checked_slot(frame);
        if (slot.state != SlotState::writing) {
            throw FrameRingError{fmt::format("frame {} is not being written and cannot be submitted", frame.index)};
        }
        slot.state = SlotState::submitted;
        open_frame_ = false;
        ++next_frame_;
    }

    // Completion of `frame_index` implies completion of every earlier frame.
    auto complete(uint64_t frame_index) -> void {
        {
            std::lock_guard lock{mutex_};
            if (has_completed_ && frame_index <= completed_frame_) { return; }
            has_completed_ = true;
            completed_frame_ = frame_index;
            for (auto& slot : slots_) {
                if (slot.state == SlotState::submitted && slot.frame <= completed_frame_) {
                    slot.state = SlotState::free;
                }
            }
        }
        completed_cv_.notify_all();
    }

    // Abandons the frame being written, its slot is reused by the next `begin_frame()`.
    auto drop(Frame const& frame) -> void {
        std::lock_guard lock{mutex_};
        auto& slot = checked_slot(frame);
        if (slot.state != SlotState::writing) {
            throw FrameRingError{fmt::format("frame {} is not being written and cannot be dropped", frame.index)};
        }
        slot.state = SlotState::free;
        slot.serial = 0;
        open_frame_ = false;
    }

    auto state(uint32_t slot) const -> SlotState {
        std::lock_guard lock{mutex_};
        return slots_.at(slot).state;
    }

    auto frames_in_flight() const -> uint32_t {
        std::lock_guard lock{mutex_};
        return count_in_flight();
    }

private:
    struct Slot final {
        SlotState state;
        uint64_t frame;
        uint64_t serial;
    };

    auto count_in_flight() const -> uint32_t {
        uint32_t count = 0;
        for (auto const& slot : slots_) {
            if (slot.state == SlotState::submitted) { ++count; }
        }
        return count;
    }

    auto slot_available() const -> bool {
        auto const& slot = slots_[next_frame_ % slots_.size()];
        return slot.state == SlotState::free && count_in_flight() < max_frames_in_flight_;
    }

    auto try_begin_frame() -> Expected<Frame, RingError> {
        if (open_frame_) {
            return RingError::frame_open;
        }
        if (!slot_available()) {
            return RingError::slot_in_flight;
        }
        Frame frame{
            .index = next_frame_,
            .slot = static_cast<uint32_t>(next_frame_ % slots_.size()),
            .serial = ++next_serial_,
        };
        slots_[frame.slot] = Slot{.state = SlotState::writing, .frame = frame.index, .serial = frame.serial};
        open_frame_ = true;
        return frame;
    }

    auto checked_slot(Frame const& frame) const -> Slot const& {
        if (
            frame.slot >= slots_.size()
            || slots_[frame.slot].frame != frame.index
            || slots_[frame.slot].serial != frame.serial
        ) {
            throw FrameRingError{fmt::format("frame {} no longer owns slot {}", frame.index, frame.slot)};
        }
        return slots_[frame.slot];
    }
    auto checked_slot(Frame const& frame) -> Slot& {
        return const_cast<Slot&>(static_cast<FrameRing const*>(this)->checked_slot(frame));
    }

    uint32_t max_frames_in_flight_;
    std::vector<T> data_;
    std::vector<Slot> slots_;
    uint64_t next_frame_ = 0;
    uint64_t next_serial_ = 0;
    uint64_t completed_frame_ = 0;
    bool has_completed_ = false;
    bool open_frame_ = false;
    mutable std::mutex mutex_;
    std::condition_variable completed_cv_;
};

}
