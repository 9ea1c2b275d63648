// Tessera Rendering Core
// retirement_queue.hpp - Deferred release of GPU resources still referenced by frames in flight

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace tessera::rendering {

// Fixed-capacity FIFO of replaced resources. Frame numbers only grow, so the
// oldest entry is always at the head and release is a prefix pop.
template <typename T, size_t Capacity>
class RetirementQueue {
public:
    static_assert(Capacity > 0, "RetirementQueue needs at least one slot");

    [[nodiscard]] static constexpr size_t capacity() { return Capacity; }
    [[nodiscard]] size_t size() const { return count_; }
    [[nodiscard]] bool empty() const { return count_ == 0; }
    [[nodiscard]] bool full() const { return count_ == Capacity; }

    // Takes ownership; returns false (and leaves resource untouched) when full
    bool retire(std::unique_ptr<T>& resource, uint64_t frame) {
        if (!resource) {
            return true;
        }
        if (full()) {
            return false;
        }
        Entry& entry = entries_[(head_ + count_) % Capacity];
        entry.resource = std::move(resource);
        entry.retired_frame = frame;
        ++count_;
        return true;
    }

    // Release every entry retired at least frames_in_flight frames before current_frame
    size_t collect(uint64_t current_frame, uint32_t frames_in_flight) {
        size_t released = 0;
        while (count_ > 0) {
            Entry& entry = entries_[head_];
            if (entry.retired_frame + frames_in_flight > current_frame) {
                break;
            }
            pop_front();
            ++released;
        }
        return released;
    }

    // Caller guarantees the device is idle
    size_t release_all() {
        size_t released = count_;
        while (count_ > 0) {
            pop_front();
        }
        return released;
    }

    [[nodiscard]] uint64_t oldest_frame() const { return count_ > 0 ? entries_[head_].retired_frame : 0; }

private:
    struct Entry {
        std::unique_ptr<T> resource;
        uint64_t retired_frame = 0;
    };

    void pop_front() {
        entries_[head_].resource.reset();
        head_ = (head_ + 1) % Capacity;
        --count_;
    }

    std::array<Entry, Capacity> entries_{};
    size_t head_ = 0;
    size_t count_ = 0;
};

}  // namespace tessera::rendering
