#pragma once

#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

#include "frame_types.hpp"

namespace camingest {

// Fixed-capacity ring of the most recent frames. put() overwrites the oldest
// entry once full. Entries are shared immutable frames, so the lock only
// guards pointer copies and readers never see a partially written frame.
class FrameBuffer {
public:
    explicit FrameBuffer(size_t capacity = 10)
        : capacity_(capacity == 0 ? 1 : capacity), slots_(capacity_) {}

    void put(FramePtr frame) {
        std::lock_guard<std::mutex> lock(mu_);
        slots_[head_] = std::move(frame);
        head_ = (head_ + 1) % capacity_;
        if (size_ < capacity_) ++size_;
    }

    // Most recently put frame, or nullptr if nothing was ever put.
    FramePtr get_latest() const {
        std::lock_guard<std::mutex> lock(mu_);
        if (size_ == 0) return nullptr;
        return slots_[(head_ + capacity_ - 1) % capacity_];
    }

    // Oldest to newest.
    std::vector<FramePtr> get_all() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<FramePtr> out;
        out.reserve(size_);
        const size_t start = (head_ + capacity_ - size_) % capacity_;
        for (size_t i = 0; i < size_; ++i) {
            out.push_back(slots_[(start + i) % capacity_]);
        }
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return size_;
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::vector<FramePtr> slots_;
    size_t head_{0};
    size_t size_{0};
    mutable std::mutex mu_;
};

}  // namespace camingest
