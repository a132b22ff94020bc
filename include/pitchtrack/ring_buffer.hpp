#pragma once

#include <atomic>
#include <cstddef>
#include <vector>

namespace pitchtrack {

// Lock-free single-producer/single-consumer queue. Storage is allocated once;
// push() and pop() never allocate. One slot is kept free to tell full from empty.
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : buffer_(capacity + 1), write_index_(0), read_index_(0) {}

    bool push(const T& item) {
        const std::size_t write_idx = write_index_.load(std::memory_order_relaxed);
        const std::size_t next_idx = (write_idx + 1) % buffer_.size();

        if (next_idx == read_index_.load(std::memory_order_acquire)) {
            return false;  // full
        }

        buffer_[write_idx] = item;
        write_index_.store(next_idx, std::memory_order_release);
        return true;
    }

    bool pop(T& item) {
        const std::size_t read_idx = read_index_.load(std::memory_order_relaxed);

        if (read_idx == write_index_.load(std::memory_order_acquire)) {
            return false;  // empty
        }

        item = buffer_[read_idx];
        read_index_.store((read_idx + 1) % buffer_.size(), std::memory_order_release);
        return true;
    }

    bool empty() const {
        return read_index_.load(std::memory_order_acquire) ==
               write_index_.load(std::memory_order_acquire);
    }

    std::size_t capacity() const { return buffer_.size() - 1; }

private:
    std::vector<T> buffer_;
    std::atomic<std::size_t> write_index_;
    std::atomic<std::size_t> read_index_;
};

} // namespace pitchtrack
