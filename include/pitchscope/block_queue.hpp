#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace pitchscope {

struct AudioBlock {
    std::vector<float> samples;
    uint64_t sequence = 0;
};

// Bounded single-producer/single-consumer queue of fixed-size audio blocks.
// Slots are preallocated; the consumer swaps buffers out instead of copying,
// so steady-state pushes never allocate. A push into a full queue discards
// the oldest queued block instead of waiting.
class BlockQueue {
public:
    BlockQueue(size_t capacity, size_t block_size);

    // Producer side. Returns false if the oldest block had to be dropped.
    bool push(const float* samples, size_t count, uint64_t sequence);

    // Consumer side. Waits for a block; returns false once closed.
    // `out.samples` should already hold block_size() floats to avoid allocation.
    bool pop_wait(AudioBlock& out);
    bool try_pop(AudioBlock& out);

    // Wake the consumer and refuse further pops. Queued blocks are discarded.
    void close();
    void reset();

    size_t size() const;
    size_t capacity() const { return slots_.size(); }
    size_t block_size() const { return block_size_; }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<AudioBlock> slots_;
    size_t block_size_;
    size_t head_ = 0;
    size_t count_ = 0;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};

    void pop_locked(AudioBlock& out);
};

} // namespace pitchscope
