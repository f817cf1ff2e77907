#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

namespace pitchscope {

// Fixed-capacity circular store of the most recent audio samples.
// One writer (pipeline worker) and any number of readers (display).
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity);

    // Append samples, overwriting the oldest. Only the trailing `capacity`
    // samples of an oversized push are kept.
    void push(const float* samples, size_t count);
    void push(const std::vector<float>& samples) { push(samples.data(), samples.size()); }

    // Chronological copy of the current contents (size() samples)
    std::vector<float> snapshot() const;

    // Most recent `count` samples, zero-padded at the front while filling.
    // `count` is limited to capacity().
    std::vector<float> snapshot_latest(size_t count) const;

    size_t size() const;
    size_t capacity() const { return buffer_.size(); }
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<float> buffer_;
    size_t write_index_ = 0;
    size_t filled_ = 0;

    void copy_latest_locked(size_t count, float* out) const;
};

} // namespace pitchscope
