#include "ring_buffer.hpp"

#include <algorithm>

namespace pitchscope {

RingBuffer::RingBuffer(size_t capacity)
    : buffer_(capacity, 0.0f) {}

void RingBuffer::push(const float* samples, size_t count) {
    if (!samples || count == 0 || buffer_.empty()) return;
    const size_t cap = buffer_.size();
    if (count > cap) {
        samples += count - cap;
        count = cap;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // At most two contiguous copies: up to the end, then wrap to the front
    const size_t first = std::min(count, cap - write_index_);
    std::copy(samples, samples + first, buffer_.begin() + write_index_);
    std::copy(samples + first, samples + count, buffer_.begin());
    write_index_ = (write_index_ + count) % cap;
    filled_ = std::min(cap, filled_ + count);
}

void RingBuffer::copy_latest_locked(size_t count, float* out) const {
    const size_t cap = buffer_.size();
    const size_t start = (write_index_ + cap - count) % cap;
    const size_t first = std::min(count, cap - start);
    std::copy(buffer_.begin() + start, buffer_.begin() + start + first, out);
    std::copy(buffer_.begin(), buffer_.begin() + (count - first), out + first);
}

std::vector<float> RingBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<float> out(filled_);
    if (filled_ > 0) copy_latest_locked(filled_, out.data());
    return out;
}

std::vector<float> RingBuffer::snapshot_latest(size_t count) const {
    count = std::min(count, buffer_.size());
    std::vector<float> out(count, 0.0f);
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t available = std::min(count, filled_);
    if (available > 0) copy_latest_locked(available, out.data() + (count - available));
    return out;
}

size_t RingBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filled_;
}

void RingBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    write_index_ = 0;
    filled_ = 0;
}

} // namespace pitchscope
