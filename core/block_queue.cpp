#include "block_queue.hpp"

#include <algorithm>

namespace pitchscope {

BlockQueue::BlockQueue(size_t capacity, size_t block_size)
    : slots_(std::max<size_t>(1, capacity)), block_size_(block_size) {
    for (auto& slot : slots_) slot.samples.assign(block_size_, 0.0f);
}

bool BlockQueue::push(const float* samples, size_t count, uint64_t sequence) {
    if (!samples) return true;
    bool kept_all = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return true;
        const size_t cap = slots_.size();
        if (count_ == cap) {
            head_ = (head_ + 1) % cap;
            --count_;
            dropped_.fetch_add(1, std::memory_order_relaxed);
            kept_all = false;
        }
        AudioBlock& slot = slots_[(head_ + count_) % cap];
        if (slot.samples.size() != count) slot.samples.resize(count);
        std::copy(samples, samples + count, slot.samples.begin());
        slot.sequence = sequence;
        ++count_;
    }
    cv_.notify_one();
    return kept_all;
}

void BlockQueue::pop_locked(AudioBlock& out) {
    AudioBlock& slot = slots_[head_];
    out.samples.swap(slot.samples);
    out.sequence = slot.sequence;
    // The slot now owns the consumer's previous buffer; size it once for the producer
    if (slot.samples.size() != block_size_) slot.samples.resize(block_size_);
    head_ = (head_ + 1) % slots_.size();
    --count_;
}

bool BlockQueue::pop_wait(AudioBlock& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || count_ > 0; });
    if (closed_) return false;
    pop_locked(out);
    return true;
}

bool BlockQueue::try_pop(AudioBlock& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || count_ == 0) return false;
    pop_locked(out);
    return true;
}

void BlockQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        head_ = 0;
        count_ = 0;
    }
    cv_.notify_all();
}

void BlockQueue::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
    head_ = 0;
    count_ = 0;
    dropped_.store(0, std::memory_order_relaxed);
}

size_t BlockQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

} // namespace pitchscope
