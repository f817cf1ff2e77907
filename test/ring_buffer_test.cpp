#include <catch2/catch.hpp>

#include "ring_buffer.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace pitchscope;

TEST_CASE("Ring buffer fills then keeps the most recent samples", "[ring_buffer]") {
    RingBuffer rb(4);
    CHECK(rb.capacity() == 4);
    CHECK(rb.size() == 0);
    CHECK(rb.snapshot().empty());

    rb.push(std::vector<float>{1, 2, 3});
    CHECK(rb.size() == 3);
    CHECK(rb.snapshot() == std::vector<float>{1, 2, 3});

    rb.push(std::vector<float>{4, 5});
    CHECK(rb.size() == 4);
    CHECK(rb.snapshot() == std::vector<float>{2, 3, 4, 5});

    rb.push(std::vector<float>{6});
    CHECK(rb.snapshot() == std::vector<float>{3, 4, 5, 6});
}

TEST_CASE("Oversized pushes keep only the tail", "[ring_buffer]") {
    RingBuffer rb(3);
    rb.push(std::vector<float>{1});
    rb.push(std::vector<float>{10, 11, 12, 13, 14, 15, 16});
    CHECK(rb.size() == 3);
    CHECK(rb.snapshot() == std::vector<float>{14, 15, 16});
}

TEST_CASE("Latest-N snapshot pads with zeros while filling", "[ring_buffer]") {
    RingBuffer rb(5);
    rb.push(std::vector<float>{1, 2});
    CHECK(rb.snapshot_latest(4) == std::vector<float>{0, 0, 1, 2});

    rb.push(std::vector<float>{3, 4, 5, 6});
    CHECK(rb.snapshot_latest(3) == std::vector<float>{4, 5, 6});
    // Requests beyond capacity are capped
    CHECK(rb.snapshot_latest(100) == std::vector<float>{2, 3, 4, 5, 6});
    CHECK(rb.snapshot_latest(0).empty());
}

TEST_CASE("Clear empties the buffer", "[ring_buffer]") {
    RingBuffer rb(3);
    rb.push(std::vector<float>{1, 2, 3});
    rb.clear();
    CHECK(rb.size() == 0);
    CHECK(rb.snapshot_latest(2) == std::vector<float>{0, 0});
}

TEST_CASE("Readers never see a torn block", "[ring_buffer]") {
    // Each push writes a block of one repeated value; a snapshot of one block
    // must hold a single value.
    const size_t block = 64;
    RingBuffer rb(block);
    std::atomic<bool> done(false);

    std::thread writer([&] {
        std::vector<float> data(block);
        for (int v = 1; v <= 2000; ++v) {
            std::fill(data.begin(), data.end(), static_cast<float>(v));
            rb.push(data);
        }
        done = true;
    });

    bool consistent = true;
    while (!done.load()) {
        auto snap = rb.snapshot();
        if (snap.size() == block) {
            for (float x : snap) {
                if (x != snap.front()) { consistent = false; break; }
            }
        }
    }
    writer.join();
    CHECK(consistent);
    CHECK(rb.snapshot().front() == 2000.0f);
}
