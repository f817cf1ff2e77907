#include <catch2/catch.hpp>

#include "block_queue.hpp"

#include <chrono>
#include <thread>
#include <vector>

using namespace pitchscope;

static std::vector<float> block_of(float value, size_t n) {
    return std::vector<float>(n, value);
}

TEST_CASE("Blocks come out in arrival order", "[block_queue]") {
    BlockQueue q(4, 8);
    CHECK(q.capacity() == 4);
    CHECK(q.block_size() == 8);

    for (int i = 0; i < 3; ++i) {
        auto b = block_of(static_cast<float>(i), 8);
        CHECK(q.push(b.data(), b.size(), static_cast<uint64_t>(i)));
    }
    CHECK(q.size() == 3);

    AudioBlock out;
    out.samples.assign(8, 0.0f);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(q.try_pop(out));
        CHECK(out.sequence == static_cast<uint64_t>(i));
        CHECK(out.samples.size() == 8);
        CHECK(out.samples[0] == static_cast<float>(i));
    }
    CHECK_FALSE(q.try_pop(out));
    CHECK(q.dropped() == 0);
}

TEST_CASE("A full queue drops its oldest block", "[block_queue]") {
    BlockQueue q(3, 4);
    int accepted = 0;
    for (uint64_t seq = 0; seq < 5; ++seq) {
        auto b = block_of(static_cast<float>(seq), 4);
        if (q.push(b.data(), b.size(), seq)) ++accepted;
    }
    CHECK(accepted == 3);
    CHECK(q.dropped() == 2);
    CHECK(q.size() == 3);

    AudioBlock out;
    out.samples.assign(4, 0.0f);
    for (uint64_t expected = 2; expected < 5; ++expected) {
        REQUIRE(q.try_pop(out));
        CHECK(out.sequence == expected);
        CHECK(out.samples[3] == static_cast<float>(expected));
    }
}

TEST_CASE("Close wakes a waiting consumer", "[block_queue]") {
    BlockQueue q(2, 4);
    bool result = true;
    std::thread consumer([&] {
        AudioBlock out;
        out.samples.assign(4, 0.0f);
        result = q.pop_wait(out);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    q.close();
    consumer.join();
    CHECK_FALSE(result);

    q.reset();
    auto b = block_of(1.0f, 4);
    CHECK(q.push(b.data(), b.size(), 7));
    AudioBlock out;
    REQUIRE(q.pop_wait(out));
    CHECK(out.sequence == 7);
    CHECK(q.dropped() == 0);
}

TEST_CASE("Producer and consumer threads lose nothing below capacity", "[block_queue]") {
    BlockQueue q(8, 16);
    const uint64_t total = 500;
    std::vector<uint64_t> seen;

    std::thread consumer([&] {
        AudioBlock out;
        out.samples.assign(16, 0.0f);
        while (q.pop_wait(out)) {
            seen.push_back(out.sequence);
            if (out.sequence + 1 == total) break;
        }
    });

    auto b = block_of(0.0f, 16);
    for (uint64_t seq = 0; seq < total; ++seq) {
        while (q.size() == q.capacity()) std::this_thread::yield();
        q.push(b.data(), b.size(), seq);
    }
    consumer.join();

    REQUIRE(seen.size() == total);
    for (uint64_t i = 0; i < total; ++i) CHECK(seen[i] == i);
    CHECK(q.dropped() == 0);
}
