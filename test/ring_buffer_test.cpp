#include <catch2/catch.hpp>

#include <thread>

#include "pitchtrack/ring_buffer.hpp"

using pitchtrack::RingBuffer;

TEST_CASE("fifo order and capacity", "[ring_buffer]") {
    RingBuffer<int> rb(4);
    CHECK(rb.capacity() == 4);
    CHECK(rb.empty());

    for (int i = 0; i < 4; ++i) CHECK(rb.push(i));
    CHECK_FALSE(rb.push(99));

    int v = -1;
    for (int i = 0; i < 4; ++i) {
        REQUIRE(rb.pop(v));
        CHECK(v == i);
    }
    CHECK_FALSE(rb.pop(v));
    CHECK(rb.empty());
}

TEST_CASE("indices wrap around", "[ring_buffer]") {
    RingBuffer<int> rb(3);
    int v = 0;
    for (int round = 0; round < 10; ++round) {
        REQUIRE(rb.push(round));
        REQUIRE(rb.push(round + 100));
        REQUIRE(rb.pop(v));
        CHECK(v == round);
        REQUIRE(rb.pop(v));
        CHECK(v == round + 100);
    }
}

TEST_CASE("one producer and one consumer see every item in order", "[ring_buffer]") {
    constexpr int kItems = 100000;
    RingBuffer<int> rb(64);

    std::thread producer([&] {
        for (int i = 0; i < kItems; ++i) {
            while (!rb.push(i)) std::this_thread::yield();
        }
    });

    int expected = 0;
    bool ordered = true;
    while (expected < kItems) {
        int v;
        if (rb.pop(v)) {
            ordered = ordered && v == expected;
            ++expected;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    CHECK(ordered);
    CHECK(rb.empty());
}
