#include <doctest/doctest.h>

#include "pushwire/backoff.hpp"

using namespace pushwire;

TEST_CASE("Backoff delays never decrease and settle at the cap") {
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        Backoff b(1000, 300000, 0.2, seed);
        uint32_t prev = 0;
        for (int i = 0; i < 30; ++i) {
            const uint32_t d = b.next_delay_ms();
            CHECK(d >= prev);
            CHECK(d >= 1000);
            CHECK(d <= 300000);
            prev = d;
        }
        CHECK(prev == 300000);
    }
}

TEST_CASE("Backoff without jitter doubles from the minimum") {
    Backoff b(500, 10000, 0.0, 7);
    CHECK(b.next_delay_ms() == 500);
    CHECK(b.next_delay_ms() == 1000);
    CHECK(b.next_delay_ms() == 2000);
    CHECK(b.next_delay_ms() == 4000);
    CHECK(b.next_delay_ms() == 8000);
    CHECK(b.next_delay_ms() == 10000);
    CHECK(b.next_delay_ms() == 10000);
    CHECK(b.attempts() == 7);
}

TEST_CASE("reset() returns to the minimum range") {
    Backoff b(1000, 60000, 0.2, 42);
    for (int i = 0; i < 8; ++i) b.next_delay_ms();
    b.reset();
    CHECK(b.attempts() == 0);
    const uint32_t d = b.next_delay_ms();
    CHECK(d >= 1000);
    CHECK(d <= 1200);
}

TEST_CASE("Jitter of 1 or more is clamped so order still holds") {
    Backoff b(100, 100000, 5.0, 3);
    uint32_t prev = 0;
    for (int i = 0; i < 20; ++i) {
        const uint32_t d = b.next_delay_ms();
        CHECK(d >= prev);
        prev = d;
    }
}
