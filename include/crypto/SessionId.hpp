#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace sessid::crypto {

// Bytes (42): timestamp bucket (8), random (32), rollover counter (2)
// String (56): 42 bytes * 4 / 3 => 56 base64-url characters
struct SessionIdLayout {
    static constexpr size_t TIMESTAMP_OFFSET = 0;
    static constexpr size_t TIMESTAMP_SIZE   = 8;
    static constexpr size_t RANDOM_OFFSET    = TIMESTAMP_OFFSET + TIMESTAMP_SIZE;
    static constexpr size_t RANDOM_SIZE      = 32;     // NIST minimum randomness to be considered unique
    static constexpr size_t COUNTER_OFFSET   = RANDOM_OFFSET + RANDOM_SIZE;
    static constexpr size_t COUNTER_SIZE     = 2;
    static constexpr size_t TOTAL_SIZE       = COUNTER_OFFSET + COUNTER_SIZE;
    static constexpr size_t ENCODED_SIZE     = TOTAL_SIZE / 3 * 4;

    static constexpr std::chrono::seconds TIMESTAMP_GRANULARITY{3600};
};

static_assert(SessionIdLayout::TOTAL_SIZE == 42);
static_assert(SessionIdLayout::TOTAL_SIZE % 3 == 0, "encoded form must not need padding");
static_assert(SessionIdLayout::ENCODED_SIZE == 56);

using SessionId = std::array<uint8_t, SessionIdLayout::TOTAL_SIZE>;

}
