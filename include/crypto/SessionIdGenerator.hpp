#pragma once

#include "crypto/SessionId.hpp"
#include "util/clock.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sessid::crypto {

// Similar goal to UUIDv7 with two changes: the timestamp is bucketed to whole hours so
// an observer cannot recover the issuance time within the hour, and the random part is
// 32 bytes instead of 122 bits. A 16-bit rollover counter is appended so sequential
// issuance within one generator is visible when scanning logs (..., FFFE, FFFF, 0000, ...).
// The counter is a debugging aid only; uniqueness rests on the random bytes.
//
// Output is opaque: session cookie values, magic link query parameters, JWT jti/nonce.
// Thread-safe.
class SessionIdGenerator {
public:
    using RandomSource = std::function<void(uint8_t* out, size_t len)>;

    // System clock and libsodium CSPRNG. Throws if libsodium cannot be initialized.
    SessionIdGenerator();

    SessionIdGenerator(sessid::util::TimeSource clock, RandomSource random);

    ~SessionIdGenerator() = default;

    // Not copyable or movable (contains atomic counter)
    SessionIdGenerator(const SessionIdGenerator&) = delete;
    SessionIdGenerator& operator=(const SessionIdGenerator&) = delete;
    SessionIdGenerator(SessionIdGenerator&&) = delete;
    SessionIdGenerator& operator=(SessionIdGenerator&&) = delete;

    // Process-wide production generator, one counter for the life of the process.
    static SessionIdGenerator& instance();

    // 56 URL-safe base64 characters, no padding.
    [[nodiscard]] std::string generate();

    // timestamp bucket (8) | random (32) | rollover counter (2), all big-endian.
    [[nodiscard]] SessionId generateBytes();

    [[nodiscard]] std::vector<std::string> generateBatch(size_t n);

private:
    sessid::util::TimeSource clock_;
    RandomSource random_;
    std::atomic<int32_t> counter_{1};
    bool logIssuance_ = false;
};

}
