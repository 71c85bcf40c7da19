#pragma once

#include <sodium.h>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace sessid::crypto::util {

// ---------- sodium init (thread-safe, idempotent)
// After a successful init randombytes_buf() is safe to call from any thread.
inline void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

// ---------- Production entropy: libsodium's CSPRNG (getrandom(2) / urandom backed)
inline void secure_random_fill(uint8_t* out, const size_t len) {
    ensure_sodium_init();
    randombytes_buf(out, len);
}

}
