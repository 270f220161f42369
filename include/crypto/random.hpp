#pragma once

#include <cstdint>
#include <sodium.h>
#include <stdexcept>

namespace es::crypto {

// ---------- Small helper: sodium init (thread-safe, idempotent)
inline void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

// Uniform integer in [0, upper_bound). Returns 0 when upper_bound is 0.
inline uint32_t uniform_below(const uint32_t upper_bound) {
    if (upper_bound == 0) return 0;
    ensure_sodium_init();
    return randombytes_uniform(upper_bound);
}

}
