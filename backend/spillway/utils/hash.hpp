#pragma once

#include <cstdint>

// finalizer that spreads the entropy of small integer keys over all 64 bits
inline uint64_t scrambleHash(uint64_t x) {
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdull;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ull;
    x ^= x >> 33;
    return x;
}

inline uint64_t combineHashes(uint64_t seed, uint64_t hash) {
    return seed ^ (hash + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}
